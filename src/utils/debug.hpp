/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_DEBUG_HPP_INCLUDED__
#define __ZSOCK_DEBUG_HPP_INCLUDED__

#include <cstdio>

//  Unified debug macros for zsock components
//  Enable with -DZSOCK_DEBUG=1 during compilation
//
//  Usage:
//    ZSOCK_DBG_ENGINE ("read completed: %zu bytes", bytes);
//    ZSOCK_DBG_CONN ("connecting to %s", endpoint);

#if defined ZSOCK_DEBUG && ZSOCK_DEBUG

#define ZSOCK_DBG(category, fmt, ...)                                          \
    do {                                                                       \
        fprintf (stderr, "[ZSOCK:" category "] " fmt "\n", ##__VA_ARGS__);     \
    } while (0)

#define ZSOCK_DBG_THIS(category, fmt, ...)                                     \
    do {                                                                       \
        fprintf (stderr, "[ZSOCK:" category ":%p] " fmt "\n",                  \
                 static_cast<const void *> (this), ##__VA_ARGS__);             \
    } while (0)

#else

#define ZSOCK_DBG(category, fmt, ...) ((void) 0)
#define ZSOCK_DBG_THIS(category, fmt, ...) ((void) 0)

#endif

//  Component-specific macros
#define ZSOCK_DBG_SOCKET(fmt, ...) ZSOCK_DBG_THIS ("SOCKET", fmt, ##__VA_ARGS__)
#define ZSOCK_DBG_ENGINE(fmt, ...) ZSOCK_DBG_THIS ("ENGINE", fmt, ##__VA_ARGS__)
#define ZSOCK_DBG_CONN(fmt, ...) ZSOCK_DBG_THIS ("CONN", fmt, ##__VA_ARGS__)
#define ZSOCK_DBG_LISTENER(fmt, ...)                                           \
    ZSOCK_DBG_THIS ("LISTENER", fmt, ##__VA_ARGS__)

//  Severity-based macros (with this pointer)
#define ZSOCK_LOG_ERROR(fmt, ...) ZSOCK_DBG_THIS ("ERROR", fmt, ##__VA_ARGS__)
#define ZSOCK_LOG_WARN(fmt, ...) ZSOCK_DBG_THIS ("WARN", fmt, ##__VA_ARGS__)

#endif
