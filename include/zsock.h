/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_H_INCLUDED__
#define __ZSOCK_H_INCLUDED__

/*  Version macros for compile-time API version detection                     */
#define ZSOCK_VERSION_MAJOR 0
#define ZSOCK_VERSION_MINOR 3
#define ZSOCK_VERSION_PATCH 0

#define ZSOCK_MAKE_VERSION(major, minor, patch)                                \
    ((major) *10000 + (minor) *100 + (patch))
#define ZSOCK_VERSION                                                          \
    ZSOCK_MAKE_VERSION (ZSOCK_VERSION_MAJOR, ZSOCK_VERSION_MINOR,              \
                        ZSOCK_VERSION_PATCH)

#ifdef __cplusplus
extern "C" {
#endif

#include <errno.h>
#include <stddef.h>
#include <stdint.h>

/*  Handle DSO symbol visibility                                             */
#if defined ZSOCK_NO_EXPORT
#define ZSOCK_EXPORT
#else
#if (defined __GNUC__ && __GNUC__ >= 4) || defined __INTEL_COMPILER
#define ZSOCK_EXPORT __attribute__ ((visibility ("default")))
#else
#define ZSOCK_EXPORT
#endif
#endif

/******************************************************************************/
/*  zsock errors.                                                             */
/******************************************************************************/

/*  A number random enough not to collide with different errno ranges on     */
/*  different OSes. The assumption is that error_t is at least 32-bit type.  */
#define ZSOCK_HAUSNUMERO 156384712

#ifndef ENOTSUP
#define ENOTSUP (ZSOCK_HAUSNUMERO + 1)
#endif
#ifndef EPROTONOSUPPORT
#define EPROTONOSUPPORT (ZSOCK_HAUSNUMERO + 2)
#endif
#ifndef EADDRINUSE
#define EADDRINUSE (ZSOCK_HAUSNUMERO + 5)
#endif
#ifndef ECONNREFUSED
#define ECONNREFUSED (ZSOCK_HAUSNUMERO + 7)
#endif
#ifndef ENOTSOCK
#define ENOTSOCK (ZSOCK_HAUSNUMERO + 9)
#endif
#ifndef EMSGSIZE
#define EMSGSIZE (ZSOCK_HAUSNUMERO + 10)
#endif
#ifndef ECONNRESET
#define ECONNRESET (ZSOCK_HAUSNUMERO + 14)
#endif
#ifndef ENOTCONN
#define ENOTCONN (ZSOCK_HAUSNUMERO + 15)
#endif
#ifndef ETIMEDOUT
#define ETIMEDOUT (ZSOCK_HAUSNUMERO + 16)
#endif

/*  Native zsock error codes.                                                */
#define ETERM (ZSOCK_HAUSNUMERO + 53)
#define ENOCOMPATPROTO (ZSOCK_HAUSNUMERO + 52)
#define EROLE (ZSOCK_HAUSNUMERO + 60)

/*  This function retrieves the errno as it is known to the library.         */
ZSOCK_EXPORT int zsock_errno (void);

/*  Resolves system errors and zsock-specific errors to human-readable       */
/*  string.                                                                  */
ZSOCK_EXPORT const char *zsock_strerror (int errnum_);

/*  Run-time API version detection                                           */
ZSOCK_EXPORT void zsock_version (int *major_, int *minor_, int *patch_);

/******************************************************************************/
/*  zsock message definition.                                                 */
/******************************************************************************/

typedef struct zsock_msg_t
{
#if defined(__GNUC__) || defined(__INTEL_COMPILER)
    unsigned char _[64] __attribute__ ((aligned (sizeof (void *))));
#else
    unsigned char _[64];
#endif
} zsock_msg_t;

/*  Message kinds reported by zsock_msg_get (msg, ZSOCK_MSG_KIND).           */
#define ZSOCK_MSG_DATA 0
#define ZSOCK_MSG_COMMAND 1

/*  Message properties.                                                      */
#define ZSOCK_MSG_KIND 1
#define ZSOCK_MSG_CONNECTION 2
#define ZSOCK_MSG_ERROR 3

ZSOCK_EXPORT int zsock_msg_init (zsock_msg_t *msg_);
ZSOCK_EXPORT int zsock_msg_init_size (zsock_msg_t *msg_, size_t size_);
ZSOCK_EXPORT int zsock_msg_close (zsock_msg_t *msg_);
ZSOCK_EXPORT int zsock_msg_move (zsock_msg_t *dest_, zsock_msg_t *src_);
ZSOCK_EXPORT void *zsock_msg_data (zsock_msg_t *msg_);
ZSOCK_EXPORT size_t zsock_msg_size (const zsock_msg_t *msg_);
ZSOCK_EXPORT int zsock_msg_get (const zsock_msg_t *msg_, int property_);

/******************************************************************************/
/*  zsock socket definition.                                                  */
/******************************************************************************/

/*  Socket types.                                                            */
#define ZSOCK_SERVER 12
#define ZSOCK_CLIENT 13

/*  Security mechanisms.                                                     */
#define ZSOCK_NULL 0
#define ZSOCK_PLAIN 1

/*  Socket options.                                                          */
#define ZSOCK_TYPE 16
#define ZSOCK_RECONNECT_IVL 18
#define ZSOCK_RECONNECT_IVL_MAX 21
#define ZSOCK_MAXMSGSIZE 22
#define ZSOCK_RCVTIMEO 27
#define ZSOCK_LAST_ENDPOINT 32
#define ZSOCK_MECHANISM 43
#define ZSOCK_PLAIN_USERNAME 45
#define ZSOCK_PLAIN_PASSWORD 46
#define ZSOCK_HANDSHAKE_IVL 66
#define ZSOCK_CONNECT_TIMEOUT 79
#define ZSOCK_DIAL_TIMEOUT 120
#define ZSOCK_CONNECTIONS 121

/*  Send/recv options.                                                       */
#define ZSOCK_DONTWAIT 1

/*  Create a socket of the given type ("factory").                           */
ZSOCK_EXPORT void *zsock_socket (int type_, int mechanism_);
ZSOCK_EXPORT void *zsock_client_new (int mechanism_);
ZSOCK_EXPORT void *zsock_server_new (int mechanism_);

/*  Tear down every transport of the socket. Idempotent.                     */
ZSOCK_EXPORT int zsock_close (void *s_);

/*  Close (if needed) and release the socket object.                         */
ZSOCK_EXPORT int zsock_destroy (void *s_);

ZSOCK_EXPORT int
zsock_setsockopt (void *s_, int option_, const void *optval_, size_t optvallen_);
ZSOCK_EXPORT int
zsock_getsockopt (void *s_, int option_, void *optval_, size_t *optvallen_);

/*  Dial the endpoint, retrying until it succeeds, the dial budget is        */
/*  exhausted or the socket is closed. Client sockets only.                  */
ZSOCK_EXPORT int zsock_connect (void *s_, const char *endpoint_);

/*  Listen on the endpoint and accept exactly one connection. Server         */
/*  sockets only. When addr_ is not NULL, the local address of the accepted  */
/*  connection is stored there, NUL-terminated; *addr_len_ holds the buffer  */
/*  size on input and the string length (without NUL) on output.             */
ZSOCK_EXPORT int zsock_bind (void *s_,
                             const char *endpoint_,
                             char *addr_,
                             size_t *addr_len_);

ZSOCK_EXPORT int zsock_send (void *s_, const void *buf_, size_t len_, int flags_);
ZSOCK_EXPORT int zsock_recv (void *s_, void *buf_, size_t len_, int flags_);
ZSOCK_EXPORT int zsock_msg_recv (zsock_msg_t *msg_, void *s_, int flags_);

/******************************************************************************/
/*  Utility helpers.                                                          */
/******************************************************************************/

/*  Sleeps for specified number of milliseconds.                             */
ZSOCK_EXPORT void zsock_sleep (int milliseconds_);

/*  Starts the stopwatch. Returns the handle to the watch.                   */
ZSOCK_EXPORT void *zsock_stopwatch_start (void);

/*  Returns the number of microseconds elapsed since the stopwatch was       */
/*  started, and deallocates the stopwatch.                                  */
ZSOCK_EXPORT unsigned long zsock_stopwatch_stop (void *watch_);

typedef void (zsock_thread_fn) (void *);

/*  Start a thread. Returns a handle to the thread.                          */
ZSOCK_EXPORT void *zsock_threadstart (zsock_thread_fn *func_, void *arg_);

/*  Wait for thread to complete then free up resources.                      */
ZSOCK_EXPORT void zsock_threadclose (void *thread_);

#ifdef __cplusplus
}
#endif

#endif
