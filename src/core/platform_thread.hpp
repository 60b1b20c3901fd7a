/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_PLATFORM_THREAD_HPP_INCLUDED__
#define __ZSOCK_PLATFORM_THREAD_HPP_INCLUDED__

namespace zsock
{
typedef void *(*thread_entry_t) (void *arg_);

//  Thin wrapper over pthreads, used by the per-socket I/O thread and by
//  zsock_threadstart. Signals are blocked in every started thread.
struct platform_thread_t;

platform_thread_t *platform_thread_start (thread_entry_t entry_, void *arg_);

//  Joins the thread. The handle stays valid until destroyed.
void platform_thread_stop (platform_thread_t *thread_);
bool platform_thread_is_current (const platform_thread_t *thread_);
void platform_thread_destroy (platform_thread_t *thread_);

//  Names the calling thread, as shown by debuggers and top.
void platform_thread_apply_name (const char *name_);
}

#endif
