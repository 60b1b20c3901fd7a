/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "core/platform_thread.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

#include <pthread.h>
#include <signal.h>

namespace
{
struct thread_start_t
{
    zsock::thread_entry_t entry;
    void *arg;
};

static void *thread_routine (void *arg_)
{
    //  Background threads never handle signals; the application thread does.
    sigset_t signal_set;
    int rc = sigfillset (&signal_set);
    errno_assert (rc == 0);
    rc = pthread_sigmask (SIG_BLOCK, &signal_set, NULL);
    posix_assert (rc);

    thread_start_t *start = static_cast<thread_start_t *> (arg_);
    zsock::thread_entry_t entry = start->entry;
    void *arg = start->arg;
    delete start;
    return entry (arg);
}
}

struct zsock::platform_thread_t
{
    pthread_t handle;
};

zsock::platform_thread_t *zsock::platform_thread_start (thread_entry_t entry_,
                                                        void *arg_)
{
    platform_thread_t *thread = new (std::nothrow) platform_thread_t ();
    alloc_assert (thread);

    thread_start_t *start = new (std::nothrow) thread_start_t ();
    alloc_assert (start);
    start->entry = entry_;
    start->arg = arg_;

    const int rc = pthread_create (&thread->handle, NULL, thread_routine, start);
    posix_assert (rc);
    return thread;
}

void zsock::platform_thread_stop (platform_thread_t *thread_)
{
    if (!thread_)
        return;
    const int rc = pthread_join (thread_->handle, NULL);
    posix_assert (rc);
}

bool zsock::platform_thread_is_current (const platform_thread_t *thread_)
{
    if (!thread_)
        return false;
    return bool (pthread_equal (pthread_self (), thread_->handle));
}

void zsock::platform_thread_destroy (platform_thread_t *thread_)
{
    if (!thread_)
        return;
    delete thread_;
}

void zsock::platform_thread_apply_name (const char *name_)
{
    if (!name_ || !name_[0])
        return;

#if defined __linux__
    //  Names longer than 15 characters are rejected; keep the default then.
    const int rc = pthread_setname_np (pthread_self (), name_);
    LIBZSOCK_UNUSED (rc);
#endif
}
