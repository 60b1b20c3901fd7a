/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"

#include "core/platform_thread.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

#include <chrono>
#include <new>

#include <stdint.h>
#include <stdlib.h>
#include <unistd.h>

namespace
{
uint64_t now_us ()
{
    return static_cast<uint64_t> (
      std::chrono::duration_cast<std::chrono::microseconds> (
        std::chrono::steady_clock::now ().time_since_epoch ())
        .count ());
}

//  Application thread started through zsock_threadstart.
struct app_thread_t
{
    zsock_thread_fn *func;
    void *arg;
    zsock::platform_thread_t *thread;
};

void *app_thread_routine (void *arg_)
{
    app_thread_t *self = static_cast<app_thread_t *> (arg_);
    zsock::platform_thread_apply_name ("zsock/app");
    self->func (self->arg);
    return NULL;
}
}

void zsock_sleep (int milliseconds_)
{
    usleep (static_cast<useconds_t> (milliseconds_) * 1000);
}

void *zsock_stopwatch_start ()
{
    uint64_t *watch = static_cast<uint64_t *> (malloc (sizeof (uint64_t)));
    alloc_assert (watch);
    *watch = now_us ();
    return static_cast<void *> (watch);
}

unsigned long zsock_stopwatch_stop (void *watch_)
{
    const uint64_t end = now_us ();
    const uint64_t start = *static_cast<uint64_t *> (watch_);
    free (watch_);
    return static_cast<unsigned long> (end - start);
}

void *zsock_threadstart (zsock_thread_fn *func_, void *arg_)
{
    app_thread_t *thread = new (std::nothrow) app_thread_t;
    alloc_assert (thread);
    thread->func = func_;
    thread->arg = arg_;
    thread->thread = zsock::platform_thread_start (app_thread_routine, thread);
    return thread;
}

void zsock_threadclose (void *thread_)
{
    app_thread_t *thread = static_cast<app_thread_t *> (thread_);
    zsock::platform_thread_stop (thread->thread);
    zsock::platform_thread_destroy (thread->thread);
    LIBZSOCK_DELETE (thread);
}
