/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "core/io_thread.hpp"
#include "core/platform_thread.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

zsock::io_thread_t::io_thread_t () :
    _io_context (1),
    _work_guard (boost::asio::make_work_guard (_io_context)),
    _thread (NULL)
{
}

zsock::io_thread_t::~io_thread_t ()
{
    stop ();
}

void zsock::io_thread_t::start ()
{
    zsock_assert (!_thread);
    _thread = platform_thread_start (thread_routine, this);
}

void zsock::io_thread_t::stop ()
{
    if (!_thread)
        return;

    //  Must not be called from a handler, the join would never return.
    zsock_assert (!platform_thread_is_current (_thread));

    _work_guard.reset ();
    _io_context.stop ();
    platform_thread_stop (_thread);
    platform_thread_destroy (_thread);
    _thread = NULL;
}

boost::asio::io_context &zsock::io_thread_t::get_io_context ()
{
    return _io_context;
}

void *zsock::io_thread_t::thread_routine (void *arg_)
{
    platform_thread_apply_name ("zsock/io");
    static_cast<io_thread_t *> (arg_)->loop ();
    return NULL;
}

void zsock::io_thread_t::loop ()
{
    ZSOCK_DBG_THIS ("IO", "loop started");
    try {
        _io_context.run ();
    }
    catch (const std::exception &e) {
        //  Handlers report failures through completions, never by throwing.
        fprintf (stderr, "zsock: unexpected exception in I/O thread: %s\n",
                 e.what ());
        zsock_abort (e.what ());
    }
    ZSOCK_DBG_THIS ("IO", "loop finished");
}
