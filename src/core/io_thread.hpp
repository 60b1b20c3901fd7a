/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_IO_THREAD_HPP_INCLUDED__
#define __ZSOCK_IO_THREAD_HPP_INCLUDED__

#include "utils/macros.hpp"

#include <boost/asio.hpp>

namespace zsock
{
struct platform_thread_t;

//  Background thread driving one Boost.Asio io_context. Every transport
//  operation, timer and receive loop of a socket runs on it; callers post
//  work and wait for the result.

class io_thread_t ZSOCK_FINAL
{
  public:
    io_thread_t ();

    //  Clean-up. Stops the thread if it is still running.
    ~io_thread_t ();

    //  Launch the physical thread.
    void start ();

    //  Stop the io_context and join the thread. Handlers still queued are
    //  destroyed without being invoked.
    void stop ();

    //  Get access to the io_context for ASIO-based operations
    boost::asio::io_context &get_io_context ();

  private:
    typedef boost::asio::executor_work_guard<
      boost::asio::io_context::executor_type>
      work_guard_t;

    static void *thread_routine (void *arg_);
    void loop ();

    boost::asio::io_context _io_context;

    //  Keeps run () from returning while no operation is pending.
    work_guard_t _work_guard;

    platform_thread_t *_thread;

    ZSOCK_NON_COPYABLE_NOR_MOVABLE (io_thread_t)
};
}

#endif
