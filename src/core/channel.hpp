/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_CHANNEL_HPP_INCLUDED__
#define __ZSOCK_CHANNEL_HPP_INCLUDED__

#include <deque>

#include "core/msg.hpp"
#include "utils/condition_variable.hpp"
#include "utils/macros.hpp"
#include "utils/mutex.hpp"

namespace zsock
{
//  Inbound message queue shared by every connection of a socket. Receive
//  loops push from the I/O thread, application threads pull.

class channel_t
{
  public:
    channel_t ();
    ~channel_t ();

    //  Takes ownership of the message content; msg_ is left empty. After
    //  terminate the message is dropped instead.
    void push (msg_t *msg_);

    //  Waits for a message. A negative timeout waits forever, zero does not
    //  wait at all. Fails with EAGAIN on timeout and with ETERM once the
    //  channel is terminated and drained.
    int recv (msg_t *msg_, int timeout_);

    //  Wakes every blocked receiver. Queued messages can still be received.
    void terminate ();

    bool terminated ();
    size_t size ();

  private:
    mutex_t _sync;
    condition_variable_t _cond;
    std::deque<msg_t> _queue;
    bool _terminated;

    ZSOCK_NON_COPYABLE_NOR_MOVABLE (channel_t)
};
}

#endif
