/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "core/channel.hpp"
#include "utils/err.hpp"

#include <chrono>

zsock::channel_t::channel_t () : _terminated (false)
{
}

zsock::channel_t::~channel_t ()
{
    while (!_queue.empty ()) {
        const int rc = _queue.front ().close ();
        errno_assert (rc == 0);
        _queue.pop_front ();
    }
}

void zsock::channel_t::push (msg_t *msg_)
{
    scoped_lock_t lock (_sync);
    if (_terminated) {
        int rc = msg_->close ();
        errno_assert (rc == 0);
        rc = msg_->init ();
        errno_assert (rc == 0);
        return;
    }

    msg_t msg;
    int rc = msg.init ();
    errno_assert (rc == 0);
    rc = msg.move (*msg_);
    errno_assert (rc == 0);
    _queue.push_back (msg);
    _cond.broadcast ();
}

int zsock::channel_t::recv (msg_t *msg_, int timeout_)
{
    typedef std::chrono::steady_clock clock_type;
    const clock_type::time_point deadline =
      clock_type::now () + std::chrono::milliseconds (timeout_ > 0 ? timeout_
                                                                     : 0);

    scoped_lock_t lock (_sync);
    while (_queue.empty ()) {
        if (_terminated) {
            errno = ETERM;
            return -1;
        }
        if (timeout_ == 0) {
            errno = EAGAIN;
            return -1;
        }

        int wait = -1;
        if (timeout_ > 0) {
            const clock_type::time_point now = clock_type::now ();
            if (now >= deadline) {
                errno = EAGAIN;
                return -1;
            }
            wait = static_cast<int> (
              std::chrono::duration_cast<std::chrono::milliseconds> (
                deadline - now)
                .count ());
            if (wait == 0)
                wait = 1;
        }

        const int rc = _cond.wait (&_sync, wait);
        if (rc == -1) {
            errno_assert (errno == EAGAIN);
        }
    }

    int rc = msg_->move (_queue.front ());
    errno_assert (rc == 0);
    _queue.pop_front ();
    return 0;
}

void zsock::channel_t::terminate ()
{
    scoped_lock_t lock (_sync);
    _terminated = true;
    _cond.broadcast ();
}

bool zsock::channel_t::terminated ()
{
    scoped_lock_t lock (_sync);
    return _terminated;
}

size_t zsock::channel_t::size ()
{
    scoped_lock_t lock (_sync);
    return _queue.size ();
}
