/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_COMPLETION_HPP_INCLUDED__
#define __ZSOCK_COMPLETION_HPP_INCLUDED__

#include "utils/condition_variable.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"
#include "utils/mutex.hpp"

namespace zsock
{
//  One-shot latch. The I/O thread stores the result of an asynchronous
//  operation, the thread that started the operation waits for it. Only the
//  first result is kept.

class completion_t
{
  public:
    completion_t () : _done (false), _result (0), _err (0) {}

    //  Returns false if a result was already stored.
    bool set (int result_, int err_)
    {
        scoped_lock_t lock (_sync);
        if (_done)
            return false;
        _done = true;
        _result = result_;
        _err = err_;
        _cond.broadcast ();
        return true;
    }

    //  Blocks until a result is stored. Returns it, with errno set to the
    //  stored error when the result is negative.
    int wait ()
    {
        scoped_lock_t lock (_sync);
        while (!_done) {
            const int rc = _cond.wait (&_sync, -1);
            errno_assert (rc == 0);
        }
        if (_result < 0)
            errno = _err;
        return _result;
    }

  private:
    mutex_t _sync;
    condition_variable_t _cond;
    bool _done;
    int _result;
    int _err;

    ZSOCK_NON_COPYABLE_NOR_MOVABLE (completion_t)
};
}

#endif
