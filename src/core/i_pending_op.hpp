/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_I_PENDING_OP_HPP_INCLUDED__
#define __ZSOCK_I_PENDING_OP_HPP_INCLUDED__

#include "utils/macros.hpp"

namespace zsock
{
//  A blocking socket operation (dial, accept, handshake) that another
//  thread may abort. cancel () returns once the abort has been applied on
//  the I/O thread; the blocked call then fails with ETERM.

struct i_pending_op
{
    virtual ~i_pending_op () ZSOCK_DEFAULT

    virtual void cancel () = 0;
};
}

#endif
