/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_I_ENGINE_HPP_INCLUDED__
#define __ZSOCK_I_ENGINE_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include "core/i_pending_op.hpp"
#include "utils/macros.hpp"

namespace zsock
{
class channel_t;
class metadata_t;

//  Abstract interface to be implemented by protocol engines. An engine is
//  constructed from a connected transport and owns it from then on.
//  Cancelling an engine closes it.

struct i_engine : public i_pending_op
{
    virtual ~i_engine () ZSOCK_DEFAULT

    //  Runs the handshake and blocks until it completes. extra_ holds
    //  properties announced to the peer in addition to Socket-Type, the
    //  peer's properties are stored in peer_. Either may be NULL.
    virtual int prepare (int mechanism_,
                         int socket_type_,
                         bool as_server_,
                         const metadata_t *extra_,
                         metadata_t *peer_) = 0;

    //  Starts delivering inbound messages, tagged with connection_id_, to
    //  channel_. Returns at once. A transport or protocol error is
    //  delivered as one message carrying the error, after which delivery
    //  stops.
    virtual void recv (channel_t *channel_, uint32_t connection_id_) = 0;

    //  Writes one data frame and blocks until it is written.
    virtual int send_frame (const void *data_, size_t size_) = 0;

    //  Closes the transport. Stops delivery without an error message and
    //  aborts a handshake in progress. Idempotent.
    virtual void close () = 0;
};
}

#endif
