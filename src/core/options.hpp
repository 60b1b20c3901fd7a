/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_OPTIONS_HPP_INCLUDED__
#define __ZSOCK_OPTIONS_HPP_INCLUDED__

#include <string>

#include <stddef.h>
#include <stdint.h>

#include "utils/macros.hpp"

namespace zsock
{
struct options_t
{
    options_t ();

    int setsockopt (int option_, const void *optval_, size_t optvallen_);
    int getsockopt (int option_, void *optval_, size_t *optvallen_) const;

    //  Socket type.
    int type;

    //  Security mechanism negotiated on every connection.
    int mechanism;

    //  True for the accepting (SERVER) side of a handshake.
    bool as_server;

    //  Minimum interval between attempts to reconnect, in milliseconds.
    //  Default 250ms.
    int reconnect_ivl;

    //  Maximum interval between attempts to reconnect, in milliseconds.
    //  Default 0 (unused)
    int reconnect_ivl_max;

    //  Total time budget for a connect call, -1 means unbounded.
    int dial_timeout;

    //  Timeout of a single TCP connect attempt, 0 means the OS default.
    int connect_timeout;

    //  Maximum time for the ZMTP handshake to complete, 0 disables the timer.
    int handshake_ivl;

    //  Timeout for receive operation in milliseconds.
    int rcvtimeo;

    //  Maximal size of message to handle.
    int64_t maxmsgsize;

    //  PLAIN credentials. On a server an empty username accepts any peer.
    std::string plain_username;
    std::string plain_password;
};

int do_getsockopt (void *optval_,
                   size_t *optvallen_,
                   const void *value_,
                   size_t value_len_);

int do_getsockopt (void *optval_, size_t *optvallen_, const std::string &value_);
}

#endif
