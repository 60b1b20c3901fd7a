/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"

#include <stddef.h>
#include <string.h>
#include <stdlib.h>

#include "mechanism/null_mechanism.hpp"
#include "protocol/zmtp_protocol.hpp"
#include "core/msg.hpp"
#include "utils/err.hpp"

zsock::null_mechanism_t::null_mechanism_t (const options_t &options_,
                                           int socket_type_,
                                           const metadata_t *extra_) :
    mechanism_t (options_, socket_type_, extra_),
    _ready_command_sent (false),
    _ready_command_received (false),
    _error_command_received (false)
{
}

zsock::null_mechanism_t::~null_mechanism_t ()
{
}

int zsock::null_mechanism_t::next_handshake_command (msg_t *msg_)
{
    if (_ready_command_sent) {
        errno = EAGAIN;
        return -1;
    }

    make_command_with_basic_properties (msg_, zmtp_command_ready,
                                        zmtp_command_ready_size);

    _ready_command_sent = true;

    return 0;
}

int zsock::null_mechanism_t::process_handshake_command (msg_t *msg_)
{
    if (_ready_command_received || _error_command_received) {
        errno = EPROTO;
        return -1;
    }

    const unsigned char *cmd_data =
      static_cast<unsigned char *> (msg_->data ());
    const size_t data_size = msg_->size ();

    int rc = 0;
    if (is_command (msg_, zmtp_command_ready, zmtp_command_ready_size))
        rc = process_ready_command (cmd_data, data_size);
    else if (is_command (msg_, zmtp_command_error, zmtp_command_error_size))
        rc = process_error_command (cmd_data, data_size);
    else {
        errno = EPROTO;
        rc = -1;
    }

    return rc;
}

int zsock::null_mechanism_t::process_ready_command (
  const unsigned char *cmd_data_, size_t data_size_)
{
    const int rc = parse_metadata (cmd_data_ + zmtp_command_ready_size,
                                   data_size_ - zmtp_command_ready_size);
    if (rc == 0)
        _ready_command_received = true;
    return rc;
}

int zsock::null_mechanism_t::process_error_command (
  const unsigned char *cmd_data_, size_t data_size_)
{
    const int rc = parse_error_command (cmd_data_, data_size_);
    if (rc == 0) {
        //  The peer refused the connection.
        _error_command_received = true;
        _error_code = EACCES;
    }
    return rc;
}

zsock::mechanism_t::status_t zsock::null_mechanism_t::status () const
{
    if (_ready_command_sent && _ready_command_received)
        return ready;
    if (_error_command_received)
        return error;
    return handshaking;
}
