/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "utils/macros.hpp"

#include <string>
#include <limits.h>

#include "mechanism/plain_client.hpp"
#include "protocol/zmtp_protocol.hpp"
#include "core/msg.hpp"
#include "utils/err.hpp"

zsock::plain_client_t::plain_client_t (const options_t &options_,
                                       int socket_type_,
                                       const metadata_t *extra_) :
    mechanism_t (options_, socket_type_, extra_),
    _state (sending_hello)
{
}

zsock::plain_client_t::~plain_client_t ()
{
}

int zsock::plain_client_t::next_handshake_command (msg_t *msg_)
{
    int rc = 0;

    switch (_state) {
        case sending_hello:
            produce_hello (msg_);
            _state = waiting_for_welcome;
            break;
        case sending_initiate:
            produce_initiate (msg_);
            _state = waiting_for_ready;
            break;
        default:
            errno = EAGAIN;
            rc = -1;
    }
    return rc;
}

int zsock::plain_client_t::process_handshake_command (msg_t *msg_)
{
    const unsigned char *cmd_data =
      static_cast<unsigned char *> (msg_->data ());
    const size_t data_size = msg_->size ();

    int rc = 0;
    if (is_command (msg_, zmtp_command_welcome, zmtp_command_welcome_size))
        rc = process_welcome (cmd_data, data_size);
    else if (is_command (msg_, zmtp_command_ready, zmtp_command_ready_size))
        rc = process_ready (cmd_data, data_size);
    else if (is_command (msg_, zmtp_command_error, zmtp_command_error_size))
        rc = process_error (cmd_data, data_size);
    else {
        errno = EPROTO;
        rc = -1;
    }

    return rc;
}

zsock::mechanism_t::status_t zsock::plain_client_t::status () const
{
    switch (_state) {
        case ready:
            return mechanism_t::ready;
        case error_command_received:
            return mechanism_t::error;
        default:
            return mechanism_t::handshaking;
    }
}

void zsock::plain_client_t::produce_hello (msg_t *msg_) const
{
    const std::string username = options.plain_username;
    zsock_assert (username.length () <= UCHAR_MAX);

    const std::string password = options.plain_password;
    zsock_assert (password.length () <= UCHAR_MAX);

    const size_t command_size = zmtp_command_hello_size + 1
                                + username.length () + 1 + password.length ();

    const int rc = msg_->init_size (command_size);
    errno_assert (rc == 0);

    unsigned char *ptr = static_cast<unsigned char *> (msg_->data ());
    memcpy (ptr, zmtp_command_hello, zmtp_command_hello_size);
    ptr += zmtp_command_hello_size;

    *ptr++ = static_cast<unsigned char> (username.length ());
    memcpy (ptr, username.c_str (), username.length ());
    ptr += username.length ();

    *ptr++ = static_cast<unsigned char> (password.length ());
    memcpy (ptr, password.c_str (), password.length ());

    msg_->set_flags (msg_t::command);
}

int zsock::plain_client_t::process_welcome (const unsigned char *cmd_data_,
                                            size_t data_size_)
{
    LIBZSOCK_UNUSED (cmd_data_);

    if (_state != waiting_for_welcome) {
        errno = EPROTO;
        return -1;
    }
    if (data_size_ != zmtp_command_welcome_size) {
        errno = EPROTO;
        return -1;
    }
    _state = sending_initiate;
    return 0;
}

void zsock::plain_client_t::produce_initiate (msg_t *msg_) const
{
    make_command_with_basic_properties (msg_, zmtp_command_initiate,
                                        zmtp_command_initiate_size);
}

int zsock::plain_client_t::process_ready (const unsigned char *cmd_data_,
                                          size_t data_size_)
{
    if (_state != waiting_for_ready) {
        errno = EPROTO;
        return -1;
    }
    const int rc = parse_metadata (cmd_data_ + zmtp_command_ready_size,
                                   data_size_ - zmtp_command_ready_size);
    if (rc == 0)
        _state = ready;
    return rc;
}

int zsock::plain_client_t::process_error (const unsigned char *cmd_data_,
                                          size_t data_size_)
{
    if (_state != waiting_for_welcome && _state != waiting_for_ready) {
        errno = EPROTO;
        return -1;
    }
    const int rc = parse_error_command (cmd_data_, data_size_);
    if (rc == 0) {
        //  The server rejected our credentials.
        _state = error_command_received;
        _error_code = EACCES;
    }
    return rc;
}
