/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"

#include <string>

#include "mechanism/plain_server.hpp"
#include "protocol/zmtp_protocol.hpp"
#include "core/msg.hpp"
#include "utils/err.hpp"

namespace
{
const char invalid_credentials_reason[] = "Invalid username or password";
}

zsock::plain_server_t::plain_server_t (const options_t &options_,
                                       int socket_type_,
                                       const metadata_t *extra_) :
    mechanism_t (options_, socket_type_, extra_),
    _state (waiting_for_hello)
{
}

zsock::plain_server_t::~plain_server_t ()
{
}

int zsock::plain_server_t::next_handshake_command (msg_t *msg_)
{
    int rc = 0;

    switch (_state) {
        case sending_welcome:
            produce_welcome (msg_);
            _state = waiting_for_initiate;
            break;
        case sending_ready:
            produce_ready (msg_);
            _state = ready;
            break;
        case sending_error:
            make_error_command (msg_, invalid_credentials_reason);
            _state = error_sent;
            break;
        default:
            errno = EAGAIN;
            rc = -1;
    }
    return rc;
}

int zsock::plain_server_t::process_handshake_command (msg_t *msg_)
{
    int rc = 0;

    switch (_state) {
        case waiting_for_hello:
            rc = process_hello (msg_);
            break;
        case waiting_for_initiate:
            rc = process_initiate (msg_);
            break;
        default:
            errno = EPROTO;
            rc = -1;
            break;
    }
    return rc;
}

zsock::mechanism_t::status_t zsock::plain_server_t::status () const
{
    switch (_state) {
        case ready:
            return mechanism_t::ready;
        case error_sent:
            return mechanism_t::error;
        default:
            return mechanism_t::handshaking;
    }
}

int zsock::plain_server_t::process_hello (msg_t *msg_)
{
    if (!is_command (msg_, zmtp_command_hello, zmtp_command_hello_size)) {
        errno = EPROTO;
        return -1;
    }

    const unsigned char *ptr = static_cast<unsigned char *> (msg_->data ());
    size_t bytes_left = msg_->size ();

    ptr += zmtp_command_hello_size;
    bytes_left -= zmtp_command_hello_size;

    if (bytes_left < 1) {
        errno = EPROTO;
        return -1;
    }
    const size_t username_length = static_cast<size_t> (*ptr++);
    bytes_left -= 1;

    if (bytes_left < username_length) {
        errno = EPROTO;
        return -1;
    }
    const std::string username =
      std::string (reinterpret_cast<const char *> (ptr), username_length);
    ptr += username_length;
    bytes_left -= username_length;
    if (bytes_left < 1) {
        errno = EPROTO;
        return -1;
    }

    const size_t password_length = static_cast<size_t> (*ptr++);
    bytes_left -= 1;
    if (bytes_left != password_length) {
        errno = EPROTO;
        return -1;
    }

    const std::string password =
      std::string (reinterpret_cast<const char *> (ptr), password_length);

    _user_id = username;
    if (authenticate (username, password))
        _state = sending_welcome;
    else {
        _state = sending_error;
        _error_code = EACCES;
    }
    return 0;
}

bool zsock::plain_server_t::authenticate (const std::string &username_,
                                          const std::string &password_) const
{
    if (options.plain_username.empty ())
        return true;
    return username_ == options.plain_username
           && password_ == options.plain_password;
}

void zsock::plain_server_t::produce_welcome (msg_t *msg_) const
{
    const int rc = msg_->init_size (zmtp_command_welcome_size);
    errno_assert (rc == 0);
    memcpy (msg_->data (), zmtp_command_welcome, zmtp_command_welcome_size);
    msg_->set_flags (msg_t::command);
}

int zsock::plain_server_t::process_initiate (msg_t *msg_)
{
    const unsigned char *ptr = static_cast<unsigned char *> (msg_->data ());
    const size_t bytes_left = msg_->size ();

    if (!is_command (msg_, zmtp_command_initiate, zmtp_command_initiate_size)) {
        errno = EPROTO;
        return -1;
    }
    const int rc = parse_metadata (ptr + zmtp_command_initiate_size,
                                   bytes_left - zmtp_command_initiate_size);
    if (rc == 0)
        _state = sending_ready;
    return rc;
}

void zsock::plain_server_t::produce_ready (msg_t *msg_) const
{
    make_command_with_basic_properties (msg_, zmtp_command_ready,
                                        zmtp_command_ready_size);
}
