/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include <string.h>
#include <limits.h>

#include "mechanism/mechanism.hpp"
#include "mechanism/null_mechanism.hpp"
#include "mechanism/plain_client.hpp"
#include "mechanism/plain_server.hpp"
#include "protocol/zmtp_protocol.hpp"
#include "core/msg.hpp"
#include "utils/err.hpp"

namespace
{
const char socket_type_client[] = "CLIENT";
const char socket_type_server[] = "SERVER";
}

zsock::mechanism_t::mechanism_t (const options_t &options_,
                                 int socket_type_,
                                 const metadata_t *extra_) :
    options (options_),
    _socket_type (socket_type_),
    _error_code (0)
{
    if (extra_)
        _extra_metadata = *extra_;
}

zsock::mechanism_t::~mechanism_t ()
{
}

const char *zsock::mechanism_t::mechanism_name (int mechanism_)
{
    switch (mechanism_) {
        case ZSOCK_NULL:
            return zmtp_mechanism_null;
        case ZSOCK_PLAIN:
            return zmtp_mechanism_plain;
        default:
            return NULL;
    }
}

const char *zsock::mechanism_t::socket_type_string (int socket_type_)
{
    // Map socket type to name string
    switch (socket_type_) {
        case ZSOCK_CLIENT:
            return socket_type_client;
        case ZSOCK_SERVER:
            return socket_type_server;
        default:
            zsock_assert (false);
            return NULL;
    }
}

zsock::mechanism_t *zsock::mechanism_t::create (int mechanism_,
                                                bool as_server_,
                                                int socket_type_,
                                                const options_t &options_,
                                                const metadata_t *extra_)
{
    mechanism_t *mechanism = NULL;
    switch (mechanism_) {
        case ZSOCK_NULL:
            mechanism = new (std::nothrow)
              null_mechanism_t (options_, socket_type_, extra_);
            break;
        case ZSOCK_PLAIN:
            if (as_server_)
                mechanism = new (std::nothrow)
                  plain_server_t (options_, socket_type_, extra_);
            else
                mechanism = new (std::nothrow)
                  plain_client_t (options_, socket_type_, extra_);
            break;
        default:
            errno = EINVAL;
            return NULL;
    }
    alloc_assert (mechanism);
    return mechanism;
}

void zsock::mechanism_t::make_command_with_basic_properties (
  msg_t *msg_, const char *prefix_, size_t prefix_len_) const
{
    metadata_t properties (_extra_metadata);
    properties.set (zmtp_property_socket_type,
                    socket_type_string (_socket_type));

    const size_t command_size = prefix_len_ + properties.encoded_size ();
    const int rc = msg_->init_size (command_size);
    errno_assert (rc == 0);

    unsigned char *ptr = static_cast<unsigned char *> (msg_->data ());

    //  Add prefix
    memcpy (ptr, prefix_, prefix_len_);
    ptr += prefix_len_;

    properties.write (ptr, command_size - prefix_len_);
    msg_->set_flags (msg_t::command);
}

int zsock::mechanism_t::parse_metadata (const unsigned char *ptr_,
                                        size_t length_)
{
    metadata_t metadata;
    if (metadata.parse (ptr_, length_) == -1)
        return -1;

    const char *socket_type = metadata.get (zmtp_property_socket_type);
    if (!socket_type) {
        errno = EPROTO;
        return -1;
    }
    if (!check_socket_type (socket_type)) {
        errno = ENOCOMPATPROTO;
        return -1;
    }

    _peer_metadata = metadata;
    return 0;
}

int zsock::mechanism_t::parse_error_command (const unsigned char *cmd_data_,
                                             size_t data_size_)
{
    const size_t fixed_prefix_size =
      zmtp_command_error_size + sizeof (unsigned char);
    if (data_size_ < fixed_prefix_size) {
        errno = EPROTO;
        return -1;
    }
    const size_t error_reason_len =
      static_cast<size_t> (cmd_data_[zmtp_command_error_size]);
    if (error_reason_len > data_size_ - fixed_prefix_size) {
        errno = EPROTO;
        return -1;
    }
    _error_reason.assign (
      reinterpret_cast<const char *> (cmd_data_) + fixed_prefix_size,
      error_reason_len);
    return 0;
}

void zsock::mechanism_t::make_error_command (msg_t *msg_,
                                             const std::string &reason_)
{
    const size_t reason_len =
      reason_.size () < UCHAR_MAX ? reason_.size () : UCHAR_MAX;
    const int rc =
      msg_->init_size (zmtp_command_error_size + 1 + reason_len);
    errno_assert (rc == 0);

    unsigned char *ptr = static_cast<unsigned char *> (msg_->data ());
    memcpy (ptr, zmtp_command_error, zmtp_command_error_size);
    ptr += zmtp_command_error_size;
    *ptr++ = static_cast<unsigned char> (reason_len);
    memcpy (ptr, reason_.data (), reason_len);
    msg_->set_flags (msg_t::command);
}

bool zsock::mechanism_t::is_command (const msg_t *msg_,
                                     const char *prefix_,
                                     size_t prefix_len_)
{
    msg_t *msg = const_cast<msg_t *> (msg_);
    return msg->size () >= prefix_len_
           && memcmp (msg->data (), prefix_, prefix_len_) == 0;
}

bool zsock::mechanism_t::check_socket_type (const std::string &type_) const
{
    switch (_socket_type) {
        case ZSOCK_CLIENT:
            return type_ == socket_type_server;
        case ZSOCK_SERVER:
            return type_ == socket_type_client;
        default:
            break;
    }
    return false;
}
