/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_MECHANISM_HPP_INCLUDED__
#define __ZSOCK_MECHANISM_HPP_INCLUDED__

#include <string>

#include "core/options.hpp"
#include "protocol/metadata.hpp"
#include "utils/macros.hpp"

namespace zsock
{
class msg_t;

//  Abstract class representing a security mechanism.
//  Different mechanism extends this class.

class mechanism_t
{
  public:
    enum status_t
    {
        handshaking,
        ready,
        error
    };

    mechanism_t (const options_t &options_,
                 int socket_type_,
                 const metadata_t *extra_);

    virtual ~mechanism_t ();

    //  Prepare next handshake command that is to be sent to the peer.
    //  Returns -1 with errno set to EAGAIN when there is nothing to send.
    virtual int next_handshake_command (msg_t *msg_) = 0;

    //  Process the handshake command received from the peer.
    virtual int process_handshake_command (msg_t *msg_) = 0;

    //  Returns the status of this mechanism.
    virtual status_t status () const = 0;

    //  errno describing the failure once status () returns error.
    int error_code () const { return _error_code; }

    //  Properties the peer announced in its READY or INITIATE command.
    const metadata_t &peer_metadata () const { return _peer_metadata; }

    //  Mechanism name as carried in the greeting, NULL if unknown.
    static const char *mechanism_name (int mechanism_);

    //  Socket type name as carried in the Socket-Type property.
    static const char *socket_type_string (int socket_type_);

    //  Creates the mechanism of the given kind for one side of a
    //  handshake. Returns NULL with errno set to EINVAL for an unknown
    //  mechanism.
    static mechanism_t *create (int mechanism_,
                                bool as_server_,
                                int socket_type_,
                                const options_t &options_,
                                const metadata_t *extra_);

  protected:
    //  Builds a command made of prefix_ followed by the Socket-Type property
    //  and the extra properties.
    void make_command_with_basic_properties (msg_t *msg_,
                                             const char *prefix_,
                                             size_t prefix_len_) const;

    //  Parses a metadata block received from the peer and checks that its
    //  socket type is compatible with ours.
    int parse_metadata (const unsigned char *ptr_, size_t length_);

    //  Parses an ERROR command and records the peer's reason.
    int parse_error_command (const unsigned char *cmd_data_,
                             size_t data_size_);

    //  Builds an ERROR command carrying reason_.
    static void make_error_command (msg_t *msg_, const std::string &reason_);

    //  True when msg_ is the command named by prefix_.
    static bool is_command (const msg_t *msg_,
                            const char *prefix_,
                            size_t prefix_len_);

    const options_t options;
    const int _socket_type;

    int _error_code;
    std::string _error_reason;

  private:
    bool check_socket_type (const std::string &type_) const;

    metadata_t _extra_metadata;
    metadata_t _peer_metadata;

    ZSOCK_NON_COPYABLE_NOR_MOVABLE (mechanism_t)
};
}

#endif
