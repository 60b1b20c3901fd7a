/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_PLAIN_SERVER_HPP_INCLUDED__
#define __ZSOCK_PLAIN_SERVER_HPP_INCLUDED__

#include "mechanism/mechanism.hpp"

namespace zsock
{
class msg_t;

//  Server side of the PLAIN mechanism. With an empty configured username
//  any credentials are accepted; otherwise HELLO must match the configured
//  username and password.

class plain_server_t ZSOCK_FINAL : public mechanism_t
{
  public:
    plain_server_t (const options_t &options_,
                    int socket_type_,
                    const metadata_t *extra_);
    ~plain_server_t ();

    // mechanism implementation
    int next_handshake_command (msg_t *msg_) ZSOCK_OVERRIDE;
    int process_handshake_command (msg_t *msg_) ZSOCK_OVERRIDE;
    status_t status () const ZSOCK_OVERRIDE;

    //  Username the client presented in HELLO.
    const std::string &user_id () const { return _user_id; }

  private:
    enum state_t
    {
        waiting_for_hello,
        sending_welcome,
        waiting_for_initiate,
        sending_ready,
        sending_error,
        error_sent,
        ready
    };

    state_t _state;
    std::string _user_id;

    int process_hello (msg_t *msg_);
    void produce_welcome (msg_t *msg_) const;
    void produce_ready (msg_t *msg_) const;
    int process_initiate (msg_t *msg_);

    bool authenticate (const std::string &username_,
                       const std::string &password_) const;
};
}

#endif
