/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_PLAIN_CLIENT_HPP_INCLUDED__
#define __ZSOCK_PLAIN_CLIENT_HPP_INCLUDED__

#include "mechanism/mechanism.hpp"

namespace zsock
{
class msg_t;

//  Client side of the PLAIN mechanism: HELLO with the credentials, then
//  INITIATE with our metadata once the server WELCOMEs us.

class plain_client_t ZSOCK_FINAL : public mechanism_t
{
  public:
    plain_client_t (const options_t &options_,
                    int socket_type_,
                    const metadata_t *extra_);
    ~plain_client_t ();

    // mechanism implementation
    int next_handshake_command (msg_t *msg_) ZSOCK_OVERRIDE;
    int process_handshake_command (msg_t *msg_) ZSOCK_OVERRIDE;
    status_t status () const ZSOCK_OVERRIDE;

  private:
    enum state_t
    {
        sending_hello,
        waiting_for_welcome,
        sending_initiate,
        waiting_for_ready,
        error_command_received,
        ready
    };

    state_t _state;

    void produce_hello (msg_t *msg_) const;
    void produce_initiate (msg_t *msg_) const;

    int process_welcome (const unsigned char *cmd_data_, size_t data_size_);
    int process_ready (const unsigned char *cmd_data_, size_t data_size_);
    int process_error (const unsigned char *cmd_data_, size_t data_size_);
};
}

#endif
