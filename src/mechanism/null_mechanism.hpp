/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_NULL_MECHANISM_HPP_INCLUDED__
#define __ZSOCK_NULL_MECHANISM_HPP_INCLUDED__

#include "mechanism/mechanism.hpp"

namespace zsock
{
//  No security: both peers send READY with their metadata.

class null_mechanism_t ZSOCK_FINAL : public mechanism_t
{
  public:
    null_mechanism_t (const options_t &options_,
                      int socket_type_,
                      const metadata_t *extra_);
    ~null_mechanism_t ();

    // mechanism implementation
    int next_handshake_command (msg_t *msg_) ZSOCK_OVERRIDE;
    int process_handshake_command (msg_t *msg_) ZSOCK_OVERRIDE;
    status_t status () const ZSOCK_OVERRIDE;

  private:
    bool _ready_command_sent;
    bool _ready_command_received;
    bool _error_command_received;

    int process_ready_command (const unsigned char *cmd_data_,
                               size_t data_size_);
    int process_error_command (const unsigned char *cmd_data_,
                               size_t data_size_);
};
}

#endif
