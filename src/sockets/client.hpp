/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_CLIENT_HPP_INCLUDED__
#define __ZSOCK_CLIENT_HPP_INCLUDED__

#include "sockets/socket_base.hpp"

namespace zsock
{
//  Dialing side. Each successful connect adds one connection; messages are
//  always sent through the first one.

class client_t ZSOCK_FINAL : public socket_base_t
{
  public:
    explicit client_t (int mechanism_);
    ~client_t ();

  protected:
    //  Overrides of functions from socket_base_t.
    int xconnect (const std::string &address_) ZSOCK_OVERRIDE;

    ZSOCK_NON_COPYABLE_NOR_MOVABLE (client_t)
};
}

#endif
