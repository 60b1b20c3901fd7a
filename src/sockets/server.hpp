/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_SERVER_HPP_INCLUDED__
#define __ZSOCK_SERVER_HPP_INCLUDED__

#include "sockets/socket_base.hpp"

namespace zsock
{
//  Accepting side. Every bind listens for, and accepts, a single peer.

class server_t ZSOCK_FINAL : public socket_base_t
{
  public:
    explicit server_t (int mechanism_);
    ~server_t ();

  protected:
    //  Overrides of functions from socket_base_t.
    int xbind (const std::string &address_,
               std::string &local_address_) ZSOCK_OVERRIDE;

    ZSOCK_NON_COPYABLE_NOR_MOVABLE (server_t)
};
}

#endif
