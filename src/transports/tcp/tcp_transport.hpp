/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_TCP_TRANSPORT_HPP_INCLUDED__
#define __ZSOCK_TCP_TRANSPORT_HPP_INCLUDED__

#include <boost/asio.hpp>

#include "transports/i_transport.hpp"

namespace zsock
{
//  TCP transport implementation using Boost.Asio
//
//  Takes over a socket connected by tcp_connecter_t or accepted by
//  tcp_listener_t.

class tcp_transport_t ZSOCK_FINAL : public i_transport
{
  public:
    explicit tcp_transport_t (boost::asio::ip::tcp::socket socket_);
    ~tcp_transport_t () ZSOCK_OVERRIDE;

    //  i_transport interface
    bool is_open () const ZSOCK_OVERRIDE;
    void close () ZSOCK_OVERRIDE;

    void async_read_some (unsigned char *buffer,
                          std::size_t buffer_size,
                          completion_handler_t handler) ZSOCK_OVERRIDE;

    void async_read (unsigned char *buffer,
                     std::size_t buffer_size,
                     completion_handler_t handler) ZSOCK_OVERRIDE;

    void async_write (const unsigned char *buffer,
                      std::size_t buffer_size,
                      completion_handler_t handler) ZSOCK_OVERRIDE;

    std::string local_address () const ZSOCK_OVERRIDE;
    std::string remote_address () const ZSOCK_OVERRIDE;

    const char *name () const ZSOCK_OVERRIDE { return "tcp"; }

  private:
    boost::asio::ip::tcp::socket _socket;

    //  Cached at construction, the socket may be closed when they are read.
    std::string _local_address;
    std::string _remote_address;

    ZSOCK_NON_COPYABLE_NOR_MOVABLE (tcp_transport_t)
};
}

#endif
