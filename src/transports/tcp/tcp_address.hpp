/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_TCP_ADDRESS_HPP_INCLUDED__
#define __ZSOCK_TCP_ADDRESS_HPP_INCLUDED__

#include <boost/asio.hpp>

#include <stdint.h>
#include <string>

namespace zsock
{
//  The "host:port" part of a tcp:// endpoint.

class tcp_address_t
{
  public:
    tcp_address_t ();

    //  Parses "host:port". IPv6 hosts are written in brackets, as in
    //  "[::1]:5555". With local_ set the wildcards "*" (any interface) and
    //  port "*" (ephemeral port) are accepted; a remote address needs a
    //  concrete host and a non-zero port.
    int parse (const char *name_, bool local_);

    //  Resolves the parsed local address synchronously.
    int resolve_local (boost::asio::io_context &io_context_,
                       boost::asio::ip::tcp::endpoint &endpoint_) const;

    const std::string &host () const { return _host; }
    uint16_t port () const { return _port; }
    std::string port_string () const;

    int to_string (std::string &addr_) const;

  private:
    std::string _host;
    uint16_t _port;
    bool _any_host;
};

//  Renders an endpoint as "tcp://host:port".
std::string tcp_endpoint_to_string (const boost::asio::ip::tcp::endpoint &ep_);
}

#endif
