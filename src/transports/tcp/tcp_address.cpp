/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "transports/tcp/tcp_address.hpp"
#include "core/address.hpp"
#include "utils/err.hpp"

#include <cstring>
#include <cstdlib>
#include <sstream>

zsock::tcp_address_t::tcp_address_t () : _port (0), _any_host (false)
{
}

int zsock::tcp_address_t::parse (const char *name_, bool local_)
{
    //  Expected format: host:port
    //  Examples:
    //    127.0.0.1:5555
    //    localhost:5555
    //    [::1]:5555 (IPv6)
    //    *:* (wildcard bind)

    const char *pos = name_;

    //  Handle IPv6 address in brackets
    if (*pos == '[') {
        const char *bracket = strchr (pos, ']');
        if (!bracket || bracket[1] != ':') {
            errno = EINVAL;
            return -1;
        }
        _host.assign (pos + 1, bracket - pos - 1);
        pos = bracket + 2;
    } else {
        //  IPv4 or hostname; the last colon separates host from port
        const char *colon = strrchr (pos, ':');
        if (!colon) {
            errno = EINVAL;
            return -1;
        }
        _host.assign (pos, colon - pos);
        pos = colon + 1;
    }

    _any_host = _host == "*";
    if (_host.empty () || (_any_host && !local_)) {
        errno = EINVAL;
        return -1;
    }

    //  Parse port number (handle wildcard '*' for ephemeral port)
    if (pos[0] == '*' && pos[1] == '\0') {
        if (!local_) {
            errno = EINVAL;
            return -1;
        }
        _port = 0;
        return 0;
    }

    char *endptr = NULL;
    errno = 0;
    const long port = strtol (pos, &endptr, 10);
    if (*pos == '\0' || *endptr != '\0' || errno != 0 || port < 0
        || port > 65535 || (port == 0 && !local_)) {
        errno = EINVAL;
        return -1;
    }
    _port = static_cast<uint16_t> (port);
    return 0;
}

int zsock::tcp_address_t::resolve_local (
  boost::asio::io_context &io_context_,
  boost::asio::ip::tcp::endpoint &endpoint_) const
{
    if (_any_host) {
        endpoint_ = boost::asio::ip::tcp::endpoint (boost::asio::ip::tcp::v4 (),
                                                    _port);
        return 0;
    }

    boost::system::error_code ec;
    const boost::asio::ip::address address =
      boost::asio::ip::make_address (_host, ec);
    if (!ec) {
        endpoint_ = boost::asio::ip::tcp::endpoint (address, _port);
        return 0;
    }

    //  Not a literal; look the name up.
    boost::asio::ip::tcp::resolver resolver (io_context_);
    const boost::asio::ip::tcp::resolver::results_type results =
      resolver.resolve (_host, port_string (), ec);
    if (ec || results.empty ()) {
        errno = ENODEV;
        return -1;
    }
    endpoint_ = results.begin ()->endpoint ();
    return 0;
}

std::string zsock::tcp_address_t::port_string () const
{
    std::stringstream s;
    s << _port;
    return s.str ();
}

int zsock::tcp_address_t::to_string (std::string &addr_) const
{
    if (_host.empty ()) {
        addr_.clear ();
        return -1;
    }

    std::stringstream s;
    s << protocol_name::tcp << "://";
    if (_host.find (':') != std::string::npos)
        s << "[" << _host << "]";
    else
        s << _host;
    s << ":" << _port;
    addr_ = s.str ();
    return 0;
}

std::string
zsock::tcp_endpoint_to_string (const boost::asio::ip::tcp::endpoint &ep_)
{
    std::stringstream s;
    s << protocol_name::tcp << "://";
    if (ep_.address ().is_v6 ())
        s << "[" << ep_.address ().to_string () << "]";
    else
        s << ep_.address ().to_string ();
    s << ":" << ep_.port ();
    return s.str ();
}
