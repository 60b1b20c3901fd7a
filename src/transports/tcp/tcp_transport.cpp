/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "transports/tcp/tcp_transport.hpp"
#include "transports/tcp/tcp_address.hpp"
#include "utils/debug.hpp"

#include <utility>

zsock::tcp_transport_t::tcp_transport_t (boost::asio::ip::tcp::socket socket_) :
    _socket (std::move (socket_))
{
    boost::system::error_code ec;
    _socket.set_option (boost::asio::ip::tcp::no_delay (true), ec);
    if (ec)
        ZSOCK_DBG_CONN ("set no_delay failed: %s", ec.message ().c_str ());

    const boost::asio::ip::tcp::endpoint local = _socket.local_endpoint (ec);
    if (!ec)
        _local_address = tcp_endpoint_to_string (local);
    const boost::asio::ip::tcp::endpoint remote = _socket.remote_endpoint (ec);
    if (!ec)
        _remote_address = tcp_endpoint_to_string (remote);
}

zsock::tcp_transport_t::~tcp_transport_t ()
{
    close ();
}

bool zsock::tcp_transport_t::is_open () const
{
    return _socket.is_open ();
}

void zsock::tcp_transport_t::close ()
{
    if (_socket.is_open ()) {
        boost::system::error_code ec;
        _socket.shutdown (boost::asio::ip::tcp::socket::shutdown_both, ec);
        //  Ignore close errors
        _socket.close (ec);
    }
}

void zsock::tcp_transport_t::async_read_some (unsigned char *buffer,
                                              std::size_t buffer_size,
                                              completion_handler_t handler)
{
    _socket.async_read_some (boost::asio::buffer (buffer, buffer_size),
                             handler);
}

void zsock::tcp_transport_t::async_read (unsigned char *buffer,
                                         std::size_t buffer_size,
                                         completion_handler_t handler)
{
    boost::asio::async_read (_socket, boost::asio::buffer (buffer, buffer_size),
                             handler);
}

void zsock::tcp_transport_t::async_write (const unsigned char *buffer,
                                          std::size_t buffer_size,
                                          completion_handler_t handler)
{
    boost::asio::async_write (_socket, boost::asio::buffer (buffer, buffer_size),
                              handler);
}

std::string zsock::tcp_transport_t::local_address () const
{
    return _local_address;
}

std::string zsock::tcp_transport_t::remote_address () const
{
    return _remote_address;
}
