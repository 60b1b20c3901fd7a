/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_TCP_LISTENER_HPP_INCLUDED__
#define __ZSOCK_TCP_LISTENER_HPP_INCLUDED__

#include <boost/asio.hpp>
#include <string>

#include "core/i_pending_op.hpp"
#include "core/options.hpp"
#include "transports/tcp/tcp_address.hpp"
#include "utils/completion.hpp"
#include "utils/macros.hpp"

namespace zsock
{
class io_thread_t;
class i_transport;

//  Listens on a TCP endpoint and accepts exactly one connection. The
//  listening socket is closed once that connection has been accepted.

class tcp_listener_t ZSOCK_FINAL : public i_pending_op
{
  public:
    tcp_listener_t (io_thread_t *io_thread_, const options_t &options_);
    ~tcp_listener_t ();

    //  Set address to listen on. Opens, binds and starts listening right
    //  away, so errors like EADDRINUSE are reported here.
    int set_local_address (const char *addr_);

    //  Get the bound address for use with wildcards
    int get_local_address (std::string &addr_) const;

    //  Blocks until a peer connects and stores its transport in
    //  transport_. Fails with ETERM when cancelled. Must be called exactly
    //  once, after set_local_address succeeded.
    int accept (i_transport **transport_);

    //  i_pending_op implementation.
    void cancel () ZSOCK_OVERRIDE;

  private:
    //  Handlers running on the I/O thread.
    void start_accept ();
    void on_accept (const boost::system::error_code &ec_);

    void finish (int rc_, int err_);
    void check_done ();

    //  Close the listening socket
    void close ();

    boost::asio::io_context &_io_context;

    //  The ASIO acceptor for handling incoming connections
    boost::asio::ip::tcp::acceptor _acceptor;

    //  Socket for the accepted connection
    boost::asio::ip::tcp::socket _accept_socket;

    //  Address to listen on.
    tcp_address_t _address;

    //  String representation of the bound endpoint
    std::string _endpoint;

    //  Outstanding asynchronous operations, including the initial start.
    int _outstanding;

    bool _finished;
    int _rc;
    int _err;

    //  Connection handed over to the caller on success.
    i_transport *_transport;

    completion_t _done;

    ZSOCK_NON_COPYABLE_NOR_MOVABLE (tcp_listener_t)
};
}

#endif
