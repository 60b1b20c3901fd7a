/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_TCP_CONNECTER_HPP_INCLUDED__
#define __ZSOCK_TCP_CONNECTER_HPP_INCLUDED__

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

//  Dials a TCP endpoint from the I/O thread, retrying failed attempts after
//  the reconnect interval until a connection is made, the dial budget runs
//  out or the attempt is cancelled.

class tcp_connecter_t ZSOCK_FINAL : public i_pending_op
{
  public:
    tcp_connecter_t (io_thread_t *io_thread_, const options_t &options_);
    ~tcp_connecter_t ();

    //  Set the address to connect to. Fails with EINVAL on a malformed
    //  address.
    int set_address (const char *addr_);

    //  Blocks until a connection is established and stores its transport
    //  in transport_. Fails with ETIMEDOUT when ZSOCK_DIAL_TIMEOUT expires
    //  and with ETERM when cancelled. Must be called exactly once.
    int connect (i_transport **transport_);

    //  i_pending_op implementation.
    void cancel () ZSOCK_OVERRIDE;

  private:
    //  Handlers running on the I/O thread.
    void start ();
    void start_connecting ();
    void on_resolve (
      const boost::system::error_code &ec_,
      const boost::asio::ip::tcp::resolver::results_type &results_);
    void on_connect (const boost::system::error_code &ec_);
    void on_connect_timer (const boost::system::error_code &ec_);
    void on_reconnect_timer (const boost::system::error_code &ec_);
    void on_dial_timer (const boost::system::error_code &ec_);

    //  Internal function to add a reconnect timer
    void add_reconnect_timer ();

    //  Internal function to add a connect timer
    void add_connect_timer ();

    //  Internal function to return a reconnect backoff delay.
    //  Will modify the current_reconnect_ivl used for next call
    //  Returns the currently used interval
    int get_new_reconnect_ivl ();

    //  Stores the result and aborts every outstanding operation.
    void finish (int rc_, int err_);

    //  Signals the caller once finished and nothing is outstanding.
    void check_done ();

    //  Close the connecting socket.
    void close ();

    boost::asio::io_context &_io_context;

    //  Copy of the socket options at the time connect was called.
    const options_t _options;

    //  Address to connect to.
    tcp_address_t _address;
    std::string _endpoint_str;

    boost::asio::ip::tcp::resolver _resolver;
    boost::asio::ip::tcp::socket _socket;
    boost::asio::steady_timer _reconnect_timer;
    boost::asio::steady_timer _connect_timer;
    boost::asio::steady_timer _dial_timer;

    //  Number of started asynchronous operations whose handler has not run
    //  yet, including the initial start.
    int _outstanding;

    bool _connecting;
    bool _finished;
    int _rc;
    int _err;

    //  Current reconnect ivl, updated for backoff strategy
    int _current_reconnect_ivl;

    //  Number of attempts made so far.
    int _attempts;

    //  Connection handed over to the caller on success.
    i_transport *_transport;

    completion_t _done;

    ZSOCK_NON_COPYABLE_NOR_MOVABLE (tcp_connecter_t)
};
}

#endif
