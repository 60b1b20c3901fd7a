/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "transports/tcp/tcp_connecter.hpp"
#include "transports/tcp/tcp_transport.hpp"
#include "core/io_thread.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <limits>
#include <utility>

zsock::tcp_connecter_t::tcp_connecter_t (io_thread_t *io_thread_,
                                         const options_t &options_) :
    _io_context (io_thread_->get_io_context ()),
    _options (options_),
    _resolver (_io_context),
    _socket (_io_context),
    _reconnect_timer (_io_context),
    _connect_timer (_io_context),
    _dial_timer (_io_context),
    _outstanding (1),
    _connecting (false),
    _finished (false),
    _rc (0),
    _err (0),
    _current_reconnect_ivl (-1),
    _attempts (0),
    _transport (NULL)
{
}

zsock::tcp_connecter_t::~tcp_connecter_t ()
{
    ZSOCK_DBG_CONN ("destroyed after %d attempts", _attempts);
    LIBZSOCK_DELETE (_transport);
}

int zsock::tcp_connecter_t::set_address (const char *addr_)
{
    const int rc = _address.parse (addr_, false);
    if (rc != 0)
        return -1;
    _address.to_string (_endpoint_str);
    return 0;
}

int zsock::tcp_connecter_t::connect (i_transport **transport_)
{
    zsock_assert (transport_);
    boost::asio::post (_io_context, [this] () { start (); });

    const int rc = _done.wait ();
    if (rc != 0)
        return -1;

    *transport_ = _transport;
    _transport = NULL;
    return 0;
}

void zsock::tcp_connecter_t::cancel ()
{
    completion_t applied;
    boost::asio::post (_io_context, [this, &applied] () {
        finish (-1, ETERM);
        applied.set (0, 0);
    });
    applied.wait ();
}

void zsock::tcp_connecter_t::start ()
{
    _outstanding--;
    if (_finished) {
        check_done ();
        return;
    }

    ZSOCK_DBG_CONN ("dialing %s", _endpoint_str.c_str ());

    if (_options.dial_timeout > 0) {
        _outstanding++;
        _dial_timer.expires_after (
          std::chrono::milliseconds (_options.dial_timeout));
        _dial_timer.async_wait (
          [this] (const boost::system::error_code &ec) { on_dial_timer (ec); });
    }

    start_connecting ();
}

void zsock::tcp_connecter_t::start_connecting ()
{
    _attempts++;
    _outstanding++;
    _resolver.async_resolve (
      _address.host (), _address.port_string (),
      [this] (const boost::system::error_code &ec,
              const boost::asio::ip::tcp::resolver::results_type &results) {
          on_resolve (ec, results);
      });
}

void zsock::tcp_connecter_t::on_resolve (
  const boost::system::error_code &ec_,
  const boost::asio::ip::tcp::resolver::results_type &results_)
{
    _outstanding--;
    if (_finished) {
        check_done ();
        return;
    }

    if (ec_ || results_.empty ()) {
        ZSOCK_DBG_CONN ("resolve failed: %s", ec_.message ().c_str ());
        add_reconnect_timer ();
        return;
    }

    const boost::asio::ip::tcp::endpoint endpoint = results_.begin ()->endpoint ();

    boost::system::error_code ec;
    _socket.open (endpoint.protocol (), ec);
    if (ec) {
        ZSOCK_DBG_CONN ("socket open failed: %s", ec.message ().c_str ());
        add_reconnect_timer ();
        return;
    }

    //  Start the connection
    _outstanding++;
    _connecting = true;
    _socket.async_connect (
      endpoint, [this] (const boost::system::error_code &ec) { on_connect (ec); });

    //  Add userspace connect timeout
    add_connect_timer ();
}

void zsock::tcp_connecter_t::on_connect (const boost::system::error_code &ec_)
{
    _outstanding--;
    _connecting = false;
    _connect_timer.cancel ();

    if (_finished) {
        close ();
        check_done ();
        return;
    }

    if (ec_) {
        //  Connection failed, aborted by the connect timer included
        ZSOCK_DBG_CONN ("attempt %d failed: %s", _attempts,
                        ec_.message ().c_str ());
        close ();
        add_reconnect_timer ();
        return;
    }

    ZSOCK_DBG_CONN ("connected to %s", _endpoint_str.c_str ());
    _transport = new (std::nothrow) tcp_transport_t (std::move (_socket));
    alloc_assert (_transport);
    finish (0, 0);
}

void zsock::tcp_connecter_t::on_connect_timer (
  const boost::system::error_code &ec_)
{
    _outstanding--;
    if (ec_ || _finished || !_connecting) {
        check_done ();
        return;
    }

    //  Connection timed out - closing cancels the async_connect, whose
    //  handler schedules the next attempt.
    ZSOCK_DBG_CONN ("attempt %d timed out", _attempts);
    close ();
}

void zsock::tcp_connecter_t::on_reconnect_timer (
  const boost::system::error_code &ec_)
{
    _outstanding--;
    if (ec_ || _finished) {
        check_done ();
        return;
    }
    start_connecting ();
}

void zsock::tcp_connecter_t::on_dial_timer (const boost::system::error_code &ec_)
{
    _outstanding--;
    if (ec_ || _finished) {
        check_done ();
        return;
    }

    ZSOCK_DBG_CONN ("dial budget of %d ms exhausted", _options.dial_timeout);
    finish (-1, ETIMEDOUT);
}

void zsock::tcp_connecter_t::add_connect_timer ()
{
    if (_options.connect_timeout > 0) {
        _outstanding++;
        _connect_timer.expires_after (
          std::chrono::milliseconds (_options.connect_timeout));
        _connect_timer.async_wait (
          [this] (const boost::system::error_code &ec) { on_connect_timer (ec); });
    }
}

void zsock::tcp_connecter_t::add_reconnect_timer ()
{
    const int interval = get_new_reconnect_ivl ();
    ZSOCK_DBG_CONN ("retrying in %d ms", interval);
    _outstanding++;
    _reconnect_timer.expires_after (std::chrono::milliseconds (interval));
    _reconnect_timer.async_wait (
      [this] (const boost::system::error_code &ec) { on_reconnect_timer (ec); });
}

int zsock::tcp_connecter_t::get_new_reconnect_ivl ()
{
    if (_options.reconnect_ivl_max > 0) {
        int candidate_interval = 0;
        if (_current_reconnect_ivl == -1)
            candidate_interval = _options.reconnect_ivl;
        else if (_current_reconnect_ivl > std::numeric_limits<int>::max () / 2)
            candidate_interval = std::numeric_limits<int>::max ();
        else
            candidate_interval = _current_reconnect_ivl * 2;

        if (candidate_interval > _options.reconnect_ivl_max)
            _current_reconnect_ivl = _options.reconnect_ivl_max;
        else
            _current_reconnect_ivl = candidate_interval;
        return _current_reconnect_ivl;
    }

    //  Without a maximum the interval stays fixed.
    _current_reconnect_ivl = _options.reconnect_ivl;
    return _current_reconnect_ivl;
}

void zsock::tcp_connecter_t::finish (int rc_, int err_)
{
    if (_finished)
        return;

    _finished = true;
    _rc = rc_;
    _err = err_;

    _reconnect_timer.cancel ();
    _connect_timer.cancel ();
    _dial_timer.cancel ();
    _resolver.cancel ();
    close ();

    check_done ();
}

void zsock::tcp_connecter_t::check_done ()
{
    if (_finished && _outstanding == 0)
        _done.set (_rc, _err);
}

void zsock::tcp_connecter_t::close ()
{
    if (_socket.is_open ()) {
        boost::system::error_code ec;
        _socket.close (ec);
    }
}
