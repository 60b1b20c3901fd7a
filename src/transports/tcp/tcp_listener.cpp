/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "transports/tcp/tcp_listener.hpp"
#include "transports/tcp/tcp_transport.hpp"
#include "core/io_thread.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <utility>

zsock::tcp_listener_t::tcp_listener_t (io_thread_t *io_thread_,
                                       const options_t &options_) :
    _io_context (io_thread_->get_io_context ()),
    _acceptor (_io_context),
    _accept_socket (_io_context),
    _outstanding (1),
    _finished (false),
    _rc (0),
    _err (0),
    _transport (NULL)
{
    LIBZSOCK_UNUSED (options_);
}

zsock::tcp_listener_t::~tcp_listener_t ()
{
    ZSOCK_DBG_LISTENER ("destroyed");
    LIBZSOCK_DELETE (_transport);
}

int zsock::tcp_listener_t::set_local_address (const char *addr_)
{
    ZSOCK_DBG_LISTENER ("set_local_address: addr=%s", addr_);

    //  Parse the address
    int rc = _address.parse (addr_, true);
    if (rc != 0)
        return -1;

    boost::asio::ip::tcp::endpoint bind_endpoint;
    rc = _address.resolve_local (_io_context, bind_endpoint);
    if (rc != 0)
        return -1;

    boost::system::error_code ec;

    //  Open the acceptor
    _acceptor.open (bind_endpoint.protocol (), ec);
    if (ec) {
        ZSOCK_DBG_LISTENER ("failed to open acceptor: %s",
                            ec.message ().c_str ());
        errno = error_code_to_errno (ec);
        return -1;
    }

    //  Allow reusing of the address (SO_REUSEADDR)
    _acceptor.set_option (boost::asio::socket_base::reuse_address (true), ec);
    if (ec) {
        ZSOCK_DBG_LISTENER ("failed to set reuse_address: %s",
                            ec.message ().c_str ());
        close ();
        errno = error_code_to_errno (ec);
        return -1;
    }

    //  Bind the acceptor
    _acceptor.bind (bind_endpoint, ec);
    if (ec) {
        ZSOCK_DBG_LISTENER ("failed to bind: %s", ec.message ().c_str ());
        close ();
        errno = error_code_to_errno (ec);
        return -1;
    }

    //  Listen for incoming connections
    _acceptor.listen (boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        ZSOCK_DBG_LISTENER ("failed to listen: %s", ec.message ().c_str ());
        close ();
        errno = error_code_to_errno (ec);
        return -1;
    }

    //  Get endpoint string (this resolves wildcard port)
    const boost::asio::ip::tcp::endpoint local = _acceptor.local_endpoint (ec);
    if (ec) {
        close ();
        errno = error_code_to_errno (ec);
        return -1;
    }
    _endpoint = tcp_endpoint_to_string (local);

    ZSOCK_DBG_LISTENER ("listening on %s", _endpoint.c_str ());
    return 0;
}

int zsock::tcp_listener_t::get_local_address (std::string &addr_) const
{
    addr_ = _endpoint;
    return addr_.empty () ? -1 : 0;
}

int zsock::tcp_listener_t::accept (i_transport **transport_)
{
    zsock_assert (transport_);
    boost::asio::post (_io_context, [this] () { start_accept (); });

    const int rc = _done.wait ();
    if (rc != 0)
        return -1;

    *transport_ = _transport;
    _transport = NULL;
    return 0;
}

void zsock::tcp_listener_t::cancel ()
{
    completion_t applied;
    boost::asio::post (_io_context, [this, &applied] () {
        finish (-1, ETERM);
        applied.set (0, 0);
    });
    applied.wait ();
}

void zsock::tcp_listener_t::start_accept ()
{
    _outstanding--;
    if (_finished || !_acceptor.is_open ()) {
        finish (-1, _finished ? _err : ENOTSOCK);
        check_done ();
        return;
    }

    ZSOCK_DBG_LISTENER ("start_accept: starting async_accept");
    _outstanding++;
    _acceptor.async_accept (
      _accept_socket,
      [this] (const boost::system::error_code &ec) { on_accept (ec); });
}

void zsock::tcp_listener_t::on_accept (const boost::system::error_code &ec_)
{
    _outstanding--;
    ZSOCK_DBG_LISTENER ("on_accept: ec=%s, finished=%d",
                        ec_.message ().c_str (), _finished);

    //  Cancelled - close any socket accepted while shutting down
    if (_finished) {
        if (!ec_) {
            boost::system::error_code ec;
            _accept_socket.close (ec);
        }
        check_done ();
        return;
    }

    if (ec_) {
        finish (-1, error_code_to_errno (ec_));
        return;
    }

    _transport =
      new (std::nothrow) tcp_transport_t (std::move (_accept_socket));
    alloc_assert (_transport);
    finish (0, 0);
}

void zsock::tcp_listener_t::finish (int rc_, int err_)
{
    if (_finished)
        return;

    _finished = true;
    _rc = rc_;
    _err = err_;

    //  Only one connection is accepted; stop listening either way.
    close ();
    check_done ();
}

void zsock::tcp_listener_t::check_done ()
{
    if (_finished && _outstanding == 0)
        _done.set (_rc, _err);
}

void zsock::tcp_listener_t::close ()
{
    if (_acceptor.is_open ()) {
        boost::system::error_code ec;
        _acceptor.close (ec);
    }
}
