/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "sockets/socket_base.hpp"
#include "sockets/client.hpp"
#include "sockets/server.hpp"
#include "core/address.hpp"
#include "core/connection.hpp"
#include "core/i_pending_op.hpp"
#include "core/io_thread.hpp"
#include "core/msg.hpp"
#include "engine/zmtp_engine.hpp"
#include "transports/i_transport.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <limits.h>
#include <new>

static const uint32_t socket_tag_value = 0xbaddecaf;

zsock::socket_base_t *zsock::socket_base_t::create (int type_, int mechanism_)
{
    if (mechanism_ != ZSOCK_NULL && mechanism_ != ZSOCK_PLAIN) {
        errno = EINVAL;
        return NULL;
    }

    socket_base_t *s = NULL;
    switch (type_) {
        case ZSOCK_CLIENT:
            s = new (std::nothrow) client_t (mechanism_);
            break;
        case ZSOCK_SERVER:
            s = new (std::nothrow) server_t (mechanism_);
            break;
        default:
            errno = EINVAL;
            return NULL;
    }

    alloc_assert (s);
    return s;
}

zsock::socket_base_t::socket_base_t (int type_, int mechanism_) :
    _tag (socket_tag_value),
    _io_thread (NULL),
    _closed (false)
{
    options.type = type_;
    options.mechanism = mechanism_;
}

zsock::socket_base_t::~socket_base_t ()
{
    const int rc = close ();
    errno_assert (rc == 0);

    //  Every transport is closed, stop the loop before releasing the
    //  objects its handlers referred to.
    if (_io_thread)
        _io_thread->stop ();

    for (connections_t::size_type i = 0, size = _connections.size ();
         i != size; ++i)
        LIBZSOCK_DELETE (_connections[i]);
    _connections.clear ();

    LIBZSOCK_DELETE (_io_thread);

    //  Remove the tag so that the object can't be used as a socket any more.
    _tag = 0xdeadbeef;
}

bool zsock::socket_base_t::check_tag () const
{
    return _tag == socket_tag_value;
}

int zsock::socket_base_t::setsockopt (int option_,
                                      const void *optval_,
                                      size_t optvallen_)
{
    scoped_lock_t lock (_sync);

    if (unlikely (_closed)) {
        errno = ETERM;
        return -1;
    }
    return options.setsockopt (option_, optval_, optvallen_);
}

int zsock::socket_base_t::getsockopt (int option_,
                                      void *optval_,
                                      size_t *optvallen_)
{
    scoped_lock_t lock (_sync);

    if (option_ == ZSOCK_LAST_ENDPOINT)
        return do_getsockopt (optval_, optvallen_, _last_endpoint);

    if (option_ == ZSOCK_CONNECTIONS) {
        const int count = static_cast<int> (_connections.size ());
        return do_getsockopt (optval_, optvallen_, &count, sizeof count);
    }

    return options.getsockopt (option_, optval_, optvallen_);
}

int zsock::socket_base_t::connect (const char *endpoint_)
{
    //  Only the role decides; the endpoint is not even looked at.
    if (options.as_server) {
        errno = EROLE;
        return -1;
    }

    std::string protocol;
    std::string address;
    if (address_t::parse (endpoint_, protocol, address) == -1)
        return -1;

    ZSOCK_DBG_SOCKET ("connect %s", endpoint_);
    return xconnect (address);
}

int zsock::socket_base_t::bind (const char *endpoint_,
                                std::string &local_address_)
{
    local_address_.clear ();

    if (!options.as_server) {
        errno = EROLE;
        return -1;
    }

    std::string protocol;
    std::string address;
    if (address_t::parse (endpoint_, protocol, address) == -1)
        return -1;

    ZSOCK_DBG_SOCKET ("bind %s", endpoint_);
    return xbind (address, local_address_);
}

int zsock::socket_base_t::xconnect (const std::string &address_)
{
    LIBZSOCK_UNUSED (address_);
    errno = EROLE;
    return -1;
}

int zsock::socket_base_t::xbind (const std::string &address_,
                                 std::string &local_address_)
{
    LIBZSOCK_UNUSED (address_);
    LIBZSOCK_UNUSED (local_address_);
    errno = EROLE;
    return -1;
}

int zsock::socket_base_t::send (const void *data_, size_t size_, int flags_)
{
    //  Every send blocks until written, there is nothing to wait for.
    LIBZSOCK_UNUSED (flags_);

    if (unlikely (size_ && !data_)) {
        errno = EFAULT;
        return -1;
    }

    i_engine *engine = NULL;
    {
        scoped_lock_t lock (_sync);
        if (unlikely (_closed)) {
            errno = ETERM;
            return -1;
        }
        if (_connections.empty ()) {
            errno = ENOTCONN;
            return -1;
        }
        //  Connections are never removed before the socket is destroyed.
        engine = _connections.front ()->engine ();
    }

    if (engine->send_frame (data_, size_) == -1) {
        int err = errno;
        scoped_lock_t lock (_sync);
        if (_closed)
            err = ETERM;
        ZSOCK_DBG_SOCKET ("send failed: %s", errno_to_string (err));
        errno = err;
        return -1;
    }
    return 0;
}

int zsock::socket_base_t::recv (msg_t *msg_, int flags_)
{
    if (unlikely (!msg_ || !msg_->check ())) {
        errno = EFAULT;
        return -1;
    }

    int timeout;
    {
        scoped_lock_t lock (_sync);
        timeout = (flags_ & ZSOCK_DONTWAIT) ? 0 : options.rcvtimeo;
    }

    //  After close the queued messages are still handed out, then the
    //  terminated channel fails with ETERM.
    if (_inbound.recv (msg_, timeout) == -1)
        return -1;

    if (msg_->err () != 0) {
        errno = msg_->err ();
        return -1;
    }
    return 0;
}

int zsock::socket_base_t::close ()
{
    scoped_lock_t lock (_sync);

    if (_closed)
        return 0;
    _closed = true;

    ZSOCK_DBG_SOCKET ("close: %d connections, %d pending operations",
                      static_cast<int> (_connections.size ()),
                      static_cast<int> (_pending.size ()));

    //  Blocked connects, binds and handshakes fail with ETERM. The
    //  operations stay alive until their callers unregister them, which
    //  needs this lock.
    for (pending_ops_t::iterator it = _pending.begin (); it != _pending.end ();
         ++it)
        (*it)->cancel ();

    for (connections_t::size_type i = 0, size = _connections.size ();
         i != size; ++i)
        _connections[i]->close ();

    _inbound.terminate ();
    return 0;
}

zsock::io_thread_t *zsock::socket_base_t::get_io_thread ()
{
    scoped_lock_t lock (_sync);

    if (unlikely (_closed)) {
        errno = ETERM;
        return NULL;
    }

    if (!_io_thread) {
        _io_thread = new (std::nothrow) io_thread_t;
        alloc_assert (_io_thread);
        _io_thread->start ();
    }
    return _io_thread;
}

int zsock::socket_base_t::register_pending (i_pending_op *op_)
{
    scoped_lock_t lock (_sync);

    if (unlikely (_closed)) {
        errno = ETERM;
        return -1;
    }
    _pending.insert (op_);
    return 0;
}

int zsock::socket_base_t::unregister_pending (i_pending_op *op_)
{
    scoped_lock_t lock (_sync);

    _pending.erase (op_);
    if (unlikely (_closed)) {
        errno = ETERM;
        return -1;
    }
    return 0;
}

int zsock::socket_base_t::attach_transport (i_transport *transport_)
{
    io_thread_t *io_thread = get_io_thread ();
    if (!io_thread) {
        transport_->close ();
        delete transport_;
        return -1;
    }

    const options_t opts = get_options ();

    zmtp_engine_t *engine =
      new (std::nothrow) zmtp_engine_t (io_thread, transport_, opts);
    alloc_assert (engine);

    if (register_pending (engine) == -1) {
        delete engine;
        return -1;
    }

    int rc = engine->prepare (opts.mechanism, opts.type, opts.as_server, NULL,
                              NULL);
    const int err = errno;
    const int unregister_rc = unregister_pending (engine);
    if (rc == -1 || unregister_rc == -1) {
        //  Whatever went wrong, the transport must not outlive the attempt.
        engine->close ();
        delete engine;
        errno = rc == -1 ? err : ETERM;
        return -1;
    }

    scoped_lock_t lock (_sync);

    if (unlikely (_closed)) {
        engine->close ();
        delete engine;
        errno = ETERM;
        return -1;
    }

    const uint32_t id = static_cast<uint32_t> (_connections.size () + 1);
    connection_t *connection = new (std::nothrow) connection_t (
      id, engine, engine->local_address (), engine->remote_address ());
    alloc_assert (connection);
    _connections.push_back (connection);

    ZSOCK_DBG_SOCKET ("connection %u established with %s", id,
                      connection->remote_address ().c_str ());

    //  Started under the lock so that close posts its teardown after it.
    engine->recv (&_inbound, id);
    return 0;
}

void zsock::socket_base_t::set_last_endpoint (const std::string &endpoint_)
{
    scoped_lock_t lock (_sync);
    _last_endpoint = endpoint_;
}

zsock::options_t zsock::socket_base_t::get_options ()
{
    scoped_lock_t lock (_sync);
    return options;
}
