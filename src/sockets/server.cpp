/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "sockets/server.hpp"
#include "core/io_thread.hpp"
#include "transports/i_transport.hpp"
#include "transports/tcp/tcp_listener.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

zsock::server_t::server_t (int mechanism_) :
    socket_base_t (ZSOCK_SERVER, mechanism_)
{
    options.as_server = true;
}

zsock::server_t::~server_t ()
{
}

int zsock::server_t::xbind (const std::string &address_,
                            std::string &local_address_)
{
    io_thread_t *io_thread = get_io_thread ();
    if (!io_thread)
        return -1;

    tcp_listener_t listener (io_thread, get_options ());
    if (listener.set_local_address (address_.c_str ()) == -1) {
        const int err = errno;
        ZSOCK_DBG_SOCKET ("listen on %s failed: %s", address_.c_str (),
                          errno_to_string (err));
        errno = err;
        return -1;
    }

    //  Published before accepting so that peers can learn an ephemeral
    //  port while this call is blocked.
    std::string endpoint;
    int rc = listener.get_local_address (endpoint);
    errno_assert (rc == 0);
    set_last_endpoint (endpoint);

    if (register_pending (&listener) == -1)
        return -1;

    i_transport *transport = NULL;
    rc = listener.accept (&transport);
    const int err = errno;
    if (unregister_pending (&listener) == -1) {
        if (rc == 0)
            delete transport;
        return -1;
    }
    if (rc == -1) {
        errno = err;
        return -1;
    }

    //  The address is reported even when the handshake fails.
    local_address_ = transport->local_address ();
    return attach_transport (transport);
}
