/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "sockets/client.hpp"
#include "core/io_thread.hpp"
#include "transports/i_transport.hpp"
#include "transports/tcp/tcp_connecter.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

zsock::client_t::client_t (int mechanism_) :
    socket_base_t (ZSOCK_CLIENT, mechanism_)
{
    options.as_server = false;
}

zsock::client_t::~client_t ()
{
}

int zsock::client_t::xconnect (const std::string &address_)
{
    io_thread_t *io_thread = get_io_thread ();
    if (!io_thread)
        return -1;

    tcp_connecter_t connecter (io_thread, get_options ());
    if (connecter.set_address (address_.c_str ()) == -1)
        return -1;

    if (register_pending (&connecter) == -1)
        return -1;

    i_transport *transport = NULL;
    const int rc = connecter.connect (&transport);
    const int err = errno;
    if (unregister_pending (&connecter) == -1) {
        //  Closed right after the dial completed.
        if (rc == 0)
            delete transport;
        return -1;
    }
    if (rc == -1) {
        ZSOCK_DBG_SOCKET ("dial failed: %s", errno_to_string (err));
        errno = err;
        return -1;
    }

    //  A failed handshake is not redialed.
    return attach_transport (transport);
}
