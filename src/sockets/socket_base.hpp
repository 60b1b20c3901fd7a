/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_SOCKET_BASE_HPP_INCLUDED__
#define __ZSOCK_SOCKET_BASE_HPP_INCLUDED__

#include <set>
#include <string>
#include <vector>

#include <stddef.h>
#include <stdint.h>

#include "core/channel.hpp"
#include "core/options.hpp"
#include "utils/macros.hpp"
#include "utils/mutex.hpp"

namespace zsock
{
class connection_t;
class io_thread_t;
class i_transport;
class msg_t;
struct i_pending_op;

class socket_base_t
{
  public:
    //  Create a socket of the specified type. Returns NULL with errno set
    //  to EINVAL when the type or the mechanism is unknown.
    static socket_base_t *create (int type_, int mechanism_);

    virtual ~socket_base_t ();

    //  Returns false if object is not a socket.
    bool check_tag () const;

    //  Interface for communication with the API layer.
    int setsockopt (int option_, const void *optval_, size_t optvallen_);
    int getsockopt (int option_, void *optval_, size_t *optvallen_);
    int connect (const char *endpoint_);
    int bind (const char *endpoint_, std::string &local_address_);
    int send (const void *data_, size_t size_, int flags_);
    int recv (msg_t *msg_, int flags_);
    int close ();

  protected:
    socket_base_t (int type_, int mechanism_);

    //  Role specific parts of connect and bind. The address has already
    //  been split off its scheme. Fail with EROLE by default.
    virtual int xconnect (const std::string &address_);
    virtual int xbind (const std::string &address_,
                       std::string &local_address_);

    //  Returns the I/O thread, starting it on first use. Fails with ETERM
    //  once the socket is closed.
    io_thread_t *get_io_thread ();

    //  Tracks a blocking operation so that close can cancel it. Register
    //  fails with ETERM when the socket is already closed; unregister
    //  fails with ETERM when it was closed in the meantime.
    int register_pending (i_pending_op *op_);
    int unregister_pending (i_pending_op *op_);

    //  Runs the handshake on a freshly connected transport, which is always
    //  consumed. On success a connection is appended and starts delivering
    //  into the inbound channel.
    int attach_transport (i_transport *transport_);

    //  Publishes the endpoint a listener is bound to.
    void set_last_endpoint (const std::string &endpoint_);

    //  Copy of the options under the socket lock.
    options_t get_options ();

    //  Socket options.
    options_t options;

  private:
    //  Used to check whether the object is a socket.
    uint32_t _tag;

    //  Guards everything below but the inbound channel.
    mutex_t _sync;

    //  Connections in the order they were established.
    typedef std::vector<connection_t *> connections_t;
    connections_t _connections;

    //  Connects, binds and handshakes in progress.
    typedef std::set<i_pending_op *> pending_ops_t;
    pending_ops_t _pending;

    io_thread_t *_io_thread;

    bool _closed;

    std::string _last_endpoint;

    //  Messages of every connection, tagged with the connection id.
    channel_t _inbound;

    ZSOCK_NON_COPYABLE_NOR_MOVABLE (socket_base_t)
};
}

#endif
