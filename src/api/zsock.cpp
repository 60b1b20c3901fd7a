/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"

#include <string.h>
#include <stdlib.h>
#include <new>
#include <climits>
#include <string>

#include "core/msg.hpp"
#include "sockets/socket_base.hpp"
#include "utils/err.hpp"
#include "utils/likely.hpp"
#include "utils/macros.hpp"

void zsock_version (int *major_, int *minor_, int *patch_)
{
    *major_ = ZSOCK_VERSION_MAJOR;
    *minor_ = ZSOCK_VERSION_MINOR;
    *patch_ = ZSOCK_VERSION_PATCH;
}

const char *zsock_strerror (int errnum_)
{
    return zsock::errno_to_string (errnum_);
}

int zsock_errno (void)
{
    return errno;
}

// Sockets

struct socket_handle_t
{
    zsock::socket_base_t *socket;
};

static inline socket_handle_t as_socket_handle (void *s_)
{
    socket_handle_t handle;
    handle.socket = NULL;

    if (!s_) {
        errno = ENOTSOCK;
        return handle;
    }

    zsock::socket_base_t *s = static_cast<zsock::socket_base_t *> (s_);
    if (!s->check_tag ()) {
        errno = ENOTSOCK;
        return handle;
    }

    handle.socket = s;
    return handle;
}

void *zsock_socket (int type_, int mechanism_)
{
    zsock::socket_base_t *s = zsock::socket_base_t::create (type_, mechanism_);
    return static_cast<void *> (s);
}

void *zsock_client_new (int mechanism_)
{
    return zsock_socket (ZSOCK_CLIENT, mechanism_);
}

void *zsock_server_new (int mechanism_)
{
    return zsock_socket (ZSOCK_SERVER, mechanism_);
}

int zsock_close (void *s_)
{
    socket_handle_t handle = as_socket_handle (s_);
    if (!handle.socket)
        return -1;
    return handle.socket->close ();
}

int zsock_destroy (void *s_)
{
    socket_handle_t handle = as_socket_handle (s_);
    if (!handle.socket)
        return -1;
    delete handle.socket;
    return 0;
}

int zsock_setsockopt (void *s_,
                      int option_,
                      const void *optval_,
                      size_t optvallen_)
{
    socket_handle_t handle = as_socket_handle (s_);
    if (!handle.socket)
        return -1;
    return handle.socket->setsockopt (option_, optval_, optvallen_);
}

int zsock_getsockopt (void *s_, int option_, void *optval_, size_t *optvallen_)
{
    socket_handle_t handle = as_socket_handle (s_);
    if (!handle.socket)
        return -1;
    return handle.socket->getsockopt (option_, optval_, optvallen_);
}

int zsock_connect (void *s_, const char *endpoint_)
{
    socket_handle_t handle = as_socket_handle (s_);
    if (!handle.socket)
        return -1;
    if (unlikely (!endpoint_)) {
        errno = EINVAL;
        return -1;
    }
    return handle.socket->connect (endpoint_);
}

int zsock_bind (void *s_,
                const char *endpoint_,
                char *addr_,
                size_t *addr_len_)
{
    socket_handle_t handle = as_socket_handle (s_);
    if (!handle.socket)
        return -1;
    if (unlikely (!endpoint_ || (addr_ && !addr_len_))) {
        errno = EINVAL;
        return -1;
    }

    std::string local_address;
    const int rc = handle.socket->bind (endpoint_, local_address);
    const int err = errno;

    //  The address is handed back on failure too, possibly empty.
    if (addr_) {
        if (*addr_len_ > 0) {
            const size_t to_copy = local_address.size () < *addr_len_ - 1
                                     ? local_address.size ()
                                     : *addr_len_ - 1;
            memcpy (addr_, local_address.c_str (), to_copy);
            addr_[to_copy] = '\0';
        }
        *addr_len_ = local_address.size ();
    }

    errno = err;
    return rc;
}

// Sending functions.

int zsock_send (void *s_, const void *buf_, size_t len_, int flags_)
{
    socket_handle_t handle = as_socket_handle (s_);
    if (!handle.socket)
        return -1;

    const int rc = handle.socket->send (buf_, len_, flags_);
    if (unlikely (rc < 0))
        return -1;

    return static_cast<int> (len_ < INT_MAX ? len_ : INT_MAX);
}

// Receiving functions.

static int s_recvmsg (socket_handle_t handle_, zsock_msg_t *msg_, int flags_)
{
    int rc =
      handle_.socket->recv (reinterpret_cast<zsock::msg_t *> (msg_), flags_);
    if (unlikely (rc < 0))
        return -1;

    const size_t sz = zsock_msg_size (msg_);
    return static_cast<int> (sz < INT_MAX ? sz : INT_MAX);
}

int zsock_recv (void *s_, void *buf_, size_t len_, int flags_)
{
    socket_handle_t handle = as_socket_handle (s_);
    if (!handle.socket)
        return -1;
    zsock_msg_t msg;
    int rc = zsock_msg_init (&msg);
    errno_assert (rc == 0);

    const int nbytes = s_recvmsg (handle, &msg, flags_);
    if (unlikely (nbytes < 0)) {
        const int err = errno;
        zsock_msg_close (&msg);
        errno = err;
        return -1;
    }

    //  The body is truncated to the buffer, the full size is returned.
    const size_t to_copy = size_t (nbytes) < len_ ? size_t (nbytes) : len_;
    if (to_copy) {
        memcpy (buf_, zsock_msg_data (&msg), to_copy);
    }
    zsock_msg_close (&msg);

    return nbytes;
}

int zsock_msg_recv (zsock_msg_t *msg_, void *s_, int flags_)
{
    socket_handle_t handle = as_socket_handle (s_);
    if (!handle.socket)
        return -1;
    return s_recvmsg (handle, msg_, flags_);
}

// Message manipulators.

int zsock_msg_init (zsock_msg_t *msg_)
{
    return (reinterpret_cast<zsock::msg_t *> (msg_))->init ();
}

int zsock_msg_init_size (zsock_msg_t *msg_, size_t size_)
{
    return (reinterpret_cast<zsock::msg_t *> (msg_))->init_size (size_);
}

int zsock_msg_close (zsock_msg_t *msg_)
{
    return (reinterpret_cast<zsock::msg_t *> (msg_))->close ();
}

int zsock_msg_move (zsock_msg_t *dest_, zsock_msg_t *src_)
{
    return (reinterpret_cast<zsock::msg_t *> (dest_))
      ->move (*reinterpret_cast<zsock::msg_t *> (src_));
}

void *zsock_msg_data (zsock_msg_t *msg_)
{
    return (reinterpret_cast<zsock::msg_t *> (msg_))->data ();
}

size_t zsock_msg_size (const zsock_msg_t *msg_)
{
    return (reinterpret_cast<const zsock::msg_t *> (msg_))->size ();
}

int zsock_msg_get (const zsock_msg_t *msg_, int property_)
{
    const zsock::msg_t *msg = reinterpret_cast<const zsock::msg_t *> (msg_);
    switch (property_) {
        case ZSOCK_MSG_KIND:
            return msg->is_command () ? ZSOCK_MSG_COMMAND : ZSOCK_MSG_DATA;
        case ZSOCK_MSG_CONNECTION:
            return static_cast<int> (msg->connection_id ());
        case ZSOCK_MSG_ERROR:
            return msg->err ();
        default:
            errno = EINVAL;
            return -1;
    }
}
