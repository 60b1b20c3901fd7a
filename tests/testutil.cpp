/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

#include <arpa/inet.h>
#include <errno.h>
#include <netinet/in.h>
#include <poll.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/socket.h>
#include <unistd.h>

#include <unity.h>

void setup_test_environment (int timeout_seconds_)
{
    //  Killed by SIGALRM instead of hanging forever.
    alarm (static_cast<unsigned int> (timeout_seconds_));
}

void msleep (int milliseconds_)
{
    zsock_sleep (milliseconds_);
}

static void bind_thread (void *arg_)
{
    async_bind_t *bind = static_cast<async_bind_t *> (arg_);
    bind->address_len = sizeof bind->address;
    bind->rc = zsock_bind (bind->server, bind->endpoint, bind->address,
                           &bind->address_len);
    bind->err = bind->rc == 0 ? 0 : zsock_errno ();
}

async_bind_t *bind_async (void *server_, const char *endpoint_)
{
    async_bind_t *bind = static_cast<async_bind_t *> (calloc (1, sizeof (async_bind_t)));
    TEST_ASSERT_NOT_NULL (bind);
    bind->server = server_;
    TEST_ASSERT_TRUE (strlen (endpoint_) < sizeof bind->endpoint);
    strcpy (bind->endpoint, endpoint_);
    bind->thread = zsock_threadstart (bind_thread, bind);
    return bind;
}

int bind_join (async_bind_t *bind_, char *address_, size_t len_)
{
    zsock_threadclose (bind_->thread);
    const int rc = bind_->rc;
    const int err = bind_->err;
    if (address_ && len_) {
        strncpy (address_, bind_->address, len_ - 1);
        address_[len_ - 1] = '\0';
    }
    free (bind_);
    errno = err;
    return rc;
}

void wait_for_last_endpoint (void *server_, char *endpoint_, size_t len_)
{
    for (int i = 0; i < 1000; i++) {
        size_t size = len_;
        TEST_ASSERT_EQUAL_INT (
          0, zsock_getsockopt (server_, ZSOCK_LAST_ENDPOINT, endpoint_, &size));
        if (endpoint_[0] != '\0')
            return;
        msleep (5);
    }
    TEST_FAIL_MESSAGE ("listener was never bound");
}

void connect_pair (void *server_, void *client_)
{
    async_bind_t *bind = bind_async (server_, ENDPOINT_ANY);

    char endpoint[MAX_SOCKET_STRING];
    wait_for_last_endpoint (server_, endpoint, sizeof endpoint);

    TEST_ASSERT_EQUAL_INT (0, zsock_connect (client_, endpoint));
    TEST_ASSERT_EQUAL_INT (0, bind_join (bind));
}

uint16_t get_unused_port ()
{
    const int fd = socket (AF_INET, SOCK_STREAM, 0);
    TEST_ASSERT_TRUE (fd >= 0);

    struct sockaddr_in addr;
    memset (&addr, 0, sizeof addr);
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl (INADDR_LOOPBACK);
    addr.sin_port = 0;
    TEST_ASSERT_EQUAL_INT (
      0, bind (fd, reinterpret_cast<struct sockaddr *> (&addr), sizeof addr));

    socklen_t addr_len = sizeof addr;
    TEST_ASSERT_EQUAL_INT (
      0, getsockname (fd, reinterpret_cast<struct sockaddr *> (&addr), &addr_len));
    close (fd);
    return ntohs (addr.sin_port);
}

void make_endpoint (char *endpoint_, size_t len_, uint16_t port_)
{
    snprintf (endpoint_, len_, "tcp://127.0.0.1:%u",
              static_cast<unsigned int> (port_));
}

int raw_connect (uint16_t port_)
{
    const int fd = socket (AF_INET, SOCK_STREAM, 0);
    TEST_ASSERT_TRUE (fd >= 0);

    struct sockaddr_in addr;
    memset (&addr, 0, sizeof addr);
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl (INADDR_LOOPBACK);
    addr.sin_port = htons (port_);
    TEST_ASSERT_EQUAL_INT (
      0, connect (fd, reinterpret_cast<struct sockaddr *> (&addr), sizeof addr));
    return fd;
}

int raw_connect (const char *endpoint_)
{
    const char *colon = strrchr (endpoint_, ':');
    TEST_ASSERT_NOT_NULL (colon);
    return raw_connect (static_cast<uint16_t> (atoi (colon + 1)));
}

void raw_send (int fd_, const void *data_, size_t size_)
{
    const char *data = static_cast<const char *> (data_);
    while (size_ > 0) {
        const ssize_t n = send (fd_, data, size_, MSG_NOSIGNAL);
        TEST_ASSERT_TRUE (n > 0);
        data += n;
        size_ -= static_cast<size_t> (n);
    }
}

bool raw_recv_exact (int fd_, void *data_, size_t size_)
{
    char *data = static_cast<char *> (data_);
    while (size_ > 0) {
        const ssize_t n = recv (fd_, data, size_, 0);
        if (n <= 0)
            return false;
        data += n;
        size_ -= static_cast<size_t> (n);
    }
    return true;
}

bool raw_wait_closed (int fd_, int timeout_ms_)
{
    char buf[256];
    for (;;) {
        struct pollfd item;
        item.fd = fd_;
        item.events = POLLIN;
        item.revents = 0;
        const int rc = poll (&item, 1, timeout_ms_);
        if (rc <= 0)
            return false;
        const ssize_t n = recv (fd_, buf, sizeof buf, 0);
        if (n <= 0)
            return true;
    }
}

void raw_close (int fd_)
{
    close (fd_);
}

void raw_make_greeting (unsigned char *greeting_,
                        const char *mechanism_,
                        bool as_server_)
{
    memset (greeting_, 0, 64);
    greeting_[0] = 0xff;
    greeting_[8] = 0x01;
    greeting_[9] = 0x7f;
    greeting_[10] = 3;
    greeting_[11] = 1;
    memcpy (greeting_ + 12, mechanism_, strlen (mechanism_));
    greeting_[32] = as_server_ ? 1 : 0;
}

void raw_send_frame (int fd_,
                     unsigned char flags_,
                     const void *data_,
                     size_t size_)
{
    TEST_ASSERT_TRUE (size_ <= 255);
    unsigned char header[2];
    header[0] = flags_;
    header[1] = static_cast<unsigned char> (size_);
    raw_send (fd_, header, sizeof header);
    if (size_)
        raw_send (fd_, data_, size_);
}

void raw_send_ready (int fd_, const char *socket_type_)
{
    static const char name[] = "Socket-Type";
    const size_t name_len = sizeof name - 1;
    const size_t value_len = strlen (socket_type_);

    unsigned char body[128];
    size_t pos = 0;
    memcpy (body, "\5READY", 6);
    pos += 6;
    body[pos++] = static_cast<unsigned char> (name_len);
    memcpy (body + pos, name, name_len);
    pos += name_len;
    body[pos++] = 0;
    body[pos++] = 0;
    body[pos++] = 0;
    body[pos++] = static_cast<unsigned char> (value_len);
    memcpy (body + pos, socket_type_, value_len);
    pos += value_len;

    raw_send_frame (fd_, 0x04, body, pos);
}

int raw_recv_frame (int fd_, unsigned char *flags_, void *data_, size_t len_)
{
    unsigned char header[2];
    if (!raw_recv_exact (fd_, header, sizeof header))
        return -1;
    *flags_ = header[0];
    if (header[1] > len_)
        return -1;
    if (!raw_recv_exact (fd_, data_, header[1]))
        return -1;
    return header[1];
}
