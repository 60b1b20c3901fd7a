/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TESTUTIL_HPP_INCLUDED__
#define __TESTUTIL_HPP_INCLUDED__

#include "zsock.h"

#include <stddef.h>
#include <stdint.h>

//  Time in milliseconds given to the background threads of a socket to
//  pick up something that was just sent or closed.
#define SETTLE_TIME 300

#define MAX_SOCKET_STRING 256

//  Binding to port '*' lets the OS pick an ephemeral port, which is then
//  read back through ZSOCK_LAST_ENDPOINT.
#define ENDPOINT_ANY "tcp://127.0.0.1:*"

//  Aborts a hanging test binary after timeout_seconds_.
void setup_test_environment (int timeout_seconds_ = 60);

void msleep (int milliseconds_);

//  zsock_bind blocks until a peer has connected, so tests run it in a
//  background thread.
struct async_bind_t
{
    void *server;
    char endpoint[MAX_SOCKET_STRING];
    char address[MAX_SOCKET_STRING];
    size_t address_len;
    int rc;
    int err;
    void *thread;
};

async_bind_t *bind_async (void *server_, const char *endpoint_);

//  Joins the bind thread and returns its result, errno is set to the error
//  of a failed bind. The struct is released.
int bind_join (async_bind_t *bind_, char *address_ = NULL, size_t len_ = 0);

//  Polls ZSOCK_LAST_ENDPOINT until the listener of server_ is bound.
void wait_for_last_endpoint (void *server_, char *endpoint_, size_t len_);

//  Binds server_ in the background and connects client_ to it, returning
//  once both calls succeeded.
void connect_pair (void *server_, void *client_);

//  A TCP port on the loopback interface that nothing listens on.
uint16_t get_unused_port ();

void make_endpoint (char *endpoint_, size_t len_, uint16_t port_);

//  Plain POSIX TCP peers, for speaking raw ZMTP to a socket.
int raw_connect (uint16_t port_);
int raw_connect (const char *endpoint_);
void raw_send (int fd_, const void *data_, size_t size_);
//  Reads exactly size_ bytes, returns false on EOF or error.
bool raw_recv_exact (int fd_, void *data_, size_t size_);
//  Reads and drops everything until EOF or error, returns true then.
bool raw_wait_closed (int fd_, int timeout_ms_);
void raw_close (int fd_);

//  ZMTP 3.1 building blocks for raw peers.
void raw_make_greeting (unsigned char *greeting_,
                        const char *mechanism_,
                        bool as_server_);
//  Writes a short (<= 255 bytes) frame.
void raw_send_frame (int fd_,
                     unsigned char flags_,
                     const void *data_,
                     size_t size_);
//  Writes a READY command announcing socket_type_.
void raw_send_ready (int fd_, const char *socket_type_);
//  Reads one short frame, returns its size or -1.
int raw_recv_frame (int fd_, unsigned char *flags_, void *data_, size_t len_);

#endif
