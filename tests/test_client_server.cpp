/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

#include <stdio.h>
#include <stdlib.h>

void setUp ()
{
}

void tearDown ()
{
    teardown_test_sockets ();
}

void test_ping ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);

    async_bind_t *bind = bind_async (server, "tcp://127.0.0.1:0");
    char endpoint[MAX_SOCKET_STRING];
    wait_for_last_endpoint (server, endpoint, sizeof endpoint);
    TEST_ASSERT_TRUE (strncmp (endpoint, "tcp://127.0.0.1:", 16) == 0);
    TEST_ASSERT_NOT_EQUAL (0, atoi (endpoint + 16));

    TEST_ASSERT_SUCCESS_ERRNO (zsock_connect (client, endpoint));

    char address[MAX_SOCKET_STRING];
    TEST_ASSERT_SUCCESS_ERRNO (bind_join (bind, address, sizeof address));
    TEST_ASSERT_EQUAL_STRING (endpoint, address);

    send_string_expect_success (client, "ping", 0);
    recv_string_expect_success (server, "ping", 0);
}

void test_bind_returns_accepted_address_length ()
{
    //  zsock_bind called with a short buffer from the test thread while
    //  the client connects in the background.
    void *server = test_socket (ZSOCK_SERVER);
    const uint16_t port = get_unused_port ();
    char endpoint[MAX_SOCKET_STRING];
    make_endpoint (endpoint, sizeof endpoint, port);

    struct connector_t
    {
        static void run (void *arg_)
        {
            void **args = static_cast<void **> (arg_);
            msleep (100);
            zsock_connect (args[0], static_cast<const char *> (args[1]));
        }
    };
    void *client = test_socket (ZSOCK_CLIENT);
    void *args[2] = {client, endpoint};
    void *thread = zsock_threadstart (connector_t::run, args);

    char address[8];
    size_t address_len = sizeof address;
    TEST_ASSERT_SUCCESS_ERRNO (
      zsock_bind (server, endpoint, address, &address_len));
    zsock_threadclose (thread);

    //  Truncated but NUL-terminated, the full length is reported.
    TEST_ASSERT_EQUAL_size_t (strlen (endpoint), address_len);
    TEST_ASSERT_EQUAL_STRING_LEN (endpoint, address, sizeof address - 1);
    TEST_ASSERT_EQUAL_INT (0, address[sizeof address - 1]);
}

void test_connect_and_bind_append_one_connection ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);

    TEST_ASSERT_EQUAL_INT (0, get_int_option (server, ZSOCK_CONNECTIONS));
    TEST_ASSERT_EQUAL_INT (0, get_int_option (client, ZSOCK_CONNECTIONS));

    connect_pair (server, client);

    TEST_ASSERT_EQUAL_INT (1, get_int_option (server, ZSOCK_CONNECTIONS));
    TEST_ASSERT_EQUAL_INT (1, get_int_option (client, ZSOCK_CONNECTIONS));

    void *server2 = test_socket (ZSOCK_SERVER);
    connect_pair (server2, client);
    TEST_ASSERT_EQUAL_INT (2, get_int_option (client, ZSOCK_CONNECTIONS));
    TEST_ASSERT_EQUAL_INT (1, get_int_option (server2, ZSOCK_CONNECTIONS));
}

void test_send_goes_to_first_connection ()
{
    void *first = test_socket (ZSOCK_SERVER);
    void *second = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);

    connect_pair (first, client);
    connect_pair (second, client);

    for (int i = 0; i < 10; i++)
        send_string_expect_success (client, "to-first", 0);

    for (int i = 0; i < 10; i++)
        recv_string_expect_success (first, "to-first", 0);

    msleep (SETTLE_TIME);
    char buffer[32];
    TEST_ASSERT_FAILURE_ERRNO (
      EAGAIN, zsock_recv (second, buffer, sizeof buffer, ZSOCK_DONTWAIT));
}

void test_body_is_delivered_unchanged ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);
    connect_pair (server, client);

    //  Binary content, including bytes that look like frame headers.
    unsigned char small[256];
    for (size_t i = 0; i < sizeof small; i++)
        small[i] = static_cast<unsigned char> (i);

    //  Large enough for the eight byte size field and several reads.
    const size_t large_size = 300000;
    unsigned char *large = static_cast<unsigned char *> (malloc (large_size));
    TEST_ASSERT_NOT_NULL (large);
    for (size_t i = 0; i < large_size; i++)
        large[i] = static_cast<unsigned char> ((i * 7) ^ (i >> 8));

    TEST_ASSERT_EQUAL_INT (0, zsock_send (client, NULL, 0, 0));
    TEST_ASSERT_EQUAL_INT ((int) sizeof small,
                           zsock_send (client, small, sizeof small, 0));
    TEST_ASSERT_EQUAL_INT ((int) large_size,
                           zsock_send (client, large, large_size, 0));

    zsock_msg_t msg;
    TEST_ASSERT_SUCCESS_ERRNO (zsock_msg_init (&msg));

    TEST_ASSERT_EQUAL_INT (0, zsock_msg_recv (&msg, server, 0));
    TEST_ASSERT_EQUAL_INT (0, zsock_msg_get (&msg, ZSOCK_MSG_ERROR));

    TEST_ASSERT_EQUAL_INT ((int) sizeof small, zsock_msg_recv (&msg, server, 0));
    TEST_ASSERT_EQUAL_MEMORY (small, zsock_msg_data (&msg), sizeof small);

    TEST_ASSERT_EQUAL_INT ((int) large_size, zsock_msg_recv (&msg, server, 0));
    TEST_ASSERT_EQUAL_MEMORY (large, zsock_msg_data (&msg), large_size);
    TEST_ASSERT_EQUAL_INT (ZSOCK_MSG_DATA, zsock_msg_get (&msg, ZSOCK_MSG_KIND));

    TEST_ASSERT_SUCCESS_ERRNO (zsock_msg_close (&msg));
    free (large);
}

void test_recv_truncates_to_buffer ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);
    connect_pair (server, client);

    send_string_expect_success (client, "0123456789", 0);

    char buffer[4];
    TEST_ASSERT_EQUAL_INT (10, zsock_recv (server, buffer, sizeof buffer, 0));
    TEST_ASSERT_EQUAL_MEMORY ("0123", buffer, 4);
}

void test_server_replies ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);
    connect_pair (server, client);

    send_string_expect_success (client, "request", 0);
    recv_string_expect_success (server, "request", 0);
    send_string_expect_success (server, "reply", 0);
    recv_string_expect_success (client, "reply", 0);
}

void test_messages_are_tagged_with_connection ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *first = test_socket (ZSOCK_CLIENT);
    void *second = test_socket (ZSOCK_CLIENT);

    connect_pair (server, first);
    connect_pair (server, second);
    TEST_ASSERT_EQUAL_INT (2, get_int_option (server, ZSOCK_CONNECTIONS));

    send_string_expect_success (second, "two", 0);
    msleep (SETTLE_TIME);
    send_string_expect_success (first, "one", 0);

    zsock_msg_t msg;
    TEST_ASSERT_SUCCESS_ERRNO (zsock_msg_init (&msg));

    TEST_ASSERT_EQUAL_INT (3, zsock_msg_recv (&msg, server, 0));
    TEST_ASSERT_EQUAL_MEMORY ("two", zsock_msg_data (&msg), 3);
    TEST_ASSERT_EQUAL_INT (2, zsock_msg_get (&msg, ZSOCK_MSG_CONNECTION));

    TEST_ASSERT_EQUAL_INT (3, zsock_msg_recv (&msg, server, 0));
    TEST_ASSERT_EQUAL_MEMORY ("one", zsock_msg_data (&msg), 3);
    TEST_ASSERT_EQUAL_INT (1, zsock_msg_get (&msg, ZSOCK_MSG_CONNECTION));

    TEST_ASSERT_SUCCESS_ERRNO (zsock_msg_close (&msg));
}

void test_per_connection_order ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);
    connect_pair (server, client);

    char text[16];
    for (int i = 0; i < 100; i++) {
        snprintf (text, sizeof text, "msg-%d", i);
        send_string_expect_success (client, text, 0);
    }
    for (int i = 0; i < 100; i++) {
        snprintf (text, sizeof text, "msg-%d", i);
        recv_string_expect_success (server, text, 0);
    }
}

void test_send_without_connection ()
{
    void *client = test_socket (ZSOCK_CLIENT);
    void *server = test_socket (ZSOCK_SERVER);

    TEST_ASSERT_FAILURE_ERRNO (ENOTCONN, zsock_send (client, "x", 1, 0));
    TEST_ASSERT_FAILURE_ERRNO (ENOTCONN, zsock_send (server, "x", 1, 0));
}

void test_recv_nothing_queued ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);
    connect_pair (server, client);

    char buffer[16];
    TEST_ASSERT_FAILURE_ERRNO (
      EAGAIN, zsock_recv (server, buffer, sizeof buffer, ZSOCK_DONTWAIT));

    set_int_option (server, ZSOCK_RCVTIMEO, 100);
    void *watch = zsock_stopwatch_start ();
    TEST_ASSERT_FAILURE_ERRNO (EAGAIN,
                               zsock_recv (server, buffer, sizeof buffer, 0));
    const unsigned long elapsed = zsock_stopwatch_stop (watch);
    TEST_ASSERT_TRUE (elapsed >= 90 * 1000);
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_ping);
    RUN_TEST (test_bind_returns_accepted_address_length);
    RUN_TEST (test_connect_and_bind_append_one_connection);
    RUN_TEST (test_send_goes_to_first_connection);
    RUN_TEST (test_body_is_delivered_unchanged);
    RUN_TEST (test_recv_truncates_to_buffer);
    RUN_TEST (test_server_replies);
    RUN_TEST (test_messages_are_tagged_with_connection);
    RUN_TEST (test_per_connection_order);
    RUN_TEST (test_send_without_connection);
    RUN_TEST (test_recv_nothing_queued);
    return UNITY_END ();
}
