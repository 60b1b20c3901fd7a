/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

#include <stdlib.h>

void setUp ()
{
}

void tearDown ()
{
    teardown_test_sockets ();
}

void test_address_in_use ()
{
    void *first = test_socket (ZSOCK_SERVER);
    void *second = test_socket (ZSOCK_SERVER);

    async_bind_t *bind = bind_async (first, ENDPOINT_ANY);
    char endpoint[MAX_SOCKET_STRING];
    wait_for_last_endpoint (first, endpoint, sizeof endpoint);

    char address[MAX_SOCKET_STRING];
    strcpy (address, "untouched");
    size_t address_len = sizeof address;
    TEST_ASSERT_FAILURE_ERRNO (
      EADDRINUSE, zsock_bind (second, endpoint, address, &address_len));
    TEST_ASSERT_EQUAL_STRING ("", address);
    TEST_ASSERT_EQUAL_size_t (0, address_len);
    TEST_ASSERT_EQUAL_INT (0, get_int_option (second, ZSOCK_CONNECTIONS));

    //  The failed listener never published an endpoint.
    char last[MAX_SOCKET_STRING];
    size_t last_len = sizeof last;
    TEST_ASSERT_SUCCESS_ERRNO (
      zsock_getsockopt (second, ZSOCK_LAST_ENDPOINT, last, &last_len));
    TEST_ASSERT_EQUAL_STRING ("", last);

    //  The first listener is unaffected.
    void *client = test_socket (ZSOCK_CLIENT);
    TEST_ASSERT_SUCCESS_ERRNO (zsock_connect (client, endpoint));
    TEST_ASSERT_SUCCESS_ERRNO (bind_join (bind));
    TEST_ASSERT_EQUAL_INT (1, get_int_option (first, ZSOCK_CONNECTIONS));
}

void test_listener_accepts_once ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);
    connect_pair (server, client);

    char endpoint[MAX_SOCKET_STRING];
    size_t size = sizeof endpoint;
    TEST_ASSERT_SUCCESS_ERRNO (
      zsock_getsockopt (server, ZSOCK_LAST_ENDPOINT, endpoint, &size));

    //  Nobody listens there any more.
    void *late = test_socket (ZSOCK_CLIENT);
    set_int_option (late, ZSOCK_DIAL_TIMEOUT, 300);
    TEST_ASSERT_FAILURE_ERRNO (ETIMEDOUT, zsock_connect (late, endpoint));
}

void test_wildcard_host ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);

    async_bind_t *bind = bind_async (server, "tcp://*:*");
    char endpoint[MAX_SOCKET_STRING];
    wait_for_last_endpoint (server, endpoint, sizeof endpoint);

    const char *colon = strrchr (endpoint, ':');
    TEST_ASSERT_NOT_NULL (colon);
    const int port = atoi (colon + 1);
    TEST_ASSERT_TRUE (port > 0);

    char loopback[MAX_SOCKET_STRING];
    make_endpoint (loopback, sizeof loopback, static_cast<uint16_t> (port));
    TEST_ASSERT_SUCCESS_ERRNO (zsock_connect (client, loopback));
    TEST_ASSERT_SUCCESS_ERRNO (bind_join (bind));

    send_string_expect_success (client, "any", 0);
    recv_string_expect_success (server, "any", 0);
}

void test_last_endpoint_buffer_too_small ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);
    connect_pair (server, client);

    char endpoint[4];
    size_t size = sizeof endpoint;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zsock_getsockopt (server, ZSOCK_LAST_ENDPOINT, endpoint, &size));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_address_in_use);
    RUN_TEST (test_listener_accepts_once);
    RUN_TEST (test_wildcard_host);
    RUN_TEST (test_last_endpoint_buffer_too_small);
    return UNITY_END ();
}
