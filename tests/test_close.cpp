/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"
#include "testutil_unity.hpp"

void setUp ()
{
}

void tearDown ()
{
    teardown_test_sockets ();
}

struct blocked_call_t
{
    void *socket;
    char endpoint[MAX_SOCKET_STRING];
    int rc;
    int err;
};

static void connect_thread (void *arg_)
{
    blocked_call_t *call = static_cast<blocked_call_t *> (arg_);
    call->rc = zsock_connect (call->socket, call->endpoint);
    call->err = zsock_errno ();
}

static void recv_thread (void *arg_)
{
    blocked_call_t *call = static_cast<blocked_call_t *> (arg_);
    char buffer[16];
    call->rc = zsock_recv (call->socket, buffer, sizeof buffer, 0);
    call->err = zsock_errno ();
}

void test_close_twice ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);
    connect_pair (server, client);

    TEST_ASSERT_SUCCESS_ERRNO (zsock_close (client));
    TEST_ASSERT_SUCCESS_ERRNO (zsock_close (client));

    //  Records are kept after close.
    TEST_ASSERT_EQUAL_INT (1, get_int_option (client, ZSOCK_CONNECTIONS));

    //  Destroying a closed socket does not close anything again.
    test_socket_destroy (client);
}

void test_close_without_connections ()
{
    void *client = test_socket (ZSOCK_CLIENT);
    TEST_ASSERT_SUCCESS_ERRNO (zsock_close (client));
    TEST_ASSERT_SUCCESS_ERRNO (zsock_close (client));
}

void test_peer_observes_close ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);
    connect_pair (server, client);

    TEST_ASSERT_SUCCESS_ERRNO (zsock_close (client));

    //  The closed transport surfaces as one error message on the peer.
    zsock_msg_t msg;
    TEST_ASSERT_SUCCESS_ERRNO (zsock_msg_init (&msg));
    TEST_ASSERT_FAILURE_ERRNO (EPIPE, zsock_msg_recv (&msg, server, 0));
    TEST_ASSERT_EQUAL_INT (EPIPE, zsock_msg_get (&msg, ZSOCK_MSG_ERROR));
    TEST_ASSERT_EQUAL_INT (1, zsock_msg_get (&msg, ZSOCK_MSG_CONNECTION));
    TEST_ASSERT_SUCCESS_ERRNO (zsock_msg_close (&msg));

    //  The receive loop stopped after the error.
    char buffer[16];
    set_int_option (server, ZSOCK_RCVTIMEO, 100);
    TEST_ASSERT_FAILURE_ERRNO (EAGAIN,
                               zsock_recv (server, buffer, sizeof buffer, 0));
}

void test_operations_after_close ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);
    connect_pair (server, client);

    TEST_ASSERT_SUCCESS_ERRNO (zsock_close (client));
    TEST_ASSERT_SUCCESS_ERRNO (zsock_close (server));

    char endpoint[MAX_SOCKET_STRING];
    make_endpoint (endpoint, sizeof endpoint, get_unused_port ());

    TEST_ASSERT_FAILURE_ERRNO (ETERM, zsock_send (client, "x", 1, 0));
    TEST_ASSERT_FAILURE_ERRNO (ETERM, zsock_connect (client, endpoint));
    TEST_ASSERT_FAILURE_ERRNO (ETERM, zsock_send (server, "x", 1, 0));
    TEST_ASSERT_FAILURE_ERRNO (ETERM,
                               zsock_bind (server, endpoint, NULL, NULL));
    TEST_ASSERT_EQUAL_INT (1, get_int_option (server, ZSOCK_CONNECTIONS));

    int ivl = 100;
    TEST_ASSERT_FAILURE_ERRNO (
      ETERM, zsock_setsockopt (client, ZSOCK_RECONNECT_IVL, &ivl, sizeof ivl));
}

void test_close_cancels_connect ()
{
    void *client = test_socket (ZSOCK_CLIENT);

    blocked_call_t call;
    call.socket = client;
    make_endpoint (call.endpoint, sizeof call.endpoint, get_unused_port ());
    call.rc = 0;
    call.err = 0;

    //  Nothing listens, so the default unbounded dial keeps retrying.
    void *thread = zsock_threadstart (connect_thread, &call);
    msleep (SETTLE_TIME);

    TEST_ASSERT_SUCCESS_ERRNO (zsock_close (client));
    zsock_threadclose (thread);

    TEST_ASSERT_EQUAL_INT (-1, call.rc);
    TEST_ASSERT_EQUAL_INT (ETERM, call.err);
    TEST_ASSERT_EQUAL_INT (0, get_int_option (client, ZSOCK_CONNECTIONS));
}

void test_close_cancels_bind ()
{
    void *server = test_socket (ZSOCK_SERVER);

    async_bind_t *bind = bind_async (server, ENDPOINT_ANY);
    char endpoint[MAX_SOCKET_STRING];
    wait_for_last_endpoint (server, endpoint, sizeof endpoint);

    TEST_ASSERT_SUCCESS_ERRNO (zsock_close (server));

    char address[MAX_SOCKET_STRING];
    TEST_ASSERT_FAILURE_ERRNO (ETERM, bind_join (bind, address, sizeof address));
    TEST_ASSERT_EQUAL_STRING ("", address);
    TEST_ASSERT_EQUAL_INT (0, get_int_option (server, ZSOCK_CONNECTIONS));

    //  The listener is gone.
    void *client = test_socket (ZSOCK_CLIENT);
    set_int_option (client, ZSOCK_DIAL_TIMEOUT, 300);
    TEST_ASSERT_FAILURE_ERRNO (ETIMEDOUT, zsock_connect (client, endpoint));
}

void test_close_wakes_recv ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);
    connect_pair (server, client);

    blocked_call_t call;
    call.socket = server;
    call.rc = 0;
    call.err = 0;
    void *thread = zsock_threadstart (recv_thread, &call);
    msleep (SETTLE_TIME);

    TEST_ASSERT_SUCCESS_ERRNO (zsock_close (server));
    zsock_threadclose (thread);

    TEST_ASSERT_EQUAL_INT (-1, call.rc);
    TEST_ASSERT_EQUAL_INT (ETERM, call.err);
}

void test_queued_messages_survive_close ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);
    connect_pair (server, client);

    send_string_expect_success (client, "first", 0);
    send_string_expect_success (client, "second", 0);
    msleep (SETTLE_TIME);

    TEST_ASSERT_SUCCESS_ERRNO (zsock_close (server));

    //  Closing stops the receive loop without an error message.
    recv_string_expect_success (server, "first", 0);
    recv_string_expect_success (server, "second", 0);

    char buffer[16];
    TEST_ASSERT_FAILURE_ERRNO (ETERM,
                               zsock_recv (server, buffer, sizeof buffer, 0));
    TEST_ASSERT_FAILURE_ERRNO (
      ETERM, zsock_recv (server, buffer, sizeof buffer, ZSOCK_DONTWAIT));
}

void test_destroy_without_close ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);
    connect_pair (server, client);

    send_string_expect_success (client, "pending", 0);
    test_socket_destroy (server);
    test_socket_destroy (client);
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_close_twice);
    RUN_TEST (test_close_without_connections);
    RUN_TEST (test_peer_observes_close);
    RUN_TEST (test_operations_after_close);
    RUN_TEST (test_close_cancels_connect);
    RUN_TEST (test_close_cancels_bind);
    RUN_TEST (test_close_wakes_recv);
    RUN_TEST (test_queued_messages_survive_close);
    RUN_TEST (test_destroy_without_close);
    return UNITY_END ();
}
