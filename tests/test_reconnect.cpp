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

struct connect_call_t
{
    void *client;
    char endpoint[MAX_SOCKET_STRING];
    int rc;
    int err;
    unsigned long elapsed_us;
};

static void connect_thread (void *arg_)
{
    connect_call_t *call = static_cast<connect_call_t *> (arg_);
    void *watch = zsock_stopwatch_start ();
    call->rc = zsock_connect (call->client, call->endpoint);
    call->err = zsock_errno ();
    call->elapsed_us = zsock_stopwatch_stop (watch);
}

void test_connect_before_listen ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);

    connect_call_t call;
    call.client = client;
    make_endpoint (call.endpoint, sizeof call.endpoint, get_unused_port ());
    call.rc = -1;
    call.err = 0;

    void *thread = zsock_threadstart (connect_thread, &call);

    //  A few attempts fail before anybody listens.
    msleep (SETTLE_TIME);
    TEST_ASSERT_EQUAL_INT (0, get_int_option (client, ZSOCK_CONNECTIONS));

    TEST_ASSERT_SUCCESS_ERRNO (zsock_bind (server, call.endpoint, NULL, NULL));
    zsock_threadclose (thread);

    TEST_ASSERT_EQUAL_INT (0, call.rc);
    TEST_ASSERT_EQUAL_INT (1, get_int_option (client, ZSOCK_CONNECTIONS));

    send_string_expect_success (client, "late", 0);
    recv_string_expect_success (server, "late", 0);
}

void test_dial_timeout ()
{
    void *client = test_socket (ZSOCK_CLIENT);
    set_int_option (client, ZSOCK_RECONNECT_IVL, 50);
    set_int_option (client, ZSOCK_DIAL_TIMEOUT, 400);

    char endpoint[MAX_SOCKET_STRING];
    make_endpoint (endpoint, sizeof endpoint, get_unused_port ());

    void *watch = zsock_stopwatch_start ();
    TEST_ASSERT_FAILURE_ERRNO (ETIMEDOUT, zsock_connect (client, endpoint));
    const unsigned long elapsed = zsock_stopwatch_stop (watch);

    TEST_ASSERT_TRUE (elapsed >= 350 * 1000);
    TEST_ASSERT_TRUE (elapsed < 5000 * 1000);
    TEST_ASSERT_EQUAL_INT (0, get_int_option (client, ZSOCK_CONNECTIONS));

    //  The socket is still usable after a failed dial.
    void *server = test_socket (ZSOCK_SERVER);
    set_int_option (client, ZSOCK_DIAL_TIMEOUT, -1);
    connect_pair (server, client);
    TEST_ASSERT_EQUAL_INT (1, get_int_option (client, ZSOCK_CONNECTIONS));
}

void test_backoff_is_capped ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);
    set_int_option (client, ZSOCK_RECONNECT_IVL, 20);
    set_int_option (client, ZSOCK_RECONNECT_IVL_MAX, 100);

    connect_call_t call;
    call.client = client;
    make_endpoint (call.endpoint, sizeof call.endpoint, get_unused_port ());
    call.rc = -1;
    call.err = 0;

    void *thread = zsock_threadstart (connect_thread, &call);

    //  Long enough for the interval to reach its cap several times over.
    msleep (1000);
    void *watch = zsock_stopwatch_start ();
    async_bind_t *bind = bind_async (server, call.endpoint);
    zsock_threadclose (thread);
    const unsigned long waited = zsock_stopwatch_stop (watch);
    TEST_ASSERT_SUCCESS_ERRNO (bind_join (bind));

    TEST_ASSERT_EQUAL_INT (0, call.rc);
    //  Once listening, the next attempt comes within the capped interval.
    TEST_ASSERT_TRUE (waited < 1000 * 1000);
}

void test_connect_timeout_option ()
{
    void *server = test_socket (ZSOCK_SERVER);
    void *client = test_socket (ZSOCK_CLIENT);
    set_int_option (client, ZSOCK_CONNECT_TIMEOUT, 1000);

    connect_pair (server, client);
    send_string_expect_success (client, "bounded", 0);
    recv_string_expect_success (server, "bounded", 0);
}

void test_failed_handshake_is_not_redialed ()
{
    void *server = test_socket (ZSOCK_SERVER, ZSOCK_PLAIN);
    void *client = test_socket (ZSOCK_CLIENT);

    async_bind_t *bind = bind_async (server, ENDPOINT_ANY);
    char endpoint[MAX_SOCKET_STRING];
    wait_for_last_endpoint (server, endpoint, sizeof endpoint);

    TEST_ASSERT_FAILURE_ERRNO (ENOCOMPATPROTO, zsock_connect (client, endpoint));
    TEST_ASSERT_FAILURE_ERRNO (ENOCOMPATPROTO, bind_join (bind));

    TEST_ASSERT_EQUAL_INT (0, get_int_option (client, ZSOCK_CONNECTIONS));
    TEST_ASSERT_EQUAL_INT (0, get_int_option (server, ZSOCK_CONNECTIONS));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_connect_before_listen);
    RUN_TEST (test_dial_timeout);
    RUN_TEST (test_backoff_is_capped);
    RUN_TEST (test_connect_timeout_option);
    RUN_TEST (test_failed_handshake_is_not_redialed);
    return UNITY_END ();
}
