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

static void set_credentials (void *socket_,
                             const char *username_,
                             const char *password_)
{
    TEST_ASSERT_SUCCESS_ERRNO (zsock_setsockopt (
      socket_, ZSOCK_PLAIN_USERNAME, username_, strlen (username_)));
    TEST_ASSERT_SUCCESS_ERRNO (zsock_setsockopt (
      socket_, ZSOCK_PLAIN_PASSWORD, password_, strlen (password_)));
}

//  Runs one handshake and reports the results of both sides.
static void handshake (void *server_, void *client_, int *server_rc_,
                       int *server_err_, int *client_rc_, int *client_err_)
{
    async_bind_t *bind = bind_async (server_, ENDPOINT_ANY);
    char endpoint[MAX_SOCKET_STRING];
    wait_for_last_endpoint (server_, endpoint, sizeof endpoint);

    *client_rc_ = zsock_connect (client_, endpoint);
    *client_err_ = *client_rc_ == 0 ? 0 : zsock_errno ();
    *server_rc_ = bind_join (bind);
    *server_err_ = *server_rc_ == 0 ? 0 : errno;
}

void test_valid_credentials ()
{
    void *server = test_socket (ZSOCK_SERVER, ZSOCK_PLAIN);
    void *client = test_socket (ZSOCK_CLIENT, ZSOCK_PLAIN);
    set_credentials (server, "admin", "password");
    set_credentials (client, "admin", "password");

    int server_rc, server_err, client_rc, client_err;
    handshake (server, client, &server_rc, &server_err, &client_rc,
               &client_err);
    TEST_ASSERT_EQUAL_INT (0, client_rc);
    TEST_ASSERT_EQUAL_INT (0, server_rc);

    send_string_expect_success (client, "secret", 0);
    recv_string_expect_success (server, "secret", 0);
}

void test_wrong_password ()
{
    void *server = test_socket (ZSOCK_SERVER, ZSOCK_PLAIN);
    void *client = test_socket (ZSOCK_CLIENT, ZSOCK_PLAIN);
    set_credentials (server, "admin", "password");
    set_credentials (client, "admin", "bogus");

    int server_rc, server_err, client_rc, client_err;
    handshake (server, client, &server_rc, &server_err, &client_rc,
               &client_err);
    TEST_ASSERT_EQUAL_INT (-1, client_rc);
    TEST_ASSERT_EQUAL_INT (EACCES, client_err);
    TEST_ASSERT_EQUAL_INT (-1, server_rc);
    TEST_ASSERT_EQUAL_INT (EACCES, server_err);

    TEST_ASSERT_EQUAL_INT (0, get_int_option (client, ZSOCK_CONNECTIONS));
    TEST_ASSERT_EQUAL_INT (0, get_int_option (server, ZSOCK_CONNECTIONS));
}

void test_wrong_username ()
{
    void *server = test_socket (ZSOCK_SERVER, ZSOCK_PLAIN);
    void *client = test_socket (ZSOCK_CLIENT, ZSOCK_PLAIN);
    set_credentials (server, "admin", "password");
    set_credentials (client, "guest", "password");

    int server_rc, server_err, client_rc, client_err;
    handshake (server, client, &server_rc, &server_err, &client_rc,
               &client_err);
    TEST_ASSERT_EQUAL_INT (EACCES, client_err);
    TEST_ASSERT_EQUAL_INT (EACCES, server_err);
}

void test_server_without_username_accepts_anyone ()
{
    void *server = test_socket (ZSOCK_SERVER, ZSOCK_PLAIN);
    void *client = test_socket (ZSOCK_CLIENT, ZSOCK_PLAIN);
    set_credentials (client, "whoever", "whatever");

    int server_rc, server_err, client_rc, client_err;
    handshake (server, client, &server_rc, &server_err, &client_rc,
               &client_err);
    TEST_ASSERT_EQUAL_INT (0, client_rc);
    TEST_ASSERT_EQUAL_INT (0, server_rc);
}

void test_mechanism_mismatch ()
{
    void *server = test_socket (ZSOCK_SERVER, ZSOCK_NULL);
    void *client = test_socket (ZSOCK_CLIENT, ZSOCK_PLAIN);
    set_credentials (client, "admin", "password");

    int server_rc, server_err, client_rc, client_err;
    handshake (server, client, &server_rc, &server_err, &client_rc,
               &client_err);
    TEST_ASSERT_EQUAL_INT (ENOCOMPATPROTO, client_err);
    TEST_ASSERT_EQUAL_INT (ENOCOMPATPROTO, server_err);
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_valid_credentials);
    RUN_TEST (test_wrong_password);
    RUN_TEST (test_wrong_username);
    RUN_TEST (test_server_without_username_accepts_anyone);
    RUN_TEST (test_mechanism_mismatch);
    return UNITY_END ();
}
