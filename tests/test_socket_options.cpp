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

void test_defaults ()
{
    void *client = test_socket (ZSOCK_CLIENT);

    TEST_ASSERT_EQUAL_INT (250, get_int_option (client, ZSOCK_RECONNECT_IVL));
    TEST_ASSERT_EQUAL_INT (0, get_int_option (client, ZSOCK_RECONNECT_IVL_MAX));
    TEST_ASSERT_EQUAL_INT (-1, get_int_option (client, ZSOCK_DIAL_TIMEOUT));
    TEST_ASSERT_EQUAL_INT (0, get_int_option (client, ZSOCK_CONNECT_TIMEOUT));
    TEST_ASSERT_EQUAL_INT (30000, get_int_option (client, ZSOCK_HANDSHAKE_IVL));
    TEST_ASSERT_EQUAL_INT (-1, get_int_option (client, ZSOCK_RCVTIMEO));
    TEST_ASSERT_EQUAL_INT (0, get_int_option (client, ZSOCK_CONNECTIONS));

    int64_t maxmsgsize = 0;
    size_t size = sizeof maxmsgsize;
    TEST_ASSERT_SUCCESS_ERRNO (
      zsock_getsockopt (client, ZSOCK_MAXMSGSIZE, &maxmsgsize, &size));
    TEST_ASSERT_EQUAL_INT64 (-1, maxmsgsize);

    char endpoint[MAX_SOCKET_STRING];
    size = sizeof endpoint;
    TEST_ASSERT_SUCCESS_ERRNO (
      zsock_getsockopt (client, ZSOCK_LAST_ENDPOINT, endpoint, &size));
    TEST_ASSERT_EQUAL_STRING ("", endpoint);
    TEST_ASSERT_EQUAL_size_t (1, size);
}

void test_retry_interval_is_per_socket ()
{
    void *first = test_socket (ZSOCK_CLIENT);
    void *second = test_socket (ZSOCK_CLIENT);

    set_int_option (first, ZSOCK_RECONNECT_IVL, 1000);
    TEST_ASSERT_EQUAL_INT (1000, get_int_option (first, ZSOCK_RECONNECT_IVL));
    TEST_ASSERT_EQUAL_INT (250, get_int_option (second, ZSOCK_RECONNECT_IVL));
}

void test_invalid_values ()
{
    void *client = test_socket (ZSOCK_CLIENT);

    int value = 0;
    TEST_ASSERT_FAILURE_ERRNO (EINVAL,
                               zsock_setsockopt (client, ZSOCK_RECONNECT_IVL,
                                                 &value, sizeof value));
    value = -1;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL,
      zsock_setsockopt (client, ZSOCK_RECONNECT_IVL_MAX, &value, sizeof value));
    value = -2;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zsock_setsockopt (client, ZSOCK_DIAL_TIMEOUT, &value, sizeof value));
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zsock_setsockopt (client, ZSOCK_RCVTIMEO, &value, sizeof value));

    //  Wrong size.
    short small = 100;
    TEST_ASSERT_FAILURE_ERRNO (EINVAL,
                               zsock_setsockopt (client, ZSOCK_RECONNECT_IVL,
                                                 &small, sizeof small));
    value = 100;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zsock_setsockopt (client, ZSOCK_MAXMSGSIZE, &value, sizeof value));

    //  Unchanged by the failures.
    TEST_ASSERT_EQUAL_INT (250, get_int_option (client, ZSOCK_RECONNECT_IVL));
}

void test_read_only_options ()
{
    void *client = test_socket (ZSOCK_CLIENT);

    int value = ZSOCK_SERVER;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zsock_setsockopt (client, ZSOCK_TYPE, &value, sizeof value));
    value = ZSOCK_PLAIN;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zsock_setsockopt (client, ZSOCK_MECHANISM, &value, sizeof value));
    value = 3;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zsock_setsockopt (client, ZSOCK_CONNECTIONS, &value, sizeof value));
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zsock_setsockopt (client, ZSOCK_LAST_ENDPOINT, "tcp://x:1", 9));

    TEST_ASSERT_EQUAL_INT (ZSOCK_CLIENT, get_int_option (client, ZSOCK_TYPE));
}

void test_plain_credentials ()
{
    void *client = test_socket (ZSOCK_CLIENT, ZSOCK_PLAIN);

    TEST_ASSERT_SUCCESS_ERRNO (
      zsock_setsockopt (client, ZSOCK_PLAIN_USERNAME, "admin", 5));

    char username[32];
    size_t size = sizeof username;
    TEST_ASSERT_SUCCESS_ERRNO (
      zsock_getsockopt (client, ZSOCK_PLAIN_USERNAME, username, &size));
    TEST_ASSERT_EQUAL_STRING ("admin", username);
    TEST_ASSERT_EQUAL_size_t (6, size);

    //  Cleared with an empty value.
    TEST_ASSERT_SUCCESS_ERRNO (
      zsock_setsockopt (client, ZSOCK_PLAIN_USERNAME, NULL, 0));
    size = sizeof username;
    TEST_ASSERT_SUCCESS_ERRNO (
      zsock_getsockopt (client, ZSOCK_PLAIN_USERNAME, username, &size));
    TEST_ASSERT_EQUAL_STRING ("", username);

    char too_long[256];
    memset (too_long, 'a', sizeof too_long);
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zsock_setsockopt (client, ZSOCK_PLAIN_PASSWORD, too_long,
                                sizeof too_long));
    TEST_ASSERT_SUCCESS_ERRNO (zsock_setsockopt (client, ZSOCK_PLAIN_PASSWORD,
                                                 too_long, 255));
}

void test_unknown_option ()
{
    void *client = test_socket (ZSOCK_CLIENT);

    int value = 1;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, zsock_setsockopt (client, 9999, &value, sizeof value));
    size_t size = sizeof value;
    TEST_ASSERT_FAILURE_ERRNO (EINVAL,
                               zsock_getsockopt (client, 9999, &value, &size));
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_defaults);
    RUN_TEST (test_retry_interval_is_per_socket);
    RUN_TEST (test_invalid_values);
    RUN_TEST (test_read_only_options);
    RUN_TEST (test_plain_credentials);
    RUN_TEST (test_unknown_option);
    return UNITY_END ();
}
