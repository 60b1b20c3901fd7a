/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/options.hpp"

#include <unity.h>
#include <string.h>
#include <string>

void setUp ()
{
}

void tearDown ()
{
}

static int set_int (zsock::options_t &options_, int option_, int value_)
{
    return options_.setsockopt (option_, &value_, sizeof value_);
}

static int get_int (const zsock::options_t &options_, int option_)
{
    int value = -42;
    size_t len = sizeof value;
    TEST_ASSERT_EQUAL_INT (0, options_.getsockopt (option_, &value, &len));
    TEST_ASSERT_EQUAL_size_t (sizeof value, len);
    return value;
}

void test_defaults ()
{
    const zsock::options_t options;
    TEST_ASSERT_EQUAL_INT (ZSOCK_NULL, options.mechanism);
    TEST_ASSERT_FALSE (options.as_server);
    TEST_ASSERT_EQUAL_INT (250, get_int (options, ZSOCK_RECONNECT_IVL));
    TEST_ASSERT_EQUAL_INT (0, get_int (options, ZSOCK_RECONNECT_IVL_MAX));
    TEST_ASSERT_EQUAL_INT (-1, get_int (options, ZSOCK_DIAL_TIMEOUT));
    TEST_ASSERT_EQUAL_INT (0, get_int (options, ZSOCK_CONNECT_TIMEOUT));
    TEST_ASSERT_EQUAL_INT (30000, get_int (options, ZSOCK_HANDSHAKE_IVL));
    TEST_ASSERT_EQUAL_INT (-1, get_int (options, ZSOCK_RCVTIMEO));
    TEST_ASSERT_TRUE (options.plain_username.empty ());
    TEST_ASSERT_TRUE (options.plain_password.empty ());
}

void test_integer_ranges ()
{
    zsock::options_t options;

    TEST_ASSERT_EQUAL_INT (-1, set_int (options, ZSOCK_RECONNECT_IVL, 0));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
    TEST_ASSERT_EQUAL_INT (0, set_int (options, ZSOCK_RECONNECT_IVL, 1));

    TEST_ASSERT_EQUAL_INT (-1, set_int (options, ZSOCK_RECONNECT_IVL_MAX, -1));
    TEST_ASSERT_EQUAL_INT (0, set_int (options, ZSOCK_RECONNECT_IVL_MAX, 0));

    TEST_ASSERT_EQUAL_INT (-1, set_int (options, ZSOCK_DIAL_TIMEOUT, 0));
    TEST_ASSERT_EQUAL_INT (-1, set_int (options, ZSOCK_DIAL_TIMEOUT, -2));
    TEST_ASSERT_EQUAL_INT (0, set_int (options, ZSOCK_DIAL_TIMEOUT, 1));
    TEST_ASSERT_EQUAL_INT (0, set_int (options, ZSOCK_DIAL_TIMEOUT, -1));

    TEST_ASSERT_EQUAL_INT (-1, set_int (options, ZSOCK_RCVTIMEO, -2));
    TEST_ASSERT_EQUAL_INT (0, set_int (options, ZSOCK_RCVTIMEO, 0));

    TEST_ASSERT_EQUAL_INT (0, set_int (options, ZSOCK_HANDSHAKE_IVL, 0));
    TEST_ASSERT_EQUAL_INT (0, options.handshake_ivl);
}

void test_integer_size_must_match ()
{
    zsock::options_t options;
    const int64_t wide = 100;
    TEST_ASSERT_EQUAL_INT (
      -1, options.setsockopt (ZSOCK_RECONNECT_IVL, &wide, sizeof wide));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
    TEST_ASSERT_EQUAL_INT (-1,
                           options.setsockopt (ZSOCK_RECONNECT_IVL, NULL, 4));

    //  MAXMSGSIZE travels as a 64 bit integer.
    const int narrow = 100;
    TEST_ASSERT_EQUAL_INT (
      -1, options.setsockopt (ZSOCK_MAXMSGSIZE, &narrow, sizeof narrow));
    TEST_ASSERT_EQUAL_INT (
      0, options.setsockopt (ZSOCK_MAXMSGSIZE, &wide, sizeof wide));
    TEST_ASSERT_EQUAL_INT64 (100, options.maxmsgsize);

    const int64_t too_small = -2;
    TEST_ASSERT_EQUAL_INT (
      -1, options.setsockopt (ZSOCK_MAXMSGSIZE, &too_small, sizeof too_small));

    int64_t value = 0;
    size_t len = sizeof value;
    TEST_ASSERT_EQUAL_INT (
      0, options.getsockopt (ZSOCK_MAXMSGSIZE, &value, &len));
    TEST_ASSERT_EQUAL_INT64 (100, value);
}

void test_creation_options_are_read_only ()
{
    zsock::options_t options;
    options.type = ZSOCK_CLIENT;
    TEST_ASSERT_EQUAL_INT (-1, set_int (options, ZSOCK_TYPE, ZSOCK_SERVER));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
    TEST_ASSERT_EQUAL_INT (-1, set_int (options, ZSOCK_MECHANISM, ZSOCK_PLAIN));
    TEST_ASSERT_EQUAL_INT (ZSOCK_CLIENT, get_int (options, ZSOCK_TYPE));
    TEST_ASSERT_EQUAL_INT (ZSOCK_NULL, get_int (options, ZSOCK_MECHANISM));
}

void test_plain_credentials ()
{
    zsock::options_t options;
    TEST_ASSERT_EQUAL_INT (
      0, options.setsockopt (ZSOCK_PLAIN_USERNAME, "admin", 5));
    TEST_ASSERT_EQUAL_STRING ("admin", options.plain_username.c_str ());

    //  A zero length needs a NULL value; that pair clears the credential.
    TEST_ASSERT_EQUAL_INT (-1,
                           options.setsockopt (ZSOCK_PLAIN_USERNAME, "", 0));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
    TEST_ASSERT_EQUAL_STRING ("admin", options.plain_username.c_str ());
    TEST_ASSERT_EQUAL_INT (0,
                           options.setsockopt (ZSOCK_PLAIN_USERNAME, NULL, 0));
    TEST_ASSERT_TRUE (options.plain_username.empty ());

    const std::string longest (255, 'p');
    TEST_ASSERT_EQUAL_INT (0, options.setsockopt (ZSOCK_PLAIN_PASSWORD,
                                                  longest.data (),
                                                  longest.size ()));
    const std::string too_long (256, 'p');
    TEST_ASSERT_EQUAL_INT (-1, options.setsockopt (ZSOCK_PLAIN_PASSWORD,
                                                   too_long.data (),
                                                   too_long.size ()));
    TEST_ASSERT_EQUAL_size_t (255, options.plain_password.size ());
}

void test_string_getsockopt ()
{
    zsock::options_t options;
    TEST_ASSERT_EQUAL_INT (
      0, options.setsockopt (ZSOCK_PLAIN_USERNAME, "admin", 5));

    char buffer[16];
    memset (buffer, 'x', sizeof buffer);
    size_t len = sizeof buffer;
    TEST_ASSERT_EQUAL_INT (
      0, options.getsockopt (ZSOCK_PLAIN_USERNAME, buffer, &len));
    TEST_ASSERT_EQUAL_size_t (6, len);
    TEST_ASSERT_EQUAL_STRING ("admin", buffer);
    TEST_ASSERT_EQUAL_INT (0, buffer[15]);

    //  The terminating zero has to fit as well.
    len = 5;
    TEST_ASSERT_EQUAL_INT (
      -1, options.getsockopt (ZSOCK_PLAIN_USERNAME, buffer, &len));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
}

void test_unknown_option ()
{
    zsock::options_t options;
    TEST_ASSERT_EQUAL_INT (-1, set_int (options, 9999, 1));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);

    int value = 0;
    size_t len = sizeof value;
    TEST_ASSERT_EQUAL_INT (-1, options.getsockopt (9999, &value, &len));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_defaults);
    RUN_TEST (test_integer_ranges);
    RUN_TEST (test_integer_size_must_match);
    RUN_TEST (test_creation_options_are_read_only);
    RUN_TEST (test_plain_credentials);
    RUN_TEST (test_string_getsockopt);
    RUN_TEST (test_unknown_option);
    return UNITY_END ();
}
