/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/address.hpp"
#include "transports/tcp/tcp_address.hpp"

#include <boost/asio.hpp>
#include <unity.h>
#include <string>

void setUp ()
{
}

void tearDown ()
{
}

void test_split_endpoint ()
{
    std::string protocol;
    std::string address;
    TEST_ASSERT_EQUAL_INT (
      0, zsock::address_t::parse ("tcp://127.0.0.1:5555", protocol, address));
    TEST_ASSERT_EQUAL_STRING ("tcp", protocol.c_str ());
    TEST_ASSERT_EQUAL_STRING ("127.0.0.1:5555", address.c_str ());

    zsock::address_t endpoint (protocol, address);
    std::string text;
    TEST_ASSERT_EQUAL_INT (0, endpoint.to_string (text));
    TEST_ASSERT_EQUAL_STRING ("tcp://127.0.0.1:5555", text.c_str ());
}

static void expect_parse_error (const char *endpoint_, int err_)
{
    std::string protocol = "unchanged";
    std::string address = "unchanged";
    TEST_ASSERT_EQUAL_INT (-1,
                           zsock::address_t::parse (endpoint_, protocol, address));
    TEST_ASSERT_EQUAL_INT (err_, errno);
    TEST_ASSERT_EQUAL_STRING ("unchanged", protocol.c_str ());
}

void test_malformed_endpoints ()
{
    expect_parse_error (NULL, EINVAL);
    expect_parse_error ("", EINVAL);
    expect_parse_error ("127.0.0.1:5555", EINVAL);
    expect_parse_error ("tcp:/127.0.0.1:5555", EINVAL);
    expect_parse_error ("://127.0.0.1:5555", EINVAL);
    expect_parse_error ("tcp://", EINVAL);
    expect_parse_error ("tcp://host://5555", EINVAL);
}

void test_unsupported_scheme ()
{
    expect_parse_error ("ipc:///tmp/feeds/0", EPROTONOSUPPORT);
    expect_parse_error ("ws://127.0.0.1:80", EPROTONOSUPPORT);
    expect_parse_error ("TCP://127.0.0.1:80", EPROTONOSUPPORT);
}

void test_tcp_remote_address ()
{
    zsock::tcp_address_t address;
    TEST_ASSERT_EQUAL_INT (0, address.parse ("localhost:80", false));
    TEST_ASSERT_EQUAL_STRING ("localhost", address.host ().c_str ());
    TEST_ASSERT_EQUAL_UINT16 (80, address.port ());
    TEST_ASSERT_EQUAL_STRING ("80", address.port_string ().c_str ());

    TEST_ASSERT_EQUAL_INT (0, address.parse ("[::1]:5555", false));
    TEST_ASSERT_EQUAL_STRING ("::1", address.host ().c_str ());
    std::string text;
    TEST_ASSERT_EQUAL_INT (0, address.to_string (text));
    TEST_ASSERT_EQUAL_STRING ("tcp://[::1]:5555", text.c_str ());
}

void test_tcp_remote_address_errors ()
{
    zsock::tcp_address_t address;
    TEST_ASSERT_EQUAL_INT (-1, address.parse ("127.0.0.1", false));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
    TEST_ASSERT_EQUAL_INT (-1, address.parse ("127.0.0.1:0", false));
    TEST_ASSERT_EQUAL_INT (-1, address.parse ("127.0.0.1:*", false));
    TEST_ASSERT_EQUAL_INT (-1, address.parse ("*:5555", false));
    TEST_ASSERT_EQUAL_INT (-1, address.parse ("127.0.0.1:65536", false));
    TEST_ASSERT_EQUAL_INT (-1, address.parse ("127.0.0.1:12ab", false));
    TEST_ASSERT_EQUAL_INT (-1, address.parse ("[::1:5555", false));
    TEST_ASSERT_EQUAL_INT (-1, address.parse (":5555", false));
}

void test_tcp_local_address ()
{
    boost::asio::io_context io_context;
    boost::asio::ip::tcp::endpoint endpoint;

    zsock::tcp_address_t address;
    TEST_ASSERT_EQUAL_INT (0, address.parse ("*:*", true));
    TEST_ASSERT_EQUAL_UINT16 (0, address.port ());
    TEST_ASSERT_EQUAL_INT (0, address.resolve_local (io_context, endpoint));
    TEST_ASSERT_TRUE (endpoint.address ().is_unspecified ());

    TEST_ASSERT_EQUAL_INT (0, address.parse ("127.0.0.1:0", true));
    TEST_ASSERT_EQUAL_INT (0, address.resolve_local (io_context, endpoint));
    TEST_ASSERT_TRUE (endpoint.address ().is_loopback ());
    TEST_ASSERT_EQUAL_UINT16 (0, endpoint.port ());

    TEST_ASSERT_EQUAL_INT (0, address.parse ("[::1]:7000", true));
    TEST_ASSERT_EQUAL_INT (0, address.resolve_local (io_context, endpoint));
    TEST_ASSERT_TRUE (endpoint.address ().is_v6 ());
    TEST_ASSERT_EQUAL_UINT16 (7000, endpoint.port ());
}

void test_endpoint_to_string ()
{
    const boost::asio::ip::tcp::endpoint v4 (
      boost::asio::ip::make_address ("10.0.0.1"), 1234);
    TEST_ASSERT_EQUAL_STRING ("tcp://10.0.0.1:1234",
                              zsock::tcp_endpoint_to_string (v4).c_str ());

    const boost::asio::ip::tcp::endpoint v6 (
      boost::asio::ip::make_address ("::1"), 1234);
    TEST_ASSERT_EQUAL_STRING ("tcp://[::1]:1234",
                              zsock::tcp_endpoint_to_string (v6).c_str ());
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_split_endpoint);
    RUN_TEST (test_malformed_endpoints);
    RUN_TEST (test_unsupported_scheme);
    RUN_TEST (test_tcp_remote_address);
    RUN_TEST (test_tcp_remote_address_errors);
    RUN_TEST (test_tcp_local_address);
    RUN_TEST (test_endpoint_to_string);
    return UNITY_END ();
}
