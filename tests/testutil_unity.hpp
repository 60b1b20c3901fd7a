/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TESTUTIL_UNITY_HPP_INCLUDED__
#define __TESTUTIL_UNITY_HPP_INCLUDED__

#include "testutil.hpp"

#include <unity.h>

#include <string.h>

//  Checks that a zsock call returned a non-negative value, printing the
//  library's error string otherwise.
int test_assert_success_message_errno_helper (int rc_,
                                              const char *msg_,
                                              const char *expr_,
                                              int line_);

#define TEST_ASSERT_SUCCESS_MESSAGE_ERRNO(expr, msg)                           \
    test_assert_success_message_errno_helper (expr, msg, #expr, __LINE__)

#define TEST_ASSERT_SUCCESS_ERRNO(expr)                                        \
    test_assert_success_message_errno_helper (expr, NULL, #expr, __LINE__)

//  Checks that a zsock call failed with the given errno.
#define TEST_ASSERT_FAILURE_ERRNO(error_code, expr)                            \
    {                                                                          \
        int _rc = (expr);                                                      \
        TEST_ASSERT_EQUAL_INT (-1, _rc);                                       \
        TEST_ASSERT_EQUAL_INT (error_code, errno);                             \
    }

void send_string_expect_success (void *socket_, const char *str_, int flags_);

void recv_string_expect_success (void *socket_, const char *str_, int flags_);

//  Sockets created through these are destroyed by teardown_test_sockets,
//  also when a test fails half way through.
void *test_socket (int type_, int mechanism_ = ZSOCK_NULL);
void test_socket_destroy (void *socket_);
void teardown_test_sockets ();

void set_int_option (void *socket_, int option_, int value_);
int get_int_option (void *socket_, int option_);

#endif
