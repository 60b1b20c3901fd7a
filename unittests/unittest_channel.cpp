/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/channel.hpp"
#include "core/msg.hpp"

#include <unity.h>
#include <string.h>

void setUp ()
{
}

void tearDown ()
{
}

static void push_string (zsock::channel_t &channel_,
                         const char *str_,
                         uint32_t connection_id_)
{
    zsock::msg_t msg;
    TEST_ASSERT_EQUAL_INT (0, msg.init_buffer (str_, strlen (str_)));
    msg.set_connection_id (connection_id_);
    channel_.push (&msg);
    //  The content moved into the channel.
    TEST_ASSERT_EQUAL_size_t (0, msg.size ());
    TEST_ASSERT_EQUAL_INT (0, msg.close ());
}

static void expect_string (zsock::channel_t &channel_,
                           const char *str_,
                           uint32_t connection_id_)
{
    zsock::msg_t msg;
    TEST_ASSERT_EQUAL_INT (0, msg.init ());
    TEST_ASSERT_EQUAL_INT (0, channel_.recv (&msg, 0));
    TEST_ASSERT_EQUAL_size_t (strlen (str_), msg.size ());
    TEST_ASSERT_EQUAL_MEMORY (str_, msg.data (), msg.size ());
    TEST_ASSERT_EQUAL_UINT32 (connection_id_, msg.connection_id ());
    TEST_ASSERT_EQUAL_INT (0, msg.close ());
}

void test_fifo_order ()
{
    zsock::channel_t channel;
    push_string (channel, "first", 1);
    push_string (channel, "second", 2);
    push_string (channel, "third", 1);
    TEST_ASSERT_EQUAL_size_t (3, channel.size ());

    expect_string (channel, "first", 1);
    expect_string (channel, "second", 2);
    expect_string (channel, "third", 1);
    TEST_ASSERT_EQUAL_size_t (0, channel.size ());
}

void test_empty_channel_times_out ()
{
    zsock::channel_t channel;
    zsock::msg_t msg;
    TEST_ASSERT_EQUAL_INT (0, msg.init ());

    TEST_ASSERT_EQUAL_INT (-1, channel.recv (&msg, 0));
    TEST_ASSERT_EQUAL_INT (EAGAIN, errno);

    void *watch = zsock_stopwatch_start ();
    TEST_ASSERT_EQUAL_INT (-1, channel.recv (&msg, 100));
    TEST_ASSERT_EQUAL_INT (EAGAIN, errno);
    const unsigned long elapsed = zsock_stopwatch_stop (watch);
    TEST_ASSERT_TRUE (elapsed >= 90 * 1000);

    TEST_ASSERT_EQUAL_INT (0, msg.close ());
}

void test_terminate_drains_queue ()
{
    zsock::channel_t channel;
    push_string (channel, "queued", 7);
    channel.terminate ();
    TEST_ASSERT_TRUE (channel.terminated ());

    expect_string (channel, "queued", 7);

    zsock::msg_t msg;
    TEST_ASSERT_EQUAL_INT (0, msg.init ());
    TEST_ASSERT_EQUAL_INT (-1, channel.recv (&msg, -1));
    TEST_ASSERT_EQUAL_INT (ETERM, errno);
    TEST_ASSERT_EQUAL_INT (0, msg.close ());
}

void test_push_after_terminate_is_dropped ()
{
    zsock::channel_t channel;
    channel.terminate ();

    zsock::msg_t msg;
    TEST_ASSERT_EQUAL_INT (0, msg.init_buffer ("late", 4));
    channel.push (&msg);
    TEST_ASSERT_EQUAL_size_t (0, msg.size ());
    TEST_ASSERT_EQUAL_size_t (0, channel.size ());
    TEST_ASSERT_EQUAL_INT (0, msg.close ());
}

struct blocked_recv_t
{
    zsock::channel_t *channel;
    int rc;
    int err;
    size_t size;
};

static void blocked_recv (void *arg_)
{
    blocked_recv_t *state = static_cast<blocked_recv_t *> (arg_);
    zsock::msg_t msg;
    msg.init ();
    state->rc = state->channel->recv (&msg, -1);
    state->err = errno;
    state->size = msg.size ();
    msg.close ();
}

void test_push_wakes_receiver ()
{
    zsock::channel_t channel;
    blocked_recv_t state = {&channel, 0, 0, 0};
    void *thread = zsock_threadstart (&blocked_recv, &state);

    msleep (50);
    push_string (channel, "wake", 3);
    zsock_threadclose (thread);

    TEST_ASSERT_EQUAL_INT (0, state.rc);
    TEST_ASSERT_EQUAL_size_t (4, state.size);
}

void test_terminate_wakes_receiver ()
{
    zsock::channel_t channel;
    blocked_recv_t state = {&channel, 0, 0, 0};
    void *thread = zsock_threadstart (&blocked_recv, &state);

    msleep (50);
    channel.terminate ();
    zsock_threadclose (thread);

    TEST_ASSERT_EQUAL_INT (-1, state.rc);
    TEST_ASSERT_EQUAL_INT (ETERM, state.err);
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_fifo_order);
    RUN_TEST (test_empty_channel_times_out);
    RUN_TEST (test_terminate_drains_queue);
    RUN_TEST (test_push_after_terminate_is_dropped);
    RUN_TEST (test_push_wakes_receiver);
    RUN_TEST (test_terminate_wakes_receiver);
    return UNITY_END ();
}
