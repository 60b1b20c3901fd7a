/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/msg.hpp"
#include "protocol/frame_decoder.hpp"
#include "protocol/frame_encoder.hpp"
#include "protocol/zmtp_protocol.hpp"

#include <unity.h>
#include <string.h>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

void test_short_frame ()
{
    zsock::frame_decoder_t decoder (-1);
    const unsigned char wire[] = {0x00, 0x03, 'a', 'b', 'c', 0x00};

    size_t processed = 0;
    const int rc = decoder.decode (wire, sizeof wire, processed);
    TEST_ASSERT_EQUAL_INT (1, rc);
    TEST_ASSERT_EQUAL_size_t (5, processed);
    TEST_ASSERT_FALSE (decoder.more ());
    TEST_ASSERT_FALSE (decoder.msg ()->is_command ());
    TEST_ASSERT_EQUAL_size_t (3, decoder.msg ()->size ());
    TEST_ASSERT_EQUAL_MEMORY ("abc", decoder.msg ()->data (), 3);
}

void test_byte_by_byte ()
{
    zsock::frame_decoder_t decoder (-1);
    const unsigned char wire[] = {0x01, 0x02, 'h', 'i', 0x04, 0x01, 'x'};

    int frames = 0;
    for (size_t i = 0; i < sizeof wire; i++) {
        size_t processed = 0;
        const int rc = decoder.decode (wire + i, 1, processed);
        TEST_ASSERT_EQUAL_size_t (1, processed);
        if (rc == 1) {
            frames++;
            if (frames == 1) {
                TEST_ASSERT_TRUE (decoder.more ());
                TEST_ASSERT_EQUAL_MEMORY ("hi", decoder.msg ()->data (), 2);
            } else {
                TEST_ASSERT_FALSE (decoder.more ());
                TEST_ASSERT_TRUE (decoder.msg ()->is_command ());
            }
        } else
            TEST_ASSERT_EQUAL_INT (0, rc);
    }
    TEST_ASSERT_EQUAL_INT (2, frames);
}

void test_empty_frame ()
{
    zsock::frame_decoder_t decoder (-1);
    const unsigned char wire[] = {0x00, 0x00};

    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (wire, sizeof wire, processed));
    TEST_ASSERT_EQUAL_size_t (2, processed);
    TEST_ASSERT_EQUAL_size_t (0, decoder.msg ()->size ());
}

void test_long_frame ()
{
    const size_t body_size = 1000;
    std::vector<unsigned char> body (body_size);
    for (size_t i = 0; i < body_size; i++)
        body[i] = static_cast<unsigned char> (i);

    std::vector<unsigned char> wire;
    zsock::frame_encoder_t encoder;
    encoder.encode (&body[0], body_size, 0, wire);
    TEST_ASSERT_EQUAL_size_t (9 + body_size, wire.size ());
    TEST_ASSERT_EQUAL_HEX8 (zsock::zmtp_flag_large, wire[0]);

    zsock::frame_decoder_t decoder (-1);
    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (1,
                           decoder.decode (&wire[0], wire.size (), processed));
    TEST_ASSERT_EQUAL_size_t (wire.size (), processed);
    TEST_ASSERT_EQUAL_MEMORY (&body[0], decoder.msg ()->data (), body_size);
}

void test_encoder_header_sizes ()
{
    TEST_ASSERT_EQUAL_size_t (2, zsock::frame_encoder_t::header_size (0));
    TEST_ASSERT_EQUAL_size_t (2, zsock::frame_encoder_t::header_size (255));
    TEST_ASSERT_EQUAL_size_t (9, zsock::frame_encoder_t::header_size (256));

    std::vector<unsigned char> wire;
    zsock::frame_encoder_t encoder;
    encoder.encode ("abc", 3, zsock::zmtp_flag_more, wire);
    TEST_ASSERT_EQUAL_size_t (5, wire.size ());
    TEST_ASSERT_EQUAL_HEX8 (zsock::zmtp_flag_more, wire[0]);
    TEST_ASSERT_EQUAL_UINT8 (3, wire[1]);
}

void test_encoder_marks_commands ()
{
    zsock::msg_t msg;
    TEST_ASSERT_EQUAL_INT (0, msg.init_buffer ("\5READY", 6));
    msg.set_flags (zsock::msg_t::command);

    std::vector<unsigned char> wire;
    zsock::frame_encoder_t encoder;
    encoder.encode (&msg, wire);
    TEST_ASSERT_EQUAL_HEX8 (zsock::zmtp_flag_command, wire[0]);
    TEST_ASSERT_EQUAL_UINT8 (6, wire[1]);
    TEST_ASSERT_EQUAL_INT (0, msg.close ());
}

void test_unknown_flags ()
{
    zsock::frame_decoder_t decoder (-1);
    const unsigned char wire[] = {0x08, 0x00};

    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (-1, decoder.decode (wire, sizeof wire, processed));
    TEST_ASSERT_EQUAL_INT (EPROTO, errno);
}

void test_command_with_more ()
{
    zsock::frame_decoder_t decoder (-1);
    const unsigned char wire[] = {0x05, 0x00};

    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (-1, decoder.decode (wire, sizeof wire, processed));
    TEST_ASSERT_EQUAL_INT (EPROTO, errno);
}

void test_max_message_size ()
{
    zsock::frame_decoder_t decoder (4);
    const unsigned char fits[] = {0x00, 0x04, 'a', 'b', 'c', 'd'};
    const unsigned char too_big[] = {0x00, 0x05};

    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (fits, sizeof fits, processed));
    TEST_ASSERT_EQUAL_INT (-1,
                           decoder.decode (too_big, sizeof too_big, processed));
    TEST_ASSERT_EQUAL_INT (EMSGSIZE, errno);
}

void test_oversized_long_frame ()
{
    zsock::frame_decoder_t decoder (1024);
    const unsigned char wire[] = {0x02, 0x00, 0x00, 0x00, 0x00,
                                  0x00, 0x01, 0x00, 0x00};

    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (-1, decoder.decode (wire, sizeof wire, processed));
    TEST_ASSERT_EQUAL_INT (EMSGSIZE, errno);
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_short_frame);
    RUN_TEST (test_byte_by_byte);
    RUN_TEST (test_empty_frame);
    RUN_TEST (test_long_frame);
    RUN_TEST (test_encoder_header_sizes);
    RUN_TEST (test_encoder_marks_commands);
    RUN_TEST (test_unknown_flags);
    RUN_TEST (test_command_with_more);
    RUN_TEST (test_max_message_size);
    RUN_TEST (test_oversized_long_frame);
    return UNITY_END ();
}
