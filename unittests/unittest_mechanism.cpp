/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/msg.hpp"
#include "core/options.hpp"
#include "mechanism/mechanism.hpp"
#include "protocol/metadata.hpp"
#include "protocol/zmtp_protocol.hpp"

#include <unity.h>
#include <string.h>
#include <string>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

static zsock::options_t make_options (int type_,
                                      int mechanism_,
                                      const char *username_ = NULL,
                                      const char *password_ = NULL)
{
    zsock::options_t options;
    options.type = type_;
    options.mechanism = mechanism_;
    options.as_server = type_ == ZSOCK_SERVER;
    if (username_)
        options.plain_username = username_;
    if (password_)
        options.plain_password = password_;
    return options;
}

//  Moves every pending command from from_ to to_. Returns the number of
//  commands delivered, or -1 when to_ rejected one.
static int pump (zsock::mechanism_t *from_, zsock::mechanism_t *to_)
{
    int delivered = 0;
    while (true) {
        zsock::msg_t msg;
        msg.init ();
        if (from_->next_handshake_command (&msg) == -1) {
            TEST_ASSERT_EQUAL_INT (EAGAIN, errno);
            msg.close ();
            return delivered;
        }
        TEST_ASSERT_TRUE (msg.is_command ());
        const int rc = to_->process_handshake_command (&msg);
        msg.close ();
        if (rc == -1)
            return -1;
        delivered++;
    }
}

//  Runs the handshake until neither side has anything left to say.
//  Returns -1 with errno set when a command was rejected.
static int handshake (zsock::mechanism_t *client_, zsock::mechanism_t *server_)
{
    while (true) {
        const int to_server = pump (client_, server_);
        if (to_server == -1)
            return -1;
        const int to_client = pump (server_, client_);
        if (to_client == -1)
            return -1;
        if (to_server == 0 && to_client == 0)
            return 0;
    }
}

void test_null_handshake ()
{
    const zsock::options_t client_options =
      make_options (ZSOCK_CLIENT, ZSOCK_NULL);
    const zsock::options_t server_options =
      make_options (ZSOCK_SERVER, ZSOCK_NULL);
    zsock::metadata_t extra;
    extra.set (zsock::zmtp_property_identity, "alpha");

    zsock::mechanism_t *client = zsock::mechanism_t::create (
      ZSOCK_NULL, false, ZSOCK_CLIENT, client_options, &extra);
    zsock::mechanism_t *server = zsock::mechanism_t::create (
      ZSOCK_NULL, true, ZSOCK_SERVER, server_options, NULL);

    TEST_ASSERT_EQUAL_INT (zsock::mechanism_t::handshaking, client->status ());
    TEST_ASSERT_EQUAL_INT (0, handshake (client, server));
    TEST_ASSERT_EQUAL_INT (zsock::mechanism_t::ready, client->status ());
    TEST_ASSERT_EQUAL_INT (zsock::mechanism_t::ready, server->status ());

    TEST_ASSERT_EQUAL_STRING (
      "CLIENT", server->peer_metadata ().get (zsock::zmtp_property_socket_type));
    TEST_ASSERT_EQUAL_STRING (
      "alpha", server->peer_metadata ().get (zsock::zmtp_property_identity));
    TEST_ASSERT_EQUAL_STRING (
      "SERVER", client->peer_metadata ().get (zsock::zmtp_property_socket_type));

    delete client;
    delete server;
}

void test_null_same_role_is_incompatible ()
{
    const zsock::options_t options = make_options (ZSOCK_CLIENT, ZSOCK_NULL);
    zsock::mechanism_t *first = zsock::mechanism_t::create (
      ZSOCK_NULL, false, ZSOCK_CLIENT, options, NULL);
    zsock::mechanism_t *second = zsock::mechanism_t::create (
      ZSOCK_NULL, false, ZSOCK_CLIENT, options, NULL);

    TEST_ASSERT_EQUAL_INT (-1, handshake (first, second));
    TEST_ASSERT_EQUAL_INT (ENOCOMPATPROTO, errno);

    delete first;
    delete second;
}

void test_null_rejects_unexpected_command ()
{
    const zsock::options_t options = make_options (ZSOCK_SERVER, ZSOCK_NULL);
    zsock::mechanism_t *server = zsock::mechanism_t::create (
      ZSOCK_NULL, true, ZSOCK_SERVER, options, NULL);

    zsock::msg_t msg;
    TEST_ASSERT_EQUAL_INT (0,
                           msg.init_buffer (zsock::zmtp_command_hello,
                                            zsock::zmtp_command_hello_size));
    msg.set_flags (zsock::msg_t::command);
    TEST_ASSERT_EQUAL_INT (-1, server->process_handshake_command (&msg));
    TEST_ASSERT_EQUAL_INT (EPROTO, errno);
    msg.close ();

    delete server;
}

void test_null_ready_without_socket_type ()
{
    const zsock::options_t options = make_options (ZSOCK_SERVER, ZSOCK_NULL);
    zsock::mechanism_t *server = zsock::mechanism_t::create (
      ZSOCK_NULL, true, ZSOCK_SERVER, options, NULL);

    zsock::msg_t msg;
    TEST_ASSERT_EQUAL_INT (0,
                           msg.init_buffer (zsock::zmtp_command_ready,
                                            zsock::zmtp_command_ready_size));
    TEST_ASSERT_EQUAL_INT (-1, server->process_handshake_command (&msg));
    TEST_ASSERT_EQUAL_INT (EPROTO, errno);
    msg.close ();

    delete server;
}

void test_null_error_command ()
{
    const zsock::options_t options = make_options (ZSOCK_CLIENT, ZSOCK_NULL);
    zsock::mechanism_t *client = zsock::mechanism_t::create (
      ZSOCK_NULL, false, ZSOCK_CLIENT, options, NULL);

    const char error[] = "\5ERROR\4nope";
    zsock::msg_t msg;
    TEST_ASSERT_EQUAL_INT (0, msg.init_buffer (error, sizeof error - 1));
    TEST_ASSERT_EQUAL_INT (0, client->process_handshake_command (&msg));
    msg.close ();

    TEST_ASSERT_EQUAL_INT (zsock::mechanism_t::error, client->status ());
    TEST_ASSERT_EQUAL_INT (EACCES, client->error_code ());

    delete client;
}

void test_plain_handshake ()
{
    const zsock::options_t client_options =
      make_options (ZSOCK_CLIENT, ZSOCK_PLAIN, "admin", "secret");
    const zsock::options_t server_options =
      make_options (ZSOCK_SERVER, ZSOCK_PLAIN, "admin", "secret");

    zsock::mechanism_t *client = zsock::mechanism_t::create (
      ZSOCK_PLAIN, false, ZSOCK_CLIENT, client_options, NULL);
    zsock::mechanism_t *server = zsock::mechanism_t::create (
      ZSOCK_PLAIN, true, ZSOCK_SERVER, server_options, NULL);

    TEST_ASSERT_EQUAL_INT (0, handshake (client, server));
    TEST_ASSERT_EQUAL_INT (zsock::mechanism_t::ready, client->status ());
    TEST_ASSERT_EQUAL_INT (zsock::mechanism_t::ready, server->status ());
    TEST_ASSERT_EQUAL_STRING (
      "CLIENT", server->peer_metadata ().get (zsock::zmtp_property_socket_type));

    delete client;
    delete server;
}

void test_plain_wrong_password ()
{
    const zsock::options_t client_options =
      make_options (ZSOCK_CLIENT, ZSOCK_PLAIN, "admin", "guess");
    const zsock::options_t server_options =
      make_options (ZSOCK_SERVER, ZSOCK_PLAIN, "admin", "secret");

    zsock::mechanism_t *client = zsock::mechanism_t::create (
      ZSOCK_PLAIN, false, ZSOCK_CLIENT, client_options, NULL);
    zsock::mechanism_t *server = zsock::mechanism_t::create (
      ZSOCK_PLAIN, true, ZSOCK_SERVER, server_options, NULL);

    TEST_ASSERT_EQUAL_INT (0, handshake (client, server));
    TEST_ASSERT_EQUAL_INT (zsock::mechanism_t::error, server->status ());
    TEST_ASSERT_EQUAL_INT (EACCES, server->error_code ());
    TEST_ASSERT_EQUAL_INT (zsock::mechanism_t::error, client->status ());
    TEST_ASSERT_EQUAL_INT (EACCES, client->error_code ());

    delete client;
    delete server;
}

void test_plain_server_without_username_accepts_anyone ()
{
    const zsock::options_t client_options =
      make_options (ZSOCK_CLIENT, ZSOCK_PLAIN, "anyone", "anything");
    const zsock::options_t server_options =
      make_options (ZSOCK_SERVER, ZSOCK_PLAIN);

    zsock::mechanism_t *client = zsock::mechanism_t::create (
      ZSOCK_PLAIN, false, ZSOCK_CLIENT, client_options, NULL);
    zsock::mechanism_t *server = zsock::mechanism_t::create (
      ZSOCK_PLAIN, true, ZSOCK_SERVER, server_options, NULL);

    TEST_ASSERT_EQUAL_INT (0, handshake (client, server));
    TEST_ASSERT_EQUAL_INT (zsock::mechanism_t::ready, client->status ());
    TEST_ASSERT_EQUAL_INT (zsock::mechanism_t::ready, server->status ());

    delete client;
    delete server;
}

void test_plain_malformed_hello ()
{
    const zsock::options_t options =
      make_options (ZSOCK_SERVER, ZSOCK_PLAIN, "admin", "secret");

    //  The username length runs past the end of the command.
    const char truncated[] = "\5HELLO\10adm";
    //  Trailing bytes after the password.
    const char trailing[] = "\5HELLO\1a\1bXX";
    const char *const hellos[] = {truncated, trailing};
    const size_t sizes[] = {sizeof truncated - 1, sizeof trailing - 1};

    for (size_t i = 0; i < 2; i++) {
        zsock::mechanism_t *server = zsock::mechanism_t::create (
          ZSOCK_PLAIN, true, ZSOCK_SERVER, options, NULL);
        zsock::msg_t msg;
        TEST_ASSERT_EQUAL_INT (0, msg.init_buffer (hellos[i], sizes[i]));
        TEST_ASSERT_EQUAL_INT (-1, server->process_handshake_command (&msg));
        TEST_ASSERT_EQUAL_INT (EPROTO, errno);
        msg.close ();
        delete server;
    }
}

void test_unknown_mechanism ()
{
    const zsock::options_t options = make_options (ZSOCK_CLIENT, ZSOCK_NULL);
    TEST_ASSERT_NULL (
      zsock::mechanism_t::create (42, false, ZSOCK_CLIENT, options, NULL));
    TEST_ASSERT_EQUAL_INT (EINVAL, errno);
    TEST_ASSERT_NULL (zsock::mechanism_t::mechanism_name (42));
    TEST_ASSERT_EQUAL_STRING ("PLAIN",
                              zsock::mechanism_t::mechanism_name (ZSOCK_PLAIN));
}

void test_metadata_block ()
{
    zsock::metadata_t metadata;
    metadata.set ("Socket-Type", "CLIENT");
    metadata.set ("Empty", "");

    const size_t size = metadata.encoded_size ();
    TEST_ASSERT_EQUAL_size_t ((1 + 11 + 4 + 6) + (1 + 5 + 4 + 0), size);
    std::vector<unsigned char> buffer (size);
    TEST_ASSERT_EQUAL_size_t (size, metadata.write (&buffer[0], size));

    zsock::metadata_t parsed;
    TEST_ASSERT_EQUAL_INT (0, parsed.parse (&buffer[0], size));
    TEST_ASSERT_EQUAL_STRING ("CLIENT", parsed.get ("Socket-Type"));
    TEST_ASSERT_EQUAL_STRING ("", parsed.get ("Empty"));
    TEST_ASSERT_NULL (parsed.get ("Identity"));

    //  Cut inside the last value.
    TEST_ASSERT_EQUAL_INT (-1, parsed.parse (&buffer[0], size - 1 - 4));
    TEST_ASSERT_EQUAL_INT (EPROTO, errno);
    //  A failed parse keeps the previous properties.
    TEST_ASSERT_EQUAL_STRING ("CLIENT", parsed.get ("Socket-Type"));

    TEST_ASSERT_EQUAL_INT (0, parsed.parse (NULL, 0));
    TEST_ASSERT_TRUE (parsed.dict ().empty ());
}

int main ()
{
    setup_test_environment ();

    UNITY_BEGIN ();
    RUN_TEST (test_null_handshake);
    RUN_TEST (test_null_same_role_is_incompatible);
    RUN_TEST (test_null_rejects_unexpected_command);
    RUN_TEST (test_null_ready_without_socket_type);
    RUN_TEST (test_null_error_command);
    RUN_TEST (test_plain_handshake);
    RUN_TEST (test_plain_wrong_password);
    RUN_TEST (test_plain_server_without_username_accepts_anyone);
    RUN_TEST (test_plain_malformed_hello);
    RUN_TEST (test_unknown_mechanism);
    RUN_TEST (test_metadata_block);
    return UNITY_END ();
}
