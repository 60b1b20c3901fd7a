/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_ZMTP_PROTOCOL_HPP_INCLUDED__
#define __ZSOCK_ZMTP_PROTOCOL_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

namespace zsock
{
//  ZMTP 3.1 greeting layout.
const size_t zmtp_greeting_size = 64;
const size_t zmtp_signature_size = 10;
const unsigned char zmtp_signature_first = 0xff;
const unsigned char zmtp_signature_last = 0x7f;
const unsigned char zmtp_version_major = 3;
const unsigned char zmtp_version_minor = 1;
const size_t zmtp_major_offset = 10;
const size_t zmtp_minor_offset = 11;
const size_t zmtp_mechanism_offset = 12;
const size_t zmtp_mechanism_size = 20;
const size_t zmtp_as_server_offset = 32;

//  Frame FLAGS bits
const unsigned char zmtp_flag_more = 0x01;
const unsigned char zmtp_flag_large = 0x02;
const unsigned char zmtp_flag_command = 0x04;
const unsigned char zmtp_flag_mask = 0x07;

//  Frames with bodies up to this size use the one byte size field.
const size_t zmtp_max_short_size = 0xff;

//  Mechanism names as carried in the greeting.
const char zmtp_mechanism_null[] = "NULL";
const char zmtp_mechanism_plain[] = "PLAIN";

//  Command names, each prefixed on the wire by its length.
const char zmtp_command_ready[] = "\5READY";
const char zmtp_command_error[] = "\5ERROR";
const char zmtp_command_hello[] = "\5HELLO";
const char zmtp_command_welcome[] = "\7WELCOME";
const char zmtp_command_initiate[] = "\10INITIATE";

const size_t zmtp_command_ready_size = sizeof (zmtp_command_ready) - 1;
const size_t zmtp_command_error_size = sizeof (zmtp_command_error) - 1;
const size_t zmtp_command_hello_size = sizeof (zmtp_command_hello) - 1;
const size_t zmtp_command_welcome_size = sizeof (zmtp_command_welcome) - 1;
const size_t zmtp_command_initiate_size = sizeof (zmtp_command_initiate) - 1;

//  Metadata property names.
const char zmtp_property_socket_type[] = "Socket-Type";
const char zmtp_property_identity[] = "Identity";
}

#endif
