/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_MSG_HPP_INCLUDED__
#define __ZSOCK_MSG_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include "utils/macros.hpp"

//  Signature for free function to deallocate the message content.
//  Note that it has to be declared as "C" so that it is the same as
//  zsock_free_fn defined in zsock.h.
extern "C" {
typedef void(msg_free_fn) (void *data_, void *hint_);
}

namespace zsock
{
//  Note that this structure needs to be explicitly constructed
//  (init functions) and destructed (close function).
//
//  The layout must fit into zsock_msg_t; the C API casts between the two.

class msg_t
{
  public:
    //  Message flags.
    enum
    {
        command = 1
    };

    bool check () const;
    int init ();
    int init_size (size_t size_);
    int init_buffer (const void *buf_, size_t size_);
    int close ();
    int move (msg_t &src_);

    //  Appends bytes to the body. Used to join the frames of a multipart
    //  message into a single body.
    int append (const void *data_, size_t size_);

    void *data ();
    size_t size () const;
    unsigned char flags () const;
    void set_flags (unsigned char flags_);
    bool is_command () const;

    //  Error the producing engine attached to the message, 0 for none.
    int err () const;
    void set_err (int err_);

    //  Id of the connection that produced the message, 0 if unknown.
    uint32_t connection_id () const;
    void set_connection_id (uint32_t connection_id_);

  private:
    enum
    {
        type_closed = 0,
        type_valid = 101
    };

    unsigned char *_data;
    size_t _size;
    size_t _capacity;
    uint32_t _connection_id;
    int _err;
    unsigned char _flags;
    unsigned char _type;
};
}

#endif
