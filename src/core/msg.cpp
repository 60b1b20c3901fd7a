/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "core/msg.hpp"
#include "utils/err.hpp"
#include "utils/likely.hpp"

//  Check whether the sizes of public representation of the message (zsock_msg_t)
//  and private representation of the message (zsock::msg_t) match.

typedef char
  zsock_msg_size_check[2 * ((sizeof (zsock::msg_t) <= sizeof (zsock_msg_t)) != 0)
                       - 1];

bool zsock::msg_t::check () const
{
    return _type == type_valid;
}

int zsock::msg_t::init ()
{
    _data = NULL;
    _size = 0;
    _capacity = 0;
    _connection_id = 0;
    _err = 0;
    _flags = 0;
    _type = type_valid;
    return 0;
}

int zsock::msg_t::init_size (size_t size_)
{
    init ();
    if (size_ == 0)
        return 0;

    _data = static_cast<unsigned char *> (malloc (size_));
    if (unlikely (!_data)) {
        _type = type_closed;
        errno = ENOMEM;
        return -1;
    }
    _size = size_;
    _capacity = size_;
    return 0;
}

int zsock::msg_t::init_buffer (const void *buf_, size_t size_)
{
    const int rc = init_size (size_);
    if (unlikely (rc < 0))
        return -1;
    if (size_) {
        //  NULL and zero size is allowed
        zsock_assert (NULL != buf_);
        memcpy (_data, buf_, size_);
    }
    return 0;
}

int zsock::msg_t::close ()
{
    //  Check the validity of the message.
    if (unlikely (!check ())) {
        errno = EFAULT;
        return -1;
    }

    free (_data);

    //  Make the message invalid.
    _data = NULL;
    _size = 0;
    _capacity = 0;
    _type = type_closed;
    return 0;
}

int zsock::msg_t::move (msg_t &src_)
{
    //  Check the validity of the source.
    if (unlikely (!src_.check ())) {
        errno = EFAULT;
        return -1;
    }

    int rc = close ();
    if (unlikely (rc < 0))
        return rc;

    *this = src_;

    rc = src_.init ();
    if (unlikely (rc < 0))
        return rc;

    return 0;
}

int zsock::msg_t::append (const void *data_, size_t size_)
{
    zsock_assert (check ());
    if (size_ == 0)
        return 0;

    if (_size + size_ > _capacity) {
        size_t capacity = _capacity ? _capacity : size_;
        while (capacity < _size + size_)
            capacity *= 2;
        unsigned char *data =
          static_cast<unsigned char *> (realloc (_data, capacity));
        if (unlikely (!data)) {
            errno = ENOMEM;
            return -1;
        }
        _data = data;
        _capacity = capacity;
    }
    memcpy (_data + _size, data_, size_);
    _size += size_;
    return 0;
}

void *zsock::msg_t::data ()
{
    //  Check the validity of the message.
    zsock_assert (check ());
    return _data;
}

size_t zsock::msg_t::size () const
{
    //  Check the validity of the message.
    zsock_assert (check ());
    return _size;
}

unsigned char zsock::msg_t::flags () const
{
    return _flags;
}

void zsock::msg_t::set_flags (unsigned char flags_)
{
    _flags |= flags_;
}

bool zsock::msg_t::is_command () const
{
    return (_flags & command) == command;
}

int zsock::msg_t::err () const
{
    return _err;
}

void zsock::msg_t::set_err (int err_)
{
    _err = err_;
}

uint32_t zsock::msg_t::connection_id () const
{
    return _connection_id;
}

void zsock::msg_t::set_connection_id (uint32_t connection_id_)
{
    _connection_id = connection_id_;
}
