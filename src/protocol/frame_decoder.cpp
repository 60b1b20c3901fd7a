/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/frame_decoder.hpp"
#include "protocol/zmtp_protocol.hpp"
#include "utils/err.hpp"
#include "utils/likely.hpp"
#include "utils/wire.hpp"

#include <algorithm>
#include <limits>

zsock::frame_decoder_t::frame_decoder_t (int64_t maxmsgsize_) :
    _read_pos (NULL),
    _to_read (0),
    _next (NULL),
    _msg_flags (0),
    _more (false),
    _next_more (false),
    _max_msg_size (maxmsgsize_)
{
    const int rc = _in_progress.init ();
    errno_assert (rc == 0);

    //  At the beginning, read one byte and go to flags_ready state.
    next_step (_tmpbuf, 1, &frame_decoder_t::flags_ready);
}

zsock::frame_decoder_t::~frame_decoder_t ()
{
    const int rc = _in_progress.close ();
    errno_assert (rc == 0);
}

void zsock::frame_decoder_t::next_step (void *read_pos_,
                                        size_t to_read_,
                                        step_t next_)
{
    _read_pos = static_cast<unsigned char *> (read_pos_);
    _to_read = to_read_;
    _next = next_;
}

int zsock::frame_decoder_t::decode (const unsigned char *data_,
                                    size_t size_,
                                    size_t &bytes_used_)
{
    bytes_used_ = 0;

    while (bytes_used_ < size_) {
        //  Copy the data from buffer to the message.
        const size_t to_copy = std::min (_to_read, size_ - bytes_used_);
        memcpy (_read_pos, data_ + bytes_used_, to_copy);

        _read_pos += to_copy;
        _to_read -= to_copy;
        bytes_used_ += to_copy;

        //  Try to get more space in the message to fill in.
        //  If none is available, return.
        while (_to_read == 0) {
            const int rc = (this->*_next) (data_ + bytes_used_);
            if (rc != 0)
                return rc;
        }
    }

    return 0;
}

int zsock::frame_decoder_t::flags_ready (unsigned char const *)
{
    const unsigned char flags = _tmpbuf[0];
    if (flags & ~zmtp_flag_mask) {
        errno = EPROTO;
        return -1;
    }

    //  Commands are always single frames.
    if ((flags & zmtp_flag_command) && (flags & zmtp_flag_more)) {
        errno = EPROTO;
        return -1;
    }

    _msg_flags = 0;
    if (flags & zmtp_flag_command)
        _msg_flags |= msg_t::command;
    _next_more = (flags & zmtp_flag_more) != 0;

    //  The payload length is either one or eight bytes,
    //  depending on whether the 'large' bit is set.
    if (flags & zmtp_flag_large)
        next_step (_tmpbuf, 8, &frame_decoder_t::eight_byte_size_ready);
    else
        next_step (_tmpbuf, 1, &frame_decoder_t::one_byte_size_ready);

    return 0;
}

int zsock::frame_decoder_t::one_byte_size_ready (unsigned char const *read_from_)
{
    return size_ready (_tmpbuf[0], read_from_);
}

int zsock::frame_decoder_t::eight_byte_size_ready (
  unsigned char const *read_from_)
{
    //  The payload size is encoded as 64-bit unsigned integer.
    //  The most significant byte comes first.
    const uint64_t msg_size = get_uint64 (_tmpbuf);

    return size_ready (msg_size, read_from_);
}

int zsock::frame_decoder_t::size_ready (uint64_t msg_size_,
                                        unsigned char const *read_from_)
{
    LIBZSOCK_UNUSED (read_from_);

    //  Message size must not exceed the maximum allowed size.
    if (_max_msg_size >= 0
        && unlikely (msg_size_ > static_cast<uint64_t> (_max_msg_size))) {
        errno = EMSGSIZE;
        return -1;
    }

    //  Message size must fit into size_t data type.
    if (unlikely (msg_size_ != static_cast<size_t> (msg_size_))) {
        errno = EMSGSIZE;
        return -1;
    }

    int rc = _in_progress.close ();
    errno_assert (rc == 0);
    rc = _in_progress.init_size (static_cast<size_t> (msg_size_));
    if (unlikely (rc)) {
        errno_assert (errno == ENOMEM);
        rc = _in_progress.init ();
        errno_assert (rc == 0);
        errno = ENOMEM;
        return -1;
    }

    _in_progress.set_flags (_msg_flags);
    next_step (_in_progress.data (), _in_progress.size (),
               &frame_decoder_t::frame_ready);

    return 0;
}

int zsock::frame_decoder_t::frame_ready (unsigned char const *)
{
    //  Frame is completely read. Signal this to the caller
    //  and prepare to decode the next frame.
    _more = _next_more;
    next_step (_tmpbuf, 1, &frame_decoder_t::flags_ready);
    return 1;
}
