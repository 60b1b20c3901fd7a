/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/frame_encoder.hpp"
#include "protocol/zmtp_protocol.hpp"
#include "core/msg.hpp"
#include "utils/err.hpp"
#include "utils/wire.hpp"

zsock::frame_encoder_t::frame_encoder_t ()
{
}

size_t zsock::frame_encoder_t::header_size (size_t size_)
{
    return size_ > zmtp_max_short_size ? 9 : 2;
}

void zsock::frame_encoder_t::encode (const void *data_,
                                     size_t size_,
                                     unsigned char flags_,
                                     std::vector<unsigned char> &out_)
{
    zsock_assert ((flags_ & ~(zmtp_flag_more | zmtp_flag_command)) == 0);

    unsigned char header[9];
    size_t header_size;

    header[0] = flags_;
    if (size_ > zmtp_max_short_size) {
        header[0] |= zmtp_flag_large;
        put_uint64 (header + 1, static_cast<uint64_t> (size_));
        header_size = 9;
    } else {
        put_uint8 (header + 1, static_cast<uint8_t> (size_));
        header_size = 2;
    }

    out_.insert (out_.end (), header, header + header_size);
    if (size_) {
        const unsigned char *data = static_cast<const unsigned char *> (data_);
        out_.insert (out_.end (), data, data + size_);
    }
}

void zsock::frame_encoder_t::encode (msg_t *msg_,
                                     std::vector<unsigned char> &out_)
{
    const unsigned char flags = msg_->is_command () ? zmtp_flag_command : 0;
    encode (msg_->data (), msg_->size (), flags, out_);
}
