/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_FRAME_DECODER_HPP_INCLUDED__
#define __ZSOCK_FRAME_DECODER_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include "core/msg.hpp"
#include "utils/macros.hpp"

namespace zsock
{
//  Incremental decoder for ZMTP 3.x frames. Bytes may be fed in chunks of
//  any size; the decoder keeps its state between calls.

class frame_decoder_t
{
  public:
    //  Frames with a body larger than maxmsgsize_ are rejected with
    //  EMSGSIZE; -1 means no limit.
    explicit frame_decoder_t (int64_t maxmsgsize_);
    ~frame_decoder_t ();

    //  Consumes bytes from data_ and reports how many were used in
    //  bytes_used_. Returns 1 when a frame is complete (available through
    //  msg () until the next call), 0 when more data is needed and -1 on a
    //  protocol error (errno is EPROTO or EMSGSIZE).
    int decode (const unsigned char *data_, size_t size_, size_t &bytes_used_);

    //  The frame most recently completed. Data frames carry no flag, command
    //  frames carry msg_t::command.
    msg_t *msg () { return &_in_progress; }

    //  True when the completed frame is followed by more frames of the same
    //  message.
    bool more () const { return _more; }

  private:
    typedef int (frame_decoder_t::*step_t) (unsigned char const *);

    //  Sets the next decoding step: to_read_ bytes are gathered at read_pos_,
    //  then next_ is invoked.
    void next_step (void *read_pos_, size_t to_read_, step_t next_);

    int flags_ready (unsigned char const *);
    int one_byte_size_ready (unsigned char const *);
    int eight_byte_size_ready (unsigned char const *);
    int frame_ready (unsigned char const *);

    int size_ready (uint64_t size_, unsigned char const *);

    unsigned char *_read_pos;
    size_t _to_read;
    step_t _next;

    unsigned char _tmpbuf[8];
    unsigned char _msg_flags;
    bool _more;
    bool _next_more;
    msg_t _in_progress;

    const int64_t _max_msg_size;

    ZSOCK_NON_COPYABLE_NOR_MOVABLE (frame_decoder_t)
};
}

#endif
