/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_FRAME_ENCODER_HPP_INCLUDED__
#define __ZSOCK_FRAME_ENCODER_HPP_INCLUDED__

#include <stddef.h>
#include <vector>

#include "utils/macros.hpp"

namespace zsock
{
class msg_t;

//  Encoder for ZMTP 3.x frames: a flags byte, a one or eight byte size and
//  the body. Encoded frames are appended to a caller owned buffer.

class frame_encoder_t
{
  public:
    frame_encoder_t ();

    //  Appends one frame. flags_ is a combination of zmtp_flag_more and
    //  zmtp_flag_command; the size flag is chosen here.
    void encode (const void *data_,
                 size_t size_,
                 unsigned char flags_,
                 std::vector<unsigned char> &out_);

    //  Appends msg_ as a single frame, a command frame if it carries the
    //  command flag.
    void encode (msg_t *msg_, std::vector<unsigned char> &out_);

    //  Number of header bytes a body of size_ bytes needs.
    static size_t header_size (size_t size_);

  private:
    ZSOCK_NON_COPYABLE_NOR_MOVABLE (frame_encoder_t)
};
}

#endif
