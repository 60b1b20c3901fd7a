/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_CONNECTION_HPP_INCLUDED__
#define __ZSOCK_CONNECTION_HPP_INCLUDED__

#include <stdint.h>
#include <string>

#include "utils/macros.hpp"

namespace zsock
{
struct i_engine;

//  One established connection of a socket. Owns the prepared engine, and
//  through it the transport.

class connection_t ZSOCK_FINAL
{
  public:
    connection_t (uint32_t id_,
                  i_engine *engine_,
                  const std::string &local_address_,
                  const std::string &remote_address_);
    ~connection_t ();

    uint32_t id () const { return _id; }
    i_engine *engine () const { return _engine; }
    const std::string &local_address () const { return _local_address; }
    const std::string &remote_address () const { return _remote_address; }

    //  Closes the transport. Only the first call has an effect.
    void close ();

  private:
    //  1-based, in the order the connections were established.
    const uint32_t _id;

    i_engine *_engine;
    bool _closed;

    const std::string _local_address;
    const std::string _remote_address;

    ZSOCK_NON_COPYABLE_NOR_MOVABLE (connection_t)
};
}

#endif
