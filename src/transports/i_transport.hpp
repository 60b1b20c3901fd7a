/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_I_TRANSPORT_HPP_INCLUDED__
#define __ZSOCK_I_TRANSPORT_HPP_INCLUDED__

#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <functional>
#include <string>

#include "utils/macros.hpp"

namespace zsock
{
//  Connected stream transport. The engine drives it exclusively from the
//  I/O thread; the transport owns the underlying socket object.

class i_transport
{
  public:
    //  Callback type for async operation completion
    typedef std::function<void (const boost::system::error_code &, std::size_t)>
      completion_handler_t;

    virtual ~i_transport () ZSOCK_DEFAULT

    //  Check if transport is open and ready for I/O
    virtual bool is_open () const = 0;

    //  Close the transport. Pending operations complete with
    //  operation_aborted. Safe to call more than once.
    virtual void close () = 0;

    //  Reads up to buffer_size bytes into buffer.
    virtual void async_read_some (unsigned char *buffer,
                                  std::size_t buffer_size,
                                  completion_handler_t handler) = 0;

    //  Reads exactly buffer_size bytes into buffer.
    virtual void async_read (unsigned char *buffer,
                             std::size_t buffer_size,
                             completion_handler_t handler) = 0;

    //  Writes all buffer_size bytes from buffer.
    virtual void async_write (const unsigned char *buffer,
                              std::size_t buffer_size,
                              completion_handler_t handler) = 0;

    //  Endpoint strings of both ends, e.g. "tcp://127.0.0.1:5555".
    virtual std::string local_address () const = 0;
    virtual std::string remote_address () const = 0;

    //  Get transport name for debugging
    virtual const char *name () const = 0;
};
}

#endif
