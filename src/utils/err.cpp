/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

#include <boost/asio/error.hpp>

const char *zsock::errno_to_string (int errno_)
{
    switch (errno_) {
        case ETERM:
            return "Socket was closed";
        case ENOCOMPATPROTO:
            return "The protocol is not compatible with the socket type";
        case EROLE:
            return "Action not valid on this socket role";
        default:
            return strerror (errno_);
    }
}

void zsock::zsock_abort (const char *errmsg_)
{
    LIBZSOCK_UNUSED (errmsg_);
    abort ();
}

int zsock::error_code_to_errno (const boost::system::error_code &ec_)
{
    if (!ec_)
        return 0;

    if (ec_ == boost::asio::error::eof
        || ec_ == boost::asio::error::connection_reset
        || ec_ == boost::asio::error::broken_pipe)
        return EPIPE;
    if (ec_ == boost::asio::error::operation_aborted)
        return ETERM;
    if (ec_ == boost::asio::error::timed_out)
        return ETIMEDOUT;
    if (ec_ == boost::asio::error::not_connected)
        return ENOTCONN;
    if (ec_ == boost::asio::error::bad_descriptor)
        return ENOTCONN;
    if (ec_ == boost::asio::error::connection_refused)
        return ECONNREFUSED;
    if (ec_ == boost::asio::error::address_in_use)
        return EADDRINUSE;
    if (ec_ == boost::asio::error::host_not_found
        || ec_ == boost::asio::error::host_not_found_try_again)
        return EHOSTUNREACH;

    //  Remaining system category errors are errno values already.
    if (ec_.category () == boost::system::system_category ())
        return ec_.value ();
    return EIO;
}
