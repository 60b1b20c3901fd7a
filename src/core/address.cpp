/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "utils/macros.hpp"
#include "core/address.hpp"
#include "utils/err.hpp"

#include <string>
#include <sstream>

zsock::address_t::address_t (const std::string &protocol_,
                             const std::string &address_) :
    protocol (protocol_), address (address_)
{
}

int zsock::address_t::parse (const char *endpoint_,
                             std::string &protocol_,
                             std::string &address_)
{
    if (!endpoint_) {
        errno = EINVAL;
        return -1;
    }

    //  Find the "://" separator; it must occur exactly once.
    const std::string uri (endpoint_);
    const std::string::size_type pos = uri.find ("://");
    if (pos == std::string::npos || pos == 0) {
        errno = EINVAL;
        return -1;
    }
    if (uri.find ("://", pos + 3) != std::string::npos) {
        errno = EINVAL;
        return -1;
    }

    std::string protocol = uri.substr (0, pos);
    std::string address = uri.substr (pos + 3);
    if (address.empty ()) {
        errno = EINVAL;
        return -1;
    }

    if (protocol != protocol_name::tcp) {
        errno = EPROTONOSUPPORT;
        return -1;
    }

    protocol_.swap (protocol);
    address_.swap (address);
    return 0;
}

int zsock::address_t::to_string (std::string &addr_) const
{
    if (!protocol.empty () && !address.empty ()) {
        std::stringstream s;
        s << protocol << "://" << address;
        addr_ = s.str ();
        return 0;
    }
    addr_.clear ();
    return -1;
}
