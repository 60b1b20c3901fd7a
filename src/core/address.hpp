/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_ADDRESS_HPP_INCLUDED__
#define __ZSOCK_ADDRESS_HPP_INCLUDED__

#include <string>

namespace zsock
{
namespace protocol_name
{
static const char tcp[] = "tcp";
}

//  Endpoint split into its transport scheme and the transport specific
//  address, as in "tcp://127.0.0.1:5555".

struct address_t
{
    address_t (const std::string &protocol_, const std::string &address_);

    //  Splits endpoint_ at its single "://" separator. Fails with EINVAL on
    //  a malformed endpoint and EPROTONOSUPPORT on an unknown scheme.
    static int parse (const char *endpoint_, std::string &protocol_,
                      std::string &address_);

    const std::string protocol;
    const std::string address;

    int to_string (std::string &addr_) const;
};
}

#endif
