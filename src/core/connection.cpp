/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "core/connection.hpp"
#include "engine/i_engine.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

zsock::connection_t::connection_t (uint32_t id_,
                                   i_engine *engine_,
                                   const std::string &local_address_,
                                   const std::string &remote_address_) :
    _id (id_),
    _engine (engine_),
    _closed (false),
    _local_address (local_address_),
    _remote_address (remote_address_)
{
    zsock_assert (_engine);
    ZSOCK_DBG_CONN ("connection %u: %s -> %s", _id, _local_address.c_str (),
                    _remote_address.c_str ());
}

zsock::connection_t::~connection_t ()
{
    close ();
    LIBZSOCK_DELETE (_engine);
}

void zsock::connection_t::close ()
{
    if (_closed)
        return;
    _closed = true;

    ZSOCK_DBG_CONN ("closing connection %u", _id);
    _engine->close ();
}
