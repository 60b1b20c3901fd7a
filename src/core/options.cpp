/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include <string.h>

#include "core/options.hpp"
#include "utils/err.hpp"
#include "utils/macros.hpp"

//  Maximum length of a PLAIN username or password, as carried by HELLO.
#define ZSOCK_PLAIN_CREDENTIAL_MAX 255

static int sockopt_invalid ()
{
    errno = EINVAL;
    return -1;
}

int zsock::do_getsockopt (void *const optval_,
                          size_t *const optvallen_,
                          const std::string &value_)
{
    return do_getsockopt (optval_, optvallen_, value_.c_str (),
                          value_.size () + 1);
}

int zsock::do_getsockopt (void *const optval_,
                          size_t *const optvallen_,
                          const void *value_,
                          const size_t value_len_)
{
    if (*optvallen_ < value_len_) {
        return sockopt_invalid ();
    }
    memcpy (optval_, value_, value_len_);
    memset (static_cast<char *> (optval_) + value_len_, 0,
            *optvallen_ - value_len_);
    *optvallen_ = value_len_;
    return 0;
}

template <typename T>
static int do_setsockopt (const void *const optval_,
                          const size_t optvallen_,
                          T *const out_value_)
{
    if (optvallen_ == sizeof (T)) {
        memcpy (out_value_, optval_, sizeof (T));
        return 0;
    }
    return sockopt_invalid ();
}

static int
do_setsockopt_string_allow_empty_strict (const void *const optval_,
                                         const size_t optvallen_,
                                         std::string *const out_value_,
                                         const size_t max_len_)
{
    if (optval_ == NULL && optvallen_ == 0) {
        out_value_->clear ();
        return 0;
    }
    if (optval_ != NULL && optvallen_ > 0 && optvallen_ <= max_len_) {
        out_value_->assign (static_cast<const char *> (optval_), optvallen_);
        return 0;
    }
    return sockopt_invalid ();
}

zsock::options_t::options_t () :
    type (-1),
    mechanism (ZSOCK_NULL),
    as_server (false),
    reconnect_ivl (250),
    reconnect_ivl_max (0),
    dial_timeout (-1),
    connect_timeout (0),
    handshake_ivl (30000),
    rcvtimeo (-1),
    maxmsgsize (-1)
{
}

int zsock::options_t::setsockopt (int option_,
                                  const void *optval_,
                                  size_t optvallen_)
{
    const bool is_int = (optvallen_ == sizeof (int) && optval_ != NULL);
    int value = 0;
    if (is_int)
        memcpy (&value, optval_, sizeof (int));

    switch (option_) {
        case ZSOCK_RECONNECT_IVL:
            if (is_int && value > 0) {
                reconnect_ivl = value;
                return 0;
            }
            break;

        case ZSOCK_RECONNECT_IVL_MAX:
            if (is_int && value >= 0) {
                reconnect_ivl_max = value;
                return 0;
            }
            break;

        case ZSOCK_DIAL_TIMEOUT:
            if (is_int && (value == -1 || value > 0)) {
                dial_timeout = value;
                return 0;
            }
            break;

        case ZSOCK_CONNECT_TIMEOUT:
            if (is_int && value >= 0) {
                connect_timeout = value;
                return 0;
            }
            break;

        case ZSOCK_HANDSHAKE_IVL:
            if (is_int && value >= 0) {
                handshake_ivl = value;
                return 0;
            }
            break;

        case ZSOCK_RCVTIMEO:
            if (is_int && value >= -1) {
                rcvtimeo = value;
                return 0;
            }
            break;

        case ZSOCK_MAXMSGSIZE: {
            int64_t size = 0;
            if (do_setsockopt (optval_, optvallen_, &size) == -1)
                return -1;
            if (size < -1)
                return sockopt_invalid ();
            maxmsgsize = size;
            return 0;
        }

        case ZSOCK_PLAIN_USERNAME:
            return do_setsockopt_string_allow_empty_strict (
              optval_, optvallen_, &plain_username, ZSOCK_PLAIN_CREDENTIAL_MAX);

        case ZSOCK_PLAIN_PASSWORD:
            return do_setsockopt_string_allow_empty_strict (
              optval_, optvallen_, &plain_password, ZSOCK_PLAIN_CREDENTIAL_MAX);

        default:
            //  ZSOCK_TYPE and ZSOCK_MECHANISM are fixed at creation.
            break;
    }

    return sockopt_invalid ();
}

int zsock::options_t::getsockopt (int option_,
                                  void *optval_,
                                  size_t *optvallen_) const
{
    const bool is_int = (*optvallen_ == sizeof (int));
    int *value = static_cast<int *> (optval_);

    switch (option_) {
        case ZSOCK_TYPE:
            if (is_int) {
                *value = type;
                return 0;
            }
            break;

        case ZSOCK_MECHANISM:
            if (is_int) {
                *value = mechanism;
                return 0;
            }
            break;

        case ZSOCK_RECONNECT_IVL:
            if (is_int) {
                *value = reconnect_ivl;
                return 0;
            }
            break;

        case ZSOCK_RECONNECT_IVL_MAX:
            if (is_int) {
                *value = reconnect_ivl_max;
                return 0;
            }
            break;

        case ZSOCK_DIAL_TIMEOUT:
            if (is_int) {
                *value = dial_timeout;
                return 0;
            }
            break;

        case ZSOCK_CONNECT_TIMEOUT:
            if (is_int) {
                *value = connect_timeout;
                return 0;
            }
            break;

        case ZSOCK_HANDSHAKE_IVL:
            if (is_int) {
                *value = handshake_ivl;
                return 0;
            }
            break;

        case ZSOCK_RCVTIMEO:
            if (is_int) {
                *value = rcvtimeo;
                return 0;
            }
            break;

        case ZSOCK_MAXMSGSIZE:
            if (*optvallen_ == sizeof (int64_t)) {
                *(static_cast<int64_t *> (optval_)) = maxmsgsize;
                return 0;
            }
            break;

        case ZSOCK_PLAIN_USERNAME:
            return do_getsockopt (optval_, optvallen_, plain_username);

        case ZSOCK_PLAIN_PASSWORD:
            return do_getsockopt (optval_, optvallen_, plain_password);

        default:
            break;
    }

    return sockopt_invalid ();
}
