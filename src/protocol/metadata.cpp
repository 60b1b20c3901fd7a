/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/metadata.hpp"
#include "utils/err.hpp"
#include "utils/wire.hpp"

namespace
{
const size_t name_len_size = sizeof (unsigned char);
const size_t value_len_size = sizeof (uint32_t);
}

zsock::metadata_t::metadata_t ()
{
}

zsock::metadata_t::metadata_t (const dict_t &dict_) : _dict (dict_)
{
}

const char *zsock::metadata_t::get (const std::string &property_) const
{
    const dict_t::const_iterator it = _dict.find (property_);
    if (it == _dict.end ())
        return NULL;
    return it->second.c_str ();
}

void zsock::metadata_t::set (const std::string &property_,
                             const std::string &value_)
{
    _dict[property_] = value_;
}

void zsock::metadata_t::clear ()
{
    _dict.clear ();
}

size_t zsock::metadata_t::property_len (const std::string &name_,
                                        size_t value_len_)
{
    return name_len_size + name_.size () + value_len_size + value_len_;
}

size_t zsock::metadata_t::add_property (unsigned char *ptr_,
                                        size_t ptr_capacity_,
                                        const std::string &name_,
                                        const void *value_,
                                        size_t value_len_)
{
    const size_t name_len = name_.size ();
    zsock_assert (name_len <= UCHAR_MAX);
    const size_t total_len = property_len (name_, value_len_);
    zsock_assert (total_len <= ptr_capacity_);

    *ptr_ = static_cast<unsigned char> (name_len);
    ptr_ += name_len_size;
    memcpy (ptr_, name_.data (), name_len);
    ptr_ += name_len;
    zsock_assert (value_len_ <= 0x7FFFFFFF);
    put_uint32 (ptr_, static_cast<uint32_t> (value_len_));
    ptr_ += value_len_size;
    if (value_len_)
        memcpy (ptr_, value_, value_len_);

    return total_len;
}

size_t zsock::metadata_t::encoded_size () const
{
    size_t size = 0;
    for (dict_t::const_iterator it = _dict.begin (), end = _dict.end ();
         it != end; ++it)
        size += property_len (it->first, it->second.size ());
    return size;
}

size_t zsock::metadata_t::write (unsigned char *ptr_,
                                 size_t ptr_capacity_) const
{
    unsigned char *ptr = ptr_;
    for (dict_t::const_iterator it = _dict.begin (), end = _dict.end ();
         it != end; ++it)
        ptr += add_property (ptr, ptr_capacity_ - (ptr - ptr_), it->first,
                             it->second.data (), it->second.size ());
    return ptr - ptr_;
}

int zsock::metadata_t::parse (const unsigned char *ptr_, size_t length_)
{
    dict_t dict;
    size_t bytes_left = length_;

    while (bytes_left > 1) {
        const size_t name_length = static_cast<size_t> (*ptr_);
        ptr_ += name_len_size;
        bytes_left -= name_len_size;
        if (bytes_left < name_length)
            break;

        const std::string name =
          std::string (reinterpret_cast<const char *> (ptr_), name_length);
        ptr_ += name_length;
        bytes_left -= name_length;
        if (bytes_left < value_len_size)
            break;

        const size_t value_length = static_cast<size_t> (get_uint32 (ptr_));
        ptr_ += value_len_size;
        bytes_left -= value_len_size;
        if (bytes_left < value_length)
            break;

        dict[name] = std::string (reinterpret_cast<const char *> (ptr_),
                                  value_length);
        ptr_ += value_length;
        bytes_left -= value_length;
    }
    if (bytes_left > 0) {
        errno = EPROTO;
        return -1;
    }

    _dict.swap (dict);
    return 0;
}
