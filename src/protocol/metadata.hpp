/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __ZSOCK_METADATA_HPP_INCLUDED__
#define __ZSOCK_METADATA_HPP_INCLUDED__

#include <map>
#include <string>

#include <stddef.h>

namespace zsock
{
//  Name/value properties exchanged in READY and INITIATE commands.
//
//  Wire format of one property: a one byte name length, the name, a four
//  byte big-endian value length and the value.

class metadata_t
{
  public:
    typedef std::map<std::string, std::string> dict_t;

    metadata_t ();
    explicit metadata_t (const dict_t &dict_);

    //  Returns pointer to property value or NULL if
    //  property is not found.
    const char *get (const std::string &property_) const;

    void set (const std::string &property_, const std::string &value_);
    void clear ();
    const dict_t &dict () const { return _dict; }

    //  Number of bytes write () produces.
    size_t encoded_size () const;

    //  Writes every property to ptr_. Returns the number of bytes written.
    size_t write (unsigned char *ptr_, size_t ptr_capacity_) const;

    //  Replaces the contents with the properties in ptr_. Fails with EPROTO
    //  when the block is malformed.
    int parse (const unsigned char *ptr_, size_t length_);

    static size_t property_len (const std::string &name_, size_t value_len_);

    static size_t add_property (unsigned char *ptr_,
                                size_t ptr_capacity_,
                                const std::string &name_,
                                const void *value_,
                                size_t value_len_);

  private:
    //  Dictionary holding metadata.
    dict_t _dict;
};
}

#endif
