/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_WIRE_HPP_INCLUDED__
#define __TAPEWIRE_WIRE_HPP_INCLUDED__

#include <stdint.h>
#include <string.h>

namespace tapewire
{
//  Helper functions to convert different integer and float types to/from
//  network byte order.

inline void put_uint8 (unsigned char *buffer_, uint8_t value_)
{
    *buffer_ = value_;
}

inline uint8_t get_uint8 (const unsigned char *buffer_)
{
    return *buffer_;
}

inline void put_uint16 (unsigned char *buffer_, uint16_t value_)
{
    buffer_[0] = static_cast<unsigned char> (((value_) >> 8) & 0xff);
    buffer_[1] = static_cast<unsigned char> (value_ & 0xff);
}

inline uint16_t get_uint16 (const unsigned char *buffer_)
{
    return (static_cast<uint16_t> (buffer_[0]) << 8)
           | static_cast<uint16_t> (buffer_[1]);
}

inline void put_uint32 (unsigned char *buffer_, uint32_t value_)
{
    buffer_[0] = static_cast<unsigned char> (((value_) >> 24) & 0xff);
    buffer_[1] = static_cast<unsigned char> (((value_) >> 16) & 0xff);
    buffer_[2] = static_cast<unsigned char> (((value_) >> 8) & 0xff);
    buffer_[3] = static_cast<unsigned char> (value_ & 0xff);
}

inline uint32_t get_uint32 (const unsigned char *buffer_)
{
    return (static_cast<uint32_t> (buffer_[0]) << 24)
           | (static_cast<uint32_t> (buffer_[1]) << 16)
           | (static_cast<uint32_t> (buffer_[2]) << 8)
           | static_cast<uint32_t> (buffer_[3]);
}

//  IEEE-754 single precision, sent as its bit pattern in network order.
static_assert (sizeof (float) == 4, "32-bit float required");

inline void put_float (unsigned char *buffer_, float value_)
{
    uint32_t bits;
    memcpy (&bits, &value_, sizeof (bits));
    put_uint32 (buffer_, bits);
}

inline float get_float (const unsigned char *buffer_)
{
    const uint32_t bits = get_uint32 (buffer_);
    float value;
    memcpy (&value, &bits, sizeof (value));
    return value;
}
}

#endif
