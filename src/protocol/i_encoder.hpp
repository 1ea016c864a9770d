/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_I_ENCODER_HPP_INCLUDED__
#define __TAPEWIRE_I_ENCODER_HPP_INCLUDED__

#include <stddef.h>

#include "utils/macros.hpp"

namespace tapewire
{
//  Forward declaration
class event_t;

//  Interface to be implemented by event encoders.

struct i_encoder
{
    virtual ~i_encoder () TAPEWIRE_DEFAULT

    //  The function returns a batch of binary data. The data
    //  are filled to a supplied buffer. If no buffer is supplied (data_
    //  is NULL) encoder will provide buffer of its own.
    //  Function returns 0 when a new event is required.
    virtual size_t encode (unsigned char **data_, size_t size_) = 0;

    //  Load a new event into encoder. Returns -1 and sets errno if the
    //  event cannot be represented on the wire; nothing is staged then.
    virtual int load_event (const event_t &event_) = 0;

    //  True while a loaded event has bytes left to hand out.
    virtual bool busy () const = 0;
};
}

#endif
