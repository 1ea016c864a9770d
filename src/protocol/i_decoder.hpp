/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_I_DECODER_HPP_INCLUDED__
#define __TAPEWIRE_I_DECODER_HPP_INCLUDED__

#include <stddef.h>

#include "utils/macros.hpp"

namespace tapewire
{
//  Interface to be implemented by event decoders.

class i_decoder
{
  public:
    virtual ~i_decoder () TAPEWIRE_DEFAULT

    //  Decodes data_ pointed to by data_.
    //  When a frame is complete, 1 is returned and bytes_used_ tells how
    //  many bytes of data_ were consumed so far. When all data are consumed
    //  without completing a frame, 0 is returned. On error, -1 is returned
    //  and errno set accordingly.
    virtual int
    decode (const unsigned char *data_, size_t size_, size_t &bytes_used_) = 0;

    //  Tells the decoder the stream has ended. Returns 0 if the stream
    //  ended on a frame boundary, otherwise -1 with errno set.
    virtual int finish () = 0;
};
}

#endif
