/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_DECODER_HPP_INCLUDED__
#define __TAPEWIRE_DECODER_HPP_INCLUDED__

#include <stddef.h>
#include <string.h>
#include <algorithm>

#include "utils/err.hpp"
#include "protocol/i_decoder.hpp"

namespace tapewire
{
//  Helper base class for decoders that know the amount of data to read
//  in advance at any moment. Knowing the amount in advance is a property
//  of the protocol used. The decoder never looks at a partial unit: bytes
//  are accumulated across decode() calls until exactly the requested
//  amount is held, and only then is the next state machine action run.
//
//  This class implements the state machine that parses the incoming
//  buffer. Derived class should implement individual state machine
//  actions.
//
//  Once an action fails the decoder is dead. Every further call returns
//  -1 with the errno of the original failure.

template <typename T> class decoder_base_t : public i_decoder
{
  public:
    decoder_base_t () :
        _next (NULL), _read_pos (NULL), _to_read (0), _failure (0)
    {
    }

    ~decoder_base_t () TAPEWIRE_OVERRIDE {}

    int decode (const unsigned char *data_,
                size_t size_,
                size_t &bytes_used_) TAPEWIRE_FINAL
    {
        bytes_used_ = 0;

        if (unlikely (_next == NULL)) {
            errno = _failure;
            return -1;
        }

        while (bytes_used_ < size_) {
            //  Copy the data from buffer to the message.
            const size_t to_copy = std::min (_to_read, size_ - bytes_used_);
            memcpy (_read_pos, data_ + bytes_used_, to_copy);

            _read_pos += to_copy;
            _to_read -= to_copy;
            bytes_used_ += to_copy;

            //  Try to get more space in the message to fill in.
            //  If none is available, return.
            while (_to_read == 0) {
                const int rc = (static_cast<T *> (this)->*_next) ();
                if (rc != 0) {
                    if (rc == -1)
                        fail (errno);
                    return rc;
                }
            }
        }

        return 0;
    }

  protected:
    //  Prototype of state machine action. Action should return -1 on
    //  error (with errno set), 1 when a complete frame has been decoded
    //  and 0 when more data is required.
    typedef int (T::*step_t) ();

    //  This function should be called from derived class to read data
    //  from the buffer and schedule next state machine action.
    void next_step (void *read_pos_, size_t to_read_, step_t next_)
    {
        _read_pos = static_cast<unsigned char *> (read_pos_);
        _to_read = to_read_;
        _next = next_;
    }

    //  Marks the decoder dead with errno_ as the reported failure.
    void fail (int errno_)
    {
        _failure = errno_;
        _next = NULL;
        _read_pos = NULL;
        _to_read = 0;
        errno = errno_;
    }

    bool failed () const { return _next == NULL; }
    int failure () const { return _failure; }

  private:
    //  Next step. If set to NULL, it means that associated data stream
    //  is dead.
    step_t _next;

    //  Where to store the read data.
    unsigned char *_read_pos;

    //  How much data to read before taking next step.
    size_t _to_read;

    //  errno reported once the stream is dead.
    int _failure;

    TAPEWIRE_NON_COPYABLE_NOR_MOVABLE (decoder_base_t)
};
}

#endif
