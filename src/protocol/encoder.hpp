/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_ENCODER_HPP_INCLUDED__
#define __TAPEWIRE_ENCODER_HPP_INCLUDED__

#include <stddef.h>
#include <string.h>
#include <algorithm>
#include <vector>

#include "utils/err.hpp"
#include "protocol/i_encoder.hpp"

namespace tapewire
{
//  Helper base class for encoders. It implements the state machine that
//  fills the outgoing buffer. Derived classes should implement individual
//  state machine actions.
//
//  BUFFER LIFETIME POLICY:
//  The encode() function may return a pointer directly to the internal
//  encoder buffer or to the staged event fields. That pointer is valid
//  only until the next call to encode() or load_event(). A caller that
//  writes asynchronously must copy the bytes to a stable location before
//  starting the write.

template <typename T> class encoder_base_t : public i_encoder
{
  public:
    explicit encoder_base_t (size_t bufsize_) :
        _write_pos (NULL),
        _to_write (0),
        _next (NULL),
        _new_event_flag (false),
        _buf (bufsize_),
        _in_progress (false)
    {
        tapewire_assert (bufsize_ > 0);
    }

    ~encoder_base_t () TAPEWIRE_OVERRIDE {}

    //  The function returns a batch of binary data. The data
    //  are filled to a supplied buffer. If no buffer is supplied (data_
    //  points to NULL) encoder object will provide buffer of its own.
    size_t encode (unsigned char **data_, size_t size_) TAPEWIRE_FINAL
    {
        unsigned char *buffer = !*data_ ? &_buf[0] : *data_;
        const size_t buffersize = !*data_ ? _buf.size () : size_;

        if (!_in_progress)
            return 0;

        size_t pos = 0;
        while (pos < buffersize) {
            //  If there are no more data to return, run the state machine.
            //  If there are still no data, return what we already have
            //  in the buffer.
            if (!_to_write) {
                if (_new_event_flag) {
                    _in_progress = false;
                    break;
                }
                (static_cast<T *> (this)->*_next) ();
                continue;
            }

            //  If there are no data in the buffer yet and we are able to
            //  fill whole buffer in a single go, let's use zero-copy.
            if (!pos && !*data_ && _to_write >= buffersize) {
                *data_ = _write_pos;
                pos = _to_write;
                _write_pos = NULL;
                _to_write = 0;
                return pos;
            }

            //  Copy data to the buffer. If the buffer is full, return.
            const size_t to_copy = std::min (_to_write, buffersize - pos);
            memcpy (buffer + pos, _write_pos, to_copy);
            pos += to_copy;
            _write_pos += to_copy;
            _to_write -= to_copy;
        }

        *data_ = buffer;
        return pos;
    }

    bool busy () const TAPEWIRE_FINAL { return _in_progress; }

  protected:
    //  Prototype of state machine action.
    typedef void (T::*step_t) ();

    //  Called by the derived class once an event is staged; runs the first
    //  state machine action.
    void start_event ()
    {
        tapewire_assert (!_in_progress);
        _in_progress = true;
        (static_cast<T *> (this)->*_next) ();
    }

    //  This function should be called from derived class to write the data
    //  to the buffer and schedule next state machine action.
    void next_step (void *write_pos_,
                    size_t to_write_,
                    step_t next_,
                    bool new_event_flag_)
    {
        _write_pos = static_cast<unsigned char *> (write_pos_);
        _to_write = to_write_;
        _next = next_;
        _new_event_flag = new_event_flag_;
    }

  private:
    //  Where to get the data to write from.
    unsigned char *_write_pos;

    //  How much data to write before next step should be executed.
    size_t _to_write;

    //  Next step. If set to NULL, it means that associated data stream
    //  is dead.
    step_t _next;

    bool _new_event_flag;

    //  The buffer for encoded data.
    std::vector<unsigned char> _buf;

    bool _in_progress;

    TAPEWIRE_NON_COPYABLE_NOR_MOVABLE (encoder_base_t)
};
}

#endif
