/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_EVENT_ENCODER_HPP_INCLUDED__
#define __TAPEWIRE_EVENT_ENCODER_HPP_INCLUDED__

#include <vector>

#include "protocol/encoder.hpp"
#include "protocol/event.hpp"
#include "protocol/schema.hpp"

namespace tapewire
{
//  Encoder for the event stream framing: tag, fixed-width header, text
//  payload.
class event_encoder_t TAPEWIRE_FINAL : public encoder_base_t<event_encoder_t>
{
  public:
    explicit event_encoder_t (size_t bufsize_);
    ~event_encoder_t ();

    int load_event (const event_t &event_) TAPEWIRE_OVERRIDE;

  private:
    void header_ready ();
    void text_ready ();

    //  Index of the first text field at or after from_, or field_count.
    size_t next_text_field (size_t from_) const;

    const event_schema_t *_schema;
    std::vector<field_value_t> _fields;
    size_t _text_field;
    unsigned char _tmp_buf[tag_size + max_header_size];

    TAPEWIRE_NON_COPYABLE_NOR_MOVABLE (event_encoder_t)
};

//  Appends the complete frame for event_ to frame_. Returns 0 on success.
//  On failure returns -1 with errno set (EMSGSIZE, ERANGE) and leaves
//  frame_ untouched.
int encode_event (const event_t &event_, std::vector<unsigned char> &frame_);
}

#endif
