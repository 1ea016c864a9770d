/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_EVENT_DECODER_HPP_INCLUDED__
#define __TAPEWIRE_EVENT_DECODER_HPP_INCLUDED__

#include <memory>
#include <vector>

#include "protocol/decoder.hpp"
#include "protocol/event.hpp"
#include "protocol/schema.hpp"

namespace tapewire
{
//  Decoder for the event stream framing.
class event_decoder_t TAPEWIRE_FINAL : public decoder_base_t<event_decoder_t>
{
  public:
    enum stage_t
    {
        awaiting_tag,
        awaiting_header,
        awaiting_payload
    };

    event_decoder_t ();
    ~event_decoder_t ();

    int finish () TAPEWIRE_OVERRIDE;

    //  Hands over the event completed by the last decode() that returned 1.
    std::unique_ptr<event_t> release_event ();

    stage_t stage () const { return _stage; }

    //  True if bytes of an unfinished frame are buffered.
    bool in_frame () const { return _stage != awaiting_tag; }

  private:
    int tag_ready ();
    int header_ready ();
    int payload_ready ();

    stage_t _stage;
    unsigned char _tag;
    const event_schema_t *_schema;
    unsigned char _tmpbuf[max_header_size];
    std::vector<field_value_t> _fields;
    std::vector<unsigned char> _payload;
    std::unique_ptr<event_t> _event;

    TAPEWIRE_NON_COPYABLE_NOR_MOVABLE (event_decoder_t)
};
}

#endif
