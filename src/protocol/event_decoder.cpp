/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/event_decoder.hpp"
#include "protocol/wire.hpp"
#include "utils/err.hpp"

#include <new>

tapewire::event_decoder_t::event_decoder_t () :
    _stage (awaiting_tag), _tag (0), _schema (NULL)
{
    next_step (&_tag, tag_size, &event_decoder_t::tag_ready);
}

tapewire::event_decoder_t::~event_decoder_t ()
{
}

int tapewire::event_decoder_t::finish ()
{
    if (failed ()) {
        errno = failure ();
        return -1;
    }

    if (in_frame ()) {
        fail (EINCOMPLETE);
        return -1;
    }
    return 0;
}

std::unique_ptr<tapewire::event_t> tapewire::event_decoder_t::release_event ()
{
    return std::move (_event);
}

int tapewire::event_decoder_t::tag_ready ()
{
    //  There is no frame delimiter to resynchronise on, so an unknown tag
    //  ends the stream.
    _schema = find_schema (_tag);
    if (unlikely (_schema == NULL)) {
        errno = EPROTO;
        return -1;
    }

    _stage = awaiting_header;
    next_step (_tmpbuf, _schema->header_size,
               &event_decoder_t::header_ready);
    return 0;
}

int tapewire::event_decoder_t::header_ready ()
{
    _fields.clear ();
    _fields.resize (_schema->field_count);

    const unsigned char *pos = _tmpbuf;
    size_t payload_size = 0;

    //  Text lengths come first. The text slots are sized now and filled
    //  once the payload arrives.
    for (size_t i = 0; i < _schema->field_count; ++i) {
        if (_schema->fields[i].kind != field_text)
            continue;
        const size_t text_size = get_uint16 (pos);
        _fields[i].text.resize (text_size);
        payload_size += text_size;
        pos += text_length_size;
    }

    for (size_t i = 0; i < _schema->field_count; ++i) {
        if (_schema->fields[i].kind == field_uint32) {
            _fields[i].uint32 = get_uint32 (pos);
            pos += numeric_size;
        } else if (_schema->fields[i].kind == field_float) {
            _fields[i].real = get_float (pos);
            pos += numeric_size;
        }
    }

    _payload.resize (payload_size);
    _stage = awaiting_payload;
    next_step (_payload.empty () ? NULL : &_payload[0], _payload.size (),
               &event_decoder_t::payload_ready);
    return 0;
}

int tapewire::event_decoder_t::payload_ready ()
{
    const unsigned char *pos = _payload.empty () ? NULL : &_payload[0];
    for (size_t i = 0; i < _schema->field_count; ++i) {
        if (_schema->fields[i].kind != field_text)
            continue;
        std::string &text = _fields[i].text;
        if (!text.empty ()) {
            memcpy (&text[0], pos, text.size ());
            pos += text.size ();
        }
    }

    _event.reset (new (std::nothrow)
                    event_t (event_t::from_fields (_tag, _fields)));
    alloc_assert (_event);

    _stage = awaiting_tag;
    next_step (&_tag, tag_size, &event_decoder_t::tag_ready);
    return 1;
}
