/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/event_encoder.hpp"
#include "protocol/wire.hpp"
#include "utils/err.hpp"

tapewire::event_encoder_t::event_encoder_t (size_t bufsize_) :
    encoder_base_t<event_encoder_t> (bufsize_),
    _schema (NULL),
    _text_field (0)
{
    next_step (NULL, 0, &event_encoder_t::header_ready, true);
}

tapewire::event_encoder_t::~event_encoder_t ()
{
}

int tapewire::event_encoder_t::load_event (const event_t &event_)
{
    tapewire_assert (!busy ());

    if (event_.check () == -1)
        return -1;

    _schema = find_schema (event_.type ());
    tapewire_assert (_schema);
    event_.get_fields (_fields);

    start_event ();
    return 0;
}

size_t tapewire::event_encoder_t::next_text_field (size_t from_) const
{
    size_t index = from_;
    while (index < _schema->field_count
           && _schema->fields[index].kind != field_text)
        ++index;
    return index;
}

void tapewire::event_encoder_t::header_ready ()
{
    unsigned char *pos = _tmp_buf;
    put_uint8 (pos, _schema->tag);
    pos += tag_size;

    for (size_t i = 0; i < _schema->field_count; ++i) {
        if (_schema->fields[i].kind != field_text)
            continue;
        put_uint16 (pos, static_cast<uint16_t> (_fields[i].text.size ()));
        pos += text_length_size;
    }

    for (size_t i = 0; i < _schema->field_count; ++i) {
        if (_schema->fields[i].kind == field_uint32) {
            put_uint32 (pos, _fields[i].uint32);
            pos += numeric_size;
        } else if (_schema->fields[i].kind == field_float) {
            put_float (pos, _fields[i].real);
            pos += numeric_size;
        }
    }

    const size_t size = static_cast<size_t> (pos - _tmp_buf);
    tapewire_assert (size == tag_size + _schema->header_size);

    _text_field = next_text_field (0);
    if (_text_field == _schema->field_count)
        next_step (_tmp_buf, size, &event_encoder_t::header_ready, true);
    else
        next_step (_tmp_buf, size, &event_encoder_t::text_ready, false);
}

void tapewire::event_encoder_t::text_ready ()
{
    std::string &text = _fields[_text_field].text;
    _text_field = next_text_field (_text_field + 1);
    const bool last = _text_field == _schema->field_count;

    next_step (text.empty () ? NULL : &text[0], text.size (),
               last ? &event_encoder_t::header_ready
                    : &event_encoder_t::text_ready,
               last);
}

int tapewire::encode_event (const event_t &event_,
                            std::vector<unsigned char> &frame_)
{
    event_encoder_t encoder (tag_size + max_header_size);
    if (encoder.load_event (event_) == -1)
        return -1;

    while (true) {
        unsigned char *data = NULL;
        const size_t size = encoder.encode (&data, 0);
        if (size == 0)
            break;
        frame_.insert (frame_.end (), data, data + size);
    }
    return 0;
}
