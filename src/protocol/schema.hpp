/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_SCHEMA_HPP_INCLUDED__
#define __TAPEWIRE_SCHEMA_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <string>

namespace tapewire
{
enum field_kind_t
{
    field_text,
    field_uint32,
    field_float
};

struct field_def_t
{
    const char *name;
    field_kind_t kind;
};

//  Wire layout of one event type. Fields are listed in declaration order.
//  A frame is the tag byte, then the header (u16 length of every text field
//  in order, followed by every numeric field in order), then the payload
//  (the bytes of every text field in order).
struct event_schema_t
{
    uint8_t tag;
    const char *name;
    const field_def_t *fields;
    size_t field_count;
    size_t text_count;
    size_t header_size;
};

enum
{
    tag_size = 1,
    text_length_size = 2,
    numeric_size = 4,
    max_fields = 4,
    max_header_size = 12
};

//  Returns the layout for tag_, or NULL if tag_ is not a known event type.
const event_schema_t *find_schema (uint8_t tag_);

//  A single field value. Only the member matching the field kind is used.
struct field_value_t
{
    field_value_t () : uint32 (0), real (0.0f) {}

    std::string text;
    uint32_t uint32;
    float real;
};
}

#endif
