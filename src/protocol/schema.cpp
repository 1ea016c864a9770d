/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/schema.hpp"
#include "../../include/tapewire.h"

namespace
{
const tapewire::field_def_t log_fields[] = {
  {"level", tapewire::field_text},
  {"message", tapewire::field_text},
};

const tapewire::field_def_t match_fields[] = {
  {"side", tapewire::field_text},
  {"symbol", tapewire::field_text},
  {"quantity", tapewire::field_uint32},
  {"price", tapewire::field_float},
};

const tapewire::field_def_t price_update_fields[] = {
  {"symbol", tapewire::field_text},
  {"old_price", tapewire::field_float},
  {"new_price", tapewire::field_float},
};

//  len_level:u16 len_message:u16
//  len_side:u16 len_symbol:u16 quantity:u32 price:f32
//  len_symbol:u16 old_price:f32 new_price:f32
const tapewire::event_schema_t schemas[] = {
  {TAPEWIRE_EVENT_LOG, "log", log_fields, 2, 2, 4},
  {TAPEWIRE_EVENT_MATCH, "match", match_fields, 4, 2, 12},
  {TAPEWIRE_EVENT_PRICE_UPDATE, "price_update", price_update_fields, 3, 1,
   10},
};
}

const tapewire::event_schema_t *tapewire::find_schema (uint8_t tag_)
{
    for (size_t i = 0; i < sizeof (schemas) / sizeof (schemas[0]); ++i)
        if (schemas[i].tag == tag_)
            return &schemas[i];
    return NULL;
}
