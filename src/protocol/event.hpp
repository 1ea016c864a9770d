/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_EVENT_HPP_INCLUDED__
#define __TAPEWIRE_EVENT_HPP_INCLUDED__

#include <stdint.h>
#include <string>
#include <vector>

#include "protocol/schema.hpp"

namespace tapewire
{
struct log_event_t
{
    std::string level;
    std::string message;
};

struct match_event_t
{
    match_event_t () : quantity (0), price (0.0f) {}

    std::string side;
    int64_t quantity;
    std::string symbol;
    float price;
};

struct price_update_event_t
{
    price_update_event_t () : old_price (0.0f), new_price (0.0f) {}

    std::string symbol;
    float old_price;
    float new_price;
};

//  One telemetry event. The type tag selects which of the three variants
//  is held; accessors for any other variant assert.
class event_t
{
  public:
    explicit event_t (const log_event_t &log_);
    explicit event_t (const match_event_t &match_);
    explicit event_t (const price_update_event_t &price_update_);

    uint8_t type () const { return _type; }

    const log_event_t &log () const;
    const match_event_t &match () const;
    const price_update_event_t &price_update () const;

    //  Checks that every field fits its wire width. Returns 0 on success.
    //  Otherwise returns -1 and sets errno to EMSGSIZE (text longer than
    //  TAPEWIRE_MAX_TEXT_SIZE) or ERANGE (quantity outside u32).
    int check () const;

    //  Copies the fields into values_ in schema order. The event must have
    //  passed check().
    void get_fields (std::vector<field_value_t> &values_) const;

    //  Builds an event of type tag_ from values_ in schema order. Text
    //  values are moved out of values_.
    static event_t from_fields (uint8_t tag_,
                                std::vector<field_value_t> &values_);

    bool operator== (const event_t &other_) const;
    bool operator!= (const event_t &other_) const
    {
        return !(*this == other_);
    }

  private:
    event_t ();

    uint8_t _type;
    log_event_t _log;
    match_event_t _match;
    price_update_event_t _price_update;
};
}

#endif
