/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/event.hpp"
#include "utils/err.hpp"

#include <string.h>

namespace
{
bool same_float (float a_, float b_)
{
    return memcmp (&a_, &b_, sizeof (float)) == 0;
}

bool text_fits (const std::string &text_)
{
    return text_.size () <= TAPEWIRE_MAX_TEXT_SIZE;
}
}

tapewire::event_t::event_t () : _type (0)
{
    _match.quantity = 0;
    _match.price = 0.0f;
    _price_update.old_price = 0.0f;
    _price_update.new_price = 0.0f;
}

tapewire::event_t::event_t (const log_event_t &log_) : event_t ()
{
    _type = TAPEWIRE_EVENT_LOG;
    _log = log_;
}

tapewire::event_t::event_t (const match_event_t &match_) : event_t ()
{
    _type = TAPEWIRE_EVENT_MATCH;
    _match = match_;
}

tapewire::event_t::event_t (const price_update_event_t &price_update_) :
    event_t ()
{
    _type = TAPEWIRE_EVENT_PRICE_UPDATE;
    _price_update = price_update_;
}

const tapewire::log_event_t &tapewire::event_t::log () const
{
    tapewire_assert (_type == TAPEWIRE_EVENT_LOG);
    return _log;
}

const tapewire::match_event_t &tapewire::event_t::match () const
{
    tapewire_assert (_type == TAPEWIRE_EVENT_MATCH);
    return _match;
}

const tapewire::price_update_event_t &
tapewire::event_t::price_update () const
{
    tapewire_assert (_type == TAPEWIRE_EVENT_PRICE_UPDATE);
    return _price_update;
}

int tapewire::event_t::check () const
{
    switch (_type) {
        case TAPEWIRE_EVENT_LOG:
            if (!text_fits (_log.level) || !text_fits (_log.message)) {
                errno = EMSGSIZE;
                return -1;
            }
            return 0;

        case TAPEWIRE_EVENT_MATCH:
            if (!text_fits (_match.side) || !text_fits (_match.symbol)) {
                errno = EMSGSIZE;
                return -1;
            }
            if (_match.quantity < 0 || _match.quantity > 0xFFFFFFFFll) {
                errno = ERANGE;
                return -1;
            }
            return 0;

        case TAPEWIRE_EVENT_PRICE_UPDATE:
            if (!text_fits (_price_update.symbol)) {
                errno = EMSGSIZE;
                return -1;
            }
            return 0;

        default:
            tapewire_assert (false);
            return -1;
    }
}

void tapewire::event_t::get_fields (std::vector<field_value_t> &values_) const
{
    const event_schema_t *schema = find_schema (_type);
    tapewire_assert (schema);
    values_.resize (schema->field_count);

    switch (_type) {
        case TAPEWIRE_EVENT_LOG:
            values_[0].text = _log.level;
            values_[1].text = _log.message;
            break;

        case TAPEWIRE_EVENT_MATCH:
            values_[0].text = _match.side;
            values_[1].text = _match.symbol;
            values_[2].uint32 = static_cast<uint32_t> (_match.quantity);
            values_[3].real = _match.price;
            break;

        case TAPEWIRE_EVENT_PRICE_UPDATE:
            values_[0].text = _price_update.symbol;
            values_[1].real = _price_update.old_price;
            values_[2].real = _price_update.new_price;
            break;
    }
}

tapewire::event_t
tapewire::event_t::from_fields (uint8_t tag_,
                                std::vector<field_value_t> &values_)
{
    const event_schema_t *schema = find_schema (tag_);
    tapewire_assert (schema);
    tapewire_assert (values_.size () == schema->field_count);

    event_t event;
    event._type = tag_;

    switch (tag_) {
        case TAPEWIRE_EVENT_LOG:
            event._log.level.swap (values_[0].text);
            event._log.message.swap (values_[1].text);
            break;

        case TAPEWIRE_EVENT_MATCH:
            event._match.side.swap (values_[0].text);
            event._match.symbol.swap (values_[1].text);
            event._match.quantity = values_[2].uint32;
            event._match.price = values_[3].real;
            break;

        case TAPEWIRE_EVENT_PRICE_UPDATE:
            event._price_update.symbol.swap (values_[0].text);
            event._price_update.old_price = values_[1].real;
            event._price_update.new_price = values_[2].real;
            break;
    }
    return event;
}

bool tapewire::event_t::operator== (const event_t &other_) const
{
    if (_type != other_._type)
        return false;

    switch (_type) {
        case TAPEWIRE_EVENT_LOG:
            return _log.level == other_._log.level
                   && _log.message == other_._log.message;

        case TAPEWIRE_EVENT_MATCH:
            return _match.side == other_._match.side
                   && _match.quantity == other_._match.quantity
                   && _match.symbol == other_._match.symbol
                   && same_float (_match.price, other_._match.price);

        case TAPEWIRE_EVENT_PRICE_UPDATE:
            return _price_update.symbol == other_._price_update.symbol
                   && same_float (_price_update.old_price,
                                  other_._price_update.old_price)
                   && same_float (_price_update.new_price,
                                  other_._price_update.new_price);

        default:
            return true;
    }
}
