/* SPDX-License-Identifier: MPL-2.0 */

#include "core/log_sink.hpp"
#include "protocol/event.hpp"
#include "utils/err.hpp"

namespace
{
std::string format_price (float price_)
{
    char buf[64];
    snprintf (buf, sizeof buf, "$%.2f", static_cast<double> (price_));
    return buf;
}
}

std::string tapewire::format_event (const event_t &event_)
{
    std::string line;

    switch (event_.type ()) {
        case TAPEWIRE_EVENT_LOG: {
            const log_event_t &log = event_.log ();
            line = "[LOG] " + log.level + ": " + log.message;
            break;
        }
        case TAPEWIRE_EVENT_MATCH: {
            const match_event_t &match = event_.match ();
            char quantity[32];
            snprintf (quantity, sizeof quantity, "%lld",
                      static_cast<long long> (match.quantity));
            line = "[MATCH] " + match.side + " " + quantity + " "
                   + match.symbol + " @ " + format_price (match.price);
            break;
        }
        case TAPEWIRE_EVENT_PRICE_UPDATE: {
            const price_update_event_t &update = event_.price_update ();
            line = "[PRICE] " + update.symbol + ": "
                   + format_price (update.old_price) + " -> "
                   + format_price (update.new_price);
            break;
        }
        default:
            tapewire_assert (false);
    }
    return line;
}

tapewire::log_sink_t::log_sink_t (FILE *out_) : _out (out_), _events (0)
{
    tapewire_assert (_out);
}

void tapewire::log_sink_t::connected (const std::string &peer_)
{
    write_line ("[STATUS] Connected by " + peer_);
}

void tapewire::log_sink_t::event_received (const std::string &peer_,
                                           std::unique_ptr<event_t> event_)
{
    LIBTAPEWIRE_UNUSED (peer_);
    ++_events;
    write_line (format_event (*event_));
}

void tapewire::log_sink_t::disconnected (const std::string &peer_)
{
    write_line ("[STATUS] Connection from " + peer_ + " closed");
}

void tapewire::log_sink_t::failed (const std::string &peer_, int errno_)
{
    write_line ("[ERROR] " + peer_ + ": " + tapewire_strerror (errno_));
}

void tapewire::log_sink_t::write_line (const std::string &line_)
{
    fwrite (line_.data (), 1, line_.size (), _out);
    fputc ('\n', _out);
    fflush (_out);
}
