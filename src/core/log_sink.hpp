/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_LOG_SINK_HPP_INCLUDED__
#define __TAPEWIRE_LOG_SINK_HPP_INCLUDED__

#include <stdio.h>
#include <string>

#include "core/i_event_sink.hpp"

namespace tapewire
{
//  Renders one event as a single text line, without line terminator.
std::string format_event (const event_t &event_);

//  Event sink that writes one line per notification to a stdio stream.
class log_sink_t TAPEWIRE_FINAL : public i_event_sink
{
  public:
    explicit log_sink_t (FILE *out_);

    void connected (const std::string &peer_) TAPEWIRE_OVERRIDE;
    void event_received (const std::string &peer_,
                         std::unique_ptr<event_t> event_) TAPEWIRE_OVERRIDE;
    void disconnected (const std::string &peer_) TAPEWIRE_OVERRIDE;
    void failed (const std::string &peer_, int errno_) TAPEWIRE_OVERRIDE;

    size_t events () const { return _events; }

  private:
    void write_line (const std::string &line_);

    FILE *const _out;
    size_t _events;

    TAPEWIRE_NON_COPYABLE_NOR_MOVABLE (log_sink_t)
};
}

#endif
