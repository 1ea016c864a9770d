/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_I_EVENT_SINK_HPP_INCLUDED__
#define __TAPEWIRE_I_EVENT_SINK_HPP_INCLUDED__

#include <memory>
#include <string>

#include "utils/macros.hpp"

namespace tapewire
{
class event_t;

//  Receives what happens on connections. Called from the thread running
//  the connection's io_context. For each connection, connected() comes
//  first and exactly one of disconnected() or failed() comes last.

struct i_event_sink
{
    virtual ~i_event_sink () TAPEWIRE_DEFAULT

    virtual void connected (const std::string &peer_) = 0;

    //  A complete frame was decoded. The sink owns event_.
    virtual void event_received (const std::string &peer_,
                                 std::unique_ptr<event_t> event_) = 0;

    //  The stream ended cleanly on a frame boundary.
    virtual void disconnected (const std::string &peer_) = 0;

    //  The connection broke. errno_ is one of EPROTO, EINCOMPLETE,
    //  ETIMEDOUT or the transport's error.
    virtual void failed (const std::string &peer_, int errno_) = 0;
};
}

#endif
