/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_TCP_LISTENER_HPP_INCLUDED__
#define __TAPEWIRE_TCP_LISTENER_HPP_INCLUDED__

#include <boost/asio.hpp>

#include <memory>
#include <set>
#include <string>

#include "core/options.hpp"
#include "utils/macros.hpp"

namespace tapewire
{
struct i_event_sink;
class stream_engine_t;

//  Consumer side. Accepts any number of connections and runs one
//  stream_engine_t per connection, all reporting to the same sink.
//
//  The listener must stay alive until its io_context has stopped running
//  or close() has been called and the context polled.

class tcp_listener_t
{
  public:
    tcp_listener_t (boost::asio::io_context &io_context_,
                    const options_t &options_,
                    i_event_sink *sink_);
    ~tcp_listener_t ();

    //  Binds to endpoint_ and starts accepting. Returns 0 on success, -1
    //  with errno set (EINVAL, EPROTONOSUPPORT, EHOSTUNREACH, EADDRINUSE)
    //  otherwise.
    int bind (const std::string &endpoint_);

    //  The endpoint actually bound, with any ephemeral port resolved.
    const std::string &last_endpoint () const { return _endpoint; }

    //  Stops accepting and ends every live connection.
    void close ();

    //  Number of connections that have not ended yet.
    size_t connection_count ();

  private:
    void start_accept ();
    void on_accept (const boost::system::error_code &ec_);
    void create_engine ();

    //  Drops engines that already delivered their final notification.
    void prune_engines ();

    boost::asio::io_context &_io_context;
    const options_t _options;
    i_event_sink *const _sink;

    boost::asio::ip::tcp::acceptor _acceptor;

    //  Socket for the next accepted connection
    boost::asio::ip::tcp::socket _accept_socket;

    std::string _endpoint;

    //  True while an async_accept is outstanding
    bool _accepting;

    std::set<std::shared_ptr<stream_engine_t> > _engines;

    TAPEWIRE_NON_COPYABLE_NOR_MOVABLE (tcp_listener_t)
};
}

#endif
