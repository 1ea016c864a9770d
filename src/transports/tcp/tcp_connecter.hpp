/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_TCP_CONNECTER_HPP_INCLUDED__
#define __TAPEWIRE_TCP_CONNECTER_HPP_INCLUDED__

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>

#include <memory>
#include <string>

#include "core/options.hpp"
#include "utils/macros.hpp"

namespace tapewire
{
struct i_event_sink;
class event_t;
class stream_engine_t;

//  Producer side. Connects to one endpoint using async_connect and, once
//  connected, hands the socket to a stream_engine_t. A failed attempt is
//  retried every reconnect_ivl ms; with reconnect_ivl -1 the failure is
//  reported to the sink instead. A connection that breaks after being
//  established is not resumed.
//
//  The connecter must stay alive until its io_context has stopped running
//  or close() has been called and the context polled. The sink must
//  outlive the connecter: destroying a connected connecter terminates its
//  connection, and the sink hears disconnected() or failed() from within
//  the destructor.

class tcp_connecter_t
{
  public:
    tcp_connecter_t (boost::asio::io_context &io_context_,
                     const options_t &options_,
                     i_event_sink *sink_);
    ~tcp_connecter_t ();

    //  Starts connecting to endpoint_. Returns 0 if the attempt started,
    //  -1 with errno set (EINVAL, EPROTONOSUPPORT, EHOSTUNREACH) otherwise.
    int connect (const std::string &endpoint_);

    //  Queues event_ on the connection. Fails with ENOTCONN before the
    //  connection is up or after it ended; see stream_engine_t::send.
    int send (const event_t &event_);

    //  Abandons a pending attempt, or flushes and closes the connection.
    void close ();

    bool connected () const;

    //  The engine of the established connection, if any.
    const std::shared_ptr<stream_engine_t> &engine () const { return _engine; }

  private:
    void start_connecting ();
    void on_connect (const boost::system::error_code &ec_);
    void add_reconnect_timer ();
    void on_reconnect_timer (const boost::system::error_code &ec_);
    void create_engine ();

    boost::asio::io_context &_io_context;
    const options_t _options;
    i_event_sink *const _sink;

    //  The ASIO socket for connecting
    boost::asio::ip::tcp::socket _socket;

    //  Target endpoint for connection
    boost::asio::ip::tcp::endpoint _endpoint;

    //  String representation of endpoint to connect to
    std::string _endpoint_str;

    boost::asio::steady_timer _reconnect_timer;

    //  True iff a timer has been started.
    bool _reconnect_timer_started;

    //  True iff an async_connect is in progress
    bool _connecting;

    //  True once close() has been called
    bool _terminating;

    std::shared_ptr<stream_engine_t> _engine;

    TAPEWIRE_NON_COPYABLE_NOR_MOVABLE (tcp_connecter_t)
};
}

#endif
