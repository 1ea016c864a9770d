/* SPDX-License-Identifier: MPL-2.0 */

#include "transports/tcp/tcp_connecter.hpp"
#include "transports/tcp/tcp_address.hpp"
#include "transports/tcp/tcp_transport.hpp"
#include "engine/asio/error_handler.hpp"
#include "engine/asio/stream_engine.hpp"
#include "core/address.hpp"
#include "core/i_event_sink.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <chrono>

tapewire::tcp_connecter_t::tcp_connecter_t (
  boost::asio::io_context &io_context_,
  const options_t &options_,
  i_event_sink *sink_) :
    _io_context (io_context_),
    _options (options_),
    _sink (sink_),
    _socket (io_context_),
    _reconnect_timer (io_context_),
    _reconnect_timer_started (false),
    _connecting (false),
    _terminating (false)
{
    tapewire_assert (_sink);
}

tapewire::tcp_connecter_t::~tcp_connecter_t ()
{
    TW_DBG_CONN ("Destructor called");

    _terminating = true;
    boost::system::error_code ec;
    _socket.close (ec);
    if (_reconnect_timer_started)
        _reconnect_timer.cancel ();

    //  The engine outlives us through its pending handlers; it must not
    //  reach the sink afterwards.
    if (_engine)
        _engine->terminate ();

    //  Process the cancelled handlers while the object is still alive.
    if ((_connecting || _reconnect_timer_started) && !_io_context.stopped ())
        _io_context.poll ();
}

int tapewire::tcp_connecter_t::connect (const std::string &endpoint_)
{
    if (_connecting || _reconnect_timer_started || _engine || _terminating) {
        errno = EINVAL;
        return -1;
    }

    address_t addr;
    if (addr.parse (endpoint_) != 0)
        return -1;
    if (addr.host == "*" || addr.port == 0) {
        errno = EINVAL;
        return -1;
    }

    if (resolve_tcp_address (_io_context, addr, false, _endpoint) != 0)
        return -1;
    _endpoint_str = endpoint_to_string (_endpoint);

    TW_DBG_CONN ("connect: endpoint=%s", _endpoint_str.c_str ());

    start_connecting ();
    return 0;
}

int tapewire::tcp_connecter_t::send (const event_t &event_)
{
    if (!_engine) {
        errno = ENOTCONN;
        return -1;
    }
    return _engine->send (event_);
}

void tapewire::tcp_connecter_t::close ()
{
    TW_DBG_CONN ("close called, connecting=%d", _connecting);

    _terminating = true;

    if (_reconnect_timer_started) {
        _reconnect_timer.cancel ();
        _reconnect_timer_started = false;
    }

    //  Cancels any pending async_connect
    boost::system::error_code ec;
    _socket.close (ec);

    if (_engine)
        _engine->close ();
}

bool tapewire::tcp_connecter_t::connected () const
{
    return _engine && _engine->active ();
}

void tapewire::tcp_connecter_t::start_connecting ()
{
    boost::system::error_code ec;
    _socket.open (_endpoint.protocol (), ec);
    if (ec) {
        TW_DBG_CONN ("start_connecting: socket open failed: %s",
                     ec.message ().c_str ());
        on_connect (ec);
        return;
    }

    TW_DBG_CONN ("start_connecting: initiating async_connect to %s",
                 _endpoint_str.c_str ());

    _connecting = true;
    _socket.async_connect (
      _endpoint,
      [this] (const boost::system::error_code &ec) { on_connect (ec); });
}

void tapewire::tcp_connecter_t::on_connect (const boost::system::error_code &ec_)
{
    _connecting = false;
    TW_DBG_CONN ("on_connect: ec=%s, terminating=%d", ec_.message ().c_str (),
                 _terminating);

    //  If terminating, just return - close() already handled everything
    if (_terminating)
        return;

    if (ec_) {
        const asio_error::error_info_t info = asio_error::classify (ec_);
        if (asio_error::should_ignore (info))
            return;

        boost::system::error_code ec;
        _socket.close (ec);

        if (_options.reconnect_ivl >= 0) {
            add_reconnect_timer ();
            return;
        }
        _sink->failed (_endpoint_str, info.errnum ? info.errnum : ECONNRESET);
        return;
    }

    create_engine ();
}

void tapewire::tcp_connecter_t::add_reconnect_timer ()
{
    TW_DBG_CONN ("add_reconnect_timer: interval=%d", _options.reconnect_ivl);

    _reconnect_timer_started = true;
    _reconnect_timer.expires_after (
      std::chrono::milliseconds (_options.reconnect_ivl));
    _reconnect_timer.async_wait (
      [this] (const boost::system::error_code &ec) { on_reconnect_timer (ec); });
}

void tapewire::tcp_connecter_t::on_reconnect_timer (
  const boost::system::error_code &ec_)
{
    _reconnect_timer_started = false;

    if (ec_ == boost::asio::error::operation_aborted || _terminating)
        return;

    start_connecting ();
}

void tapewire::tcp_connecter_t::create_engine ()
{
    boost::system::error_code ec;
    _socket.set_option (boost::asio::ip::tcp::no_delay (_options.tcp_nodelay),
                        ec);
    if (ec)
        TW_LOG_WARN ("set no_delay failed: %s", ec.message ().c_str ());

    std::unique_ptr<i_asio_transport> transport (
      new (std::nothrow) tcp_transport_t (std::move (_socket)));
    alloc_assert (transport);
    _socket = boost::asio::ip::tcp::socket (_io_context);

    _engine = std::make_shared<stream_engine_t> (
      _io_context, std::move (transport), _options, _sink, _endpoint_str);
    _engine->plug ();
}
