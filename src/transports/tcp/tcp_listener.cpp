/* SPDX-License-Identifier: MPL-2.0 */

#include "transports/tcp/tcp_listener.hpp"
#include "transports/tcp/tcp_address.hpp"
#include "transports/tcp/tcp_transport.hpp"
#include "engine/asio/error_handler.hpp"
#include "engine/asio/stream_engine.hpp"
#include "core/address.hpp"
#include "core/i_event_sink.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

tapewire::tcp_listener_t::tcp_listener_t (boost::asio::io_context &io_context_,
                                          const options_t &options_,
                                          i_event_sink *sink_) :
    _io_context (io_context_),
    _options (options_),
    _sink (sink_),
    _acceptor (io_context_),
    _accept_socket (io_context_),
    _accepting (false)
{
    tapewire_assert (_sink);
}

tapewire::tcp_listener_t::~tcp_listener_t ()
{
    close ();

    //  Process the cancelled async_accept while the object is still alive.
    if (_accepting && !_io_context.stopped ())
        _io_context.poll ();
}

int tapewire::tcp_listener_t::bind (const std::string &endpoint_)
{
    TW_DBG_LISTENER ("bind: endpoint=%s", endpoint_.c_str ());

    if (_acceptor.is_open ()) {
        errno = EINVAL;
        return -1;
    }

    address_t addr;
    if (addr.parse (endpoint_) != 0)
        return -1;

    boost::asio::ip::tcp::endpoint bind_endpoint;
    if (resolve_tcp_address (_io_context, addr, true, bind_endpoint) != 0)
        return -1;

    boost::system::error_code ec;

    //  Open the acceptor
    _acceptor.open (bind_endpoint.protocol (), ec);
    if (ec) {
        TW_DBG_LISTENER ("Failed to open acceptor: %s", ec.message ().c_str ());
        errno = asio_error::classify (ec).errnum;
        return -1;
    }

    //  Allow reusing of the address (SO_REUSEADDR)
    _acceptor.set_option (boost::asio::socket_base::reuse_address (true), ec);
    if (ec) {
        TW_DBG_LISTENER ("Failed to set reuse_address: %s",
                         ec.message ().c_str ());
        _acceptor.close (ec);
        errno = EADDRINUSE;
        return -1;
    }

    _acceptor.bind (bind_endpoint, ec);
    if (ec) {
        TW_DBG_LISTENER ("Failed to bind: %s", ec.message ().c_str ());
        _acceptor.close (ec);
        errno = EADDRINUSE;
        return -1;
    }

    _acceptor.listen (boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
        TW_DBG_LISTENER ("Failed to listen: %s", ec.message ().c_str ());
        _acceptor.close (ec);
        errno = EADDRINUSE;
        return -1;
    }

    //  Resolves the wildcard port
    _endpoint = endpoint_to_string (_acceptor.local_endpoint (ec));

    TW_DBG_LISTENER ("Listening on %s", _endpoint.c_str ());

    start_accept ();
    return 0;
}

void tapewire::tcp_listener_t::close ()
{
    TW_DBG_LISTENER ("close called, accepting=%d, engines=%zu", _accepting,
                     _engines.size ());

    if (_acceptor.is_open ()) {
        boost::system::error_code ec;
        _acceptor.close (ec);
    }

    //  terminate() may call back into the sink; work on a copy.
    const std::set<std::shared_ptr<stream_engine_t> > engines = _engines;
    _engines.clear ();
    for (std::set<std::shared_ptr<stream_engine_t> >::const_iterator it =
           engines.begin ();
         it != engines.end (); ++it)
        (*it)->terminate ();
}

size_t tapewire::tcp_listener_t::connection_count ()
{
    prune_engines ();
    return _engines.size ();
}

void tapewire::tcp_listener_t::start_accept ()
{
    if (_accepting || !_acceptor.is_open ())
        return;

    _accepting = true;
    _acceptor.async_accept (
      _accept_socket,
      [this] (const boost::system::error_code &ec) { on_accept (ec); });
}

void tapewire::tcp_listener_t::on_accept (const boost::system::error_code &ec_)
{
    _accepting = false;
    TW_DBG_LISTENER ("on_accept: ec=%s", ec_.message ().c_str ());

    if (ec_) {
        if (ec_ == boost::asio::error::operation_aborted
            || !_acceptor.is_open ())
            return;

        //  Failure to accept one connection (EMFILE, ECONNABORTED...)
        //  does not stop the listener.
        TW_LOG_WARN ("accept failed: %s", ec_.message ().c_str ());
        start_accept ();
        return;
    }

    create_engine ();
    start_accept ();
}

void tapewire::tcp_listener_t::create_engine ()
{
    prune_engines ();

    boost::system::error_code ec;
    _accept_socket.set_option (
      boost::asio::ip::tcp::no_delay (_options.tcp_nodelay), ec);
    if (ec)
        TW_LOG_WARN ("set no_delay failed: %s", ec.message ().c_str ());

    std::unique_ptr<tcp_transport_t> transport (
      new (std::nothrow) tcp_transport_t (std::move (_accept_socket)));
    alloc_assert (transport);
    _accept_socket = boost::asio::ip::tcp::socket (_io_context);

    //  A socket closed between accept and here has no remote endpoint.
    const std::string peer = transport->remote_endpoint ();
    if (peer.empty ())
        return;

    const std::shared_ptr<stream_engine_t> engine =
      std::make_shared<stream_engine_t> (
        _io_context, std::unique_ptr<i_asio_transport> (std::move (transport)),
        _options, _sink, peer);
    _engines.insert (engine);
    engine->plug ();
}

void tapewire::tcp_listener_t::prune_engines ()
{
    std::set<std::shared_ptr<stream_engine_t> >::iterator it =
      _engines.begin ();
    while (it != _engines.end ()) {
        if ((*it)->active ())
            ++it;
        else
            _engines.erase (it++);
    }
}
