/* SPDX-License-Identifier: MPL-2.0 */

#include "transports/tcp/tcp_transport.hpp"
#include "core/address.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <atomic>
#include <cstdio>
#include <cstdlib>

namespace tapewire
{
namespace
{
std::atomic<uint64_t> tcp_async_read_calls (0);
std::atomic<uint64_t> tcp_async_read_bytes (0);
std::atomic<uint64_t> tcp_async_read_errors (0);
std::atomic<uint64_t> tcp_async_write_calls (0);
std::atomic<uint64_t> tcp_async_write_bytes (0);
std::atomic<uint64_t> tcp_async_write_errors (0);
std::atomic<bool> tcp_stats_registered (false);

bool tcp_stats_enabled ()
{
    static int enabled = -1;
    if (enabled == -1) {
        const char *env = std::getenv ("TAPEWIRE_TCP_STATS");
        enabled = (env && *env && *env != '0') ? 1 : 0;
    }
    return enabled == 1;
}

void tcp_stats_dump ()
{
    std::fprintf (
      stderr,
      "[TAPEWIRE_TCP_STATS] async_read calls=%llu bytes=%llu errors=%llu\n"
      "[TAPEWIRE_TCP_STATS] async_write calls=%llu bytes=%llu errors=%llu\n",
      static_cast<unsigned long long> (tcp_async_read_calls.load ()),
      static_cast<unsigned long long> (tcp_async_read_bytes.load ()),
      static_cast<unsigned long long> (tcp_async_read_errors.load ()),
      static_cast<unsigned long long> (tcp_async_write_calls.load ()),
      static_cast<unsigned long long> (tcp_async_write_bytes.load ()),
      static_cast<unsigned long long> (tcp_async_write_errors.load ()));
}

void tcp_stats_maybe_register ()
{
    if (!tcp_stats_enabled ())
        return;
    bool expected = false;
    if (tcp_stats_registered.compare_exchange_strong (expected, true)) {
        std::atexit (tcp_stats_dump);
    }
}
}

tcp_transport_t::tcp_transport_t (boost::asio::ip::tcp::socket socket_) :
    _socket (new (std::nothrow)
               boost::asio::ip::tcp::socket (std::move (socket_)))
{
    alloc_assert (_socket);
    tcp_stats_maybe_register ();
}

tcp_transport_t::~tcp_transport_t ()
{
    close ();
}

bool tcp_transport_t::is_open () const
{
    return _socket && _socket->is_open ();
}

void tcp_transport_t::close ()
{
    if (_socket && _socket->is_open ()) {
        boost::system::error_code ec;
        _socket->shutdown (boost::asio::ip::tcp::socket::shutdown_both, ec);
        //  Ignore close errors
        _socket->close (ec);
    }
}

void tcp_transport_t::async_read_some (unsigned char *buffer,
                                       std::size_t buffer_size,
                                       completion_handler_t handler)
{
    if (!tcp_stats_enabled ()) {
        _socket->async_read_some (boost::asio::buffer (buffer, buffer_size),
                                  handler);
        return;
    }

    ++tcp_async_read_calls;
    _socket->async_read_some (
      boost::asio::buffer (buffer, buffer_size),
      [handler] (const boost::system::error_code &ec, std::size_t bytes) {
          if (ec)
              ++tcp_async_read_errors;
          else
              tcp_async_read_bytes += bytes;
          handler (ec, bytes);
      });
}

void tcp_transport_t::async_write_some (const unsigned char *buffer,
                                        std::size_t buffer_size,
                                        completion_handler_t handler)
{
    if (!tcp_stats_enabled ()) {
        _socket->async_write_some (boost::asio::buffer (buffer, buffer_size),
                                   handler);
        return;
    }

    ++tcp_async_write_calls;
    _socket->async_write_some (
      boost::asio::buffer (buffer, buffer_size),
      [handler] (const boost::system::error_code &ec, std::size_t bytes) {
          if (ec)
              ++tcp_async_write_errors;
          else
              tcp_async_write_bytes += bytes;
          handler (ec, bytes);
      });
}

std::string tcp_transport_t::remote_endpoint () const
{
    boost::system::error_code ec;
    const boost::asio::ip::tcp::endpoint endpoint =
      _socket->remote_endpoint (ec);
    if (ec) {
        TW_GLOBAL_WARN ("remote_endpoint failed: %s", ec.message ().c_str ());
        return std::string ();
    }
    return endpoint_to_string (endpoint);
}

std::string endpoint_to_string (const boost::asio::ip::tcp::endpoint &endpoint_)
{
    address_t addr;
    addr.host = endpoint_.address ().to_string ();
    addr.port = endpoint_.port ();

    std::string result;
    const int rc = addr.to_string (result);
    errno_assert (rc == 0);
    return result;
}
}
