/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_TCP_TRANSPORT_HPP_INCLUDED__
#define __TAPEWIRE_TCP_TRANSPORT_HPP_INCLUDED__

#include <boost/asio.hpp>

#include <memory>
#include <string>

#include "engine/asio/i_asio_transport.hpp"

namespace tapewire
{
//  TCP transport implementation using Boost.Asio
//
//  Takes ownership of an already connected socket, either accepted by
//  tcp_listener_t or connected by tcp_connecter_t.

class tcp_transport_t TAPEWIRE_FINAL : public i_asio_transport
{
  public:
    explicit tcp_transport_t (boost::asio::ip::tcp::socket socket_);
    ~tcp_transport_t () TAPEWIRE_OVERRIDE;

    //  i_asio_transport interface
    bool is_open () const TAPEWIRE_OVERRIDE;
    void close () TAPEWIRE_OVERRIDE;

    void async_read_some (unsigned char *buffer,
                          std::size_t buffer_size,
                          completion_handler_t handler) TAPEWIRE_OVERRIDE;

    void async_write_some (const unsigned char *buffer,
                           std::size_t buffer_size,
                           completion_handler_t handler) TAPEWIRE_OVERRIDE;

    const char *name () const TAPEWIRE_OVERRIDE { return "tcp"; }

    //  "tcp://host:port" of the remote end, empty if unknown.
    std::string remote_endpoint () const;

  private:
    std::unique_ptr<boost::asio::ip::tcp::socket> _socket;

    TAPEWIRE_NON_COPYABLE_NOR_MOVABLE (tcp_transport_t)
};

//  Renders an endpoint the way address_t::to_string does.
std::string endpoint_to_string (const boost::asio::ip::tcp::endpoint &endpoint_);
}

#endif
