/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_TCP_ADDRESS_HPP_INCLUDED__
#define __TAPEWIRE_TCP_ADDRESS_HPP_INCLUDED__

#include <boost/asio.hpp>

#include "core/address.hpp"

namespace tapewire
{
//  Resolves addr_ to a single TCP endpoint. With local_ set, host "*"
//  means the IPv4 wildcard address. Returns 0 on success, -1 with errno
//  EHOSTUNREACH if the host cannot be resolved.
int resolve_tcp_address (boost::asio::io_context &io_context_,
                         const address_t &addr_,
                         bool local_,
                         boost::asio::ip::tcp::endpoint &endpoint_);
}

#endif
