/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_ADDRESS_HPP_INCLUDED__
#define __TAPEWIRE_ADDRESS_HPP_INCLUDED__

#include <stdint.h>
#include <string>

namespace tapewire
{
namespace protocol_name
{
static const char tcp[] = "tcp";
}

//  A TCP endpoint written "tcp://host:port" or "host:port". IPv6 hosts are
//  written in brackets. Host "*" means any interface, port "*" or 0 an
//  ephemeral port; both are only meaningful when binding.
struct address_t
{
    address_t ();

    //  Returns 0 on success, -1 with errno EINVAL for a malformed endpoint
    //  or EPROTONOSUPPORT for a scheme other than tcp.
    int parse (const std::string &endpoint_);

    int to_string (std::string &addr_) const;

    std::string host;
    uint16_t port;
};
}

#endif
