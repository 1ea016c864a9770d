/* SPDX-License-Identifier: MPL-2.0 */

#include "core/address.hpp"
#include "utils/err.hpp"

#include <sstream>

tapewire::address_t::address_t () : port (0)
{
}

int tapewire::address_t::parse (const std::string &endpoint_)
{
    std::string rest = endpoint_;

    const std::string::size_type scheme_end = rest.find ("://");
    if (scheme_end != std::string::npos) {
        if (rest.compare (0, scheme_end, protocol_name::tcp) != 0) {
            errno = EPROTONOSUPPORT;
            return -1;
        }
        rest = rest.substr (scheme_end + 3);
    }

    const std::string::size_type colon = rest.rfind (':');
    if (colon == std::string::npos || colon == 0
        || colon + 1 == rest.size ()) {
        errno = EINVAL;
        return -1;
    }

    std::string parsed_host = rest.substr (0, colon);
    const std::string port_str = rest.substr (colon + 1);

    if (parsed_host[0] == '[') {
        if (parsed_host.size () < 3
            || parsed_host[parsed_host.size () - 1] != ']') {
            errno = EINVAL;
            return -1;
        }
        parsed_host = parsed_host.substr (1, parsed_host.size () - 2);
    }

    unsigned long parsed_port = 0;
    if (port_str != "*") {
        if (port_str.find_first_not_of ("0123456789") != std::string::npos
            || port_str.size () > 5) {
            errno = EINVAL;
            return -1;
        }
        parsed_port = strtoul (port_str.c_str (), NULL, 10);
        if (parsed_port > 0xFFFF) {
            errno = EINVAL;
            return -1;
        }
    }

    host = parsed_host;
    port = static_cast<uint16_t> (parsed_port);
    return 0;
}

int tapewire::address_t::to_string (std::string &addr_) const
{
    if (host.empty ()) {
        addr_.clear ();
        errno = EINVAL;
        return -1;
    }

    std::stringstream s;
    s << protocol_name::tcp << "://";
    if (host.find (':') != std::string::npos)
        s << "[" << host << "]";
    else
        s << host;
    s << ":" << port;
    addr_ = s.str ();
    return 0;
}
