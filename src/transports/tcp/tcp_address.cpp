/* SPDX-License-Identifier: MPL-2.0 */

#include "transports/tcp/tcp_address.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

int tapewire::resolve_tcp_address (boost::asio::io_context &io_context_,
                                   const address_t &addr_,
                                   bool local_,
                                   boost::asio::ip::tcp::endpoint &endpoint_)
{
    if (local_ && addr_.host == "*") {
        endpoint_ = boost::asio::ip::tcp::endpoint (boost::asio::ip::tcp::v4 (),
                                                    addr_.port);
        return 0;
    }

    //  Numeric addresses need no lookup.
    boost::system::error_code ec;
    const boost::asio::ip::address ip =
      boost::asio::ip::make_address (addr_.host, ec);
    if (!ec) {
        endpoint_ = boost::asio::ip::tcp::endpoint (ip, addr_.port);
        return 0;
    }

    boost::asio::ip::tcp::resolver resolver (io_context_);
    const boost::asio::ip::tcp::resolver::results_type results =
      resolver.resolve (addr_.host, std::to_string (addr_.port),
                        local_ ? boost::asio::ip::resolver_base::passive
                               : boost::asio::ip::resolver_base::flags (),
                        ec);
    if (ec || results.empty ()) {
        TW_GLOBAL_WARN ("cannot resolve %s: %s", addr_.host.c_str (),
                        ec.message ().c_str ());
        errno = EHOSTUNREACH;
        return -1;
    }

    endpoint_ = results.begin ()->endpoint ();
    return 0;
}
