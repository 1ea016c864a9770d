/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_ERROR_HANDLER_HPP_INCLUDED__
#define __TAPEWIRE_ERROR_HANDLER_HPP_INCLUDED__

#include <errno.h>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

namespace tapewire
{
namespace asio_error
{
//  Error severity levels
enum severity_t
{
    ignore,        //  Operation cancelled, not an error
    end_of_stream, //  Peer closed its sending side
    fatal          //  Connection is broken
};

struct error_info_t
{
    severity_t sev;

    //  errno value reported to the event sink, 0 unless fatal.
    int errnum;
};

//  Maps a completion error onto the errno values the library reports.
inline error_info_t classify (const boost::system::error_code &ec_)
{
    error_info_t info;
    info.sev = fatal;
    info.errnum = 0;

    //  Operation cancelled (normal during shutdown)
    if (ec_ == boost::asio::error::operation_aborted) {
        info.sev = ignore;
        return info;
    }

    if (ec_ == boost::asio::error::eof) {
        info.sev = end_of_stream;
        return info;
    }

    if (ec_ == boost::asio::error::connection_refused)
        info.errnum = ECONNREFUSED;
    else if (ec_ == boost::asio::error::connection_reset)
        info.errnum = ECONNRESET;
    else if (ec_ == boost::asio::error::broken_pipe)
        info.errnum = EPIPE;
    else if (ec_ == boost::asio::error::timed_out)
        info.errnum = ETIMEDOUT;
    else if (ec_ == boost::asio::error::network_unreachable)
        info.errnum = ENETUNREACH;
    else if (ec_ == boost::asio::error::host_unreachable
             || ec_ == boost::asio::error::host_not_found
             || ec_ == boost::asio::error::host_not_found_try_again)
        info.errnum = EHOSTUNREACH;
    else if (ec_.category () == boost::system::system_category ()
             || ec_.category () == boost::system::generic_category ())
        info.errnum = ec_.value ();
    else
        info.errnum = ECONNABORTED;

    return info;
}

inline bool should_ignore (const error_info_t &err_)
{
    return err_.sev == ignore;
}
}
}

#endif
