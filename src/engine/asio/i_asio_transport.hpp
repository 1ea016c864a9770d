/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_I_ASIO_TRANSPORT_HPP_INCLUDED__
#define __TAPEWIRE_I_ASIO_TRANSPORT_HPP_INCLUDED__

#include <boost/system/error_code.hpp>
#include <cstddef>
#include <functional>

#include "utils/macros.hpp"

namespace tapewire
{
//  Byte stream abstraction for the ASIO-based engine.
//
//  The engine owns its transport and drives it with at most one read and
//  one write outstanding at a time. Completion handlers are always
//  invoked from the io_context, never from inside the initiating call.

class i_asio_transport
{
  public:
    //  Callback type for async operation completion
    typedef std::function<void (const boost::system::error_code &, std::size_t)>
      completion_handler_t;

    virtual ~i_asio_transport () TAPEWIRE_DEFAULT

    //  Check if transport is open and ready for I/O
    virtual bool is_open () const = 0;

    //  Close the transport. Pending operations complete with
    //  operation_aborted.
    virtual void close () = 0;

    //  Reads up to buffer_size bytes into buffer. A peer that closed its
    //  side completes with boost::asio::error::eof.
    virtual void async_read_some (unsigned char *buffer,
                                  std::size_t buffer_size,
                                  completion_handler_t handler) = 0;

    //  Writes up to buffer_size bytes from buffer. The handler receives the
    //  number of bytes actually written, which may be fewer.
    virtual void async_write_some (const unsigned char *buffer,
                                   std::size_t buffer_size,
                                   completion_handler_t handler) = 0;

    //  Get transport name for debugging
    virtual const char *name () const = 0;
};
}

#endif
