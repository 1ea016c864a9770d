/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TAPEWIRE_STREAM_ENGINE_HPP_INCLUDED__
#define __TAPEWIRE_STREAM_ENGINE_HPP_INCLUDED__

#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>

#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "core/options.hpp"
#include "engine/asio/i_asio_transport.hpp"
#include "protocol/event.hpp"
#include "protocol/event_decoder.hpp"
#include "protocol/event_encoder.hpp"

namespace tapewire
{
struct i_event_sink;

//  Drives one connection in proactor mode: decodes whatever the transport
//  delivers into events for the sink, and encodes queued events out to
//  the transport. All members must be called from the thread running the
//  io_context; pending handlers keep the engine alive.
//
//  The sink hears connected() once plug() runs and, afterwards, exactly
//  one of disconnected() or failed().

class stream_engine_t TAPEWIRE_FINAL
    : public std::enable_shared_from_this<stream_engine_t>
{
  public:
    stream_engine_t (boost::asio::io_context &io_context_,
                     std::unique_ptr<i_asio_transport> transport_,
                     const options_t &options_,
                     i_event_sink *sink_,
                     const std::string &peer_);
    ~stream_engine_t ();

    //  Announces the connection and starts reading.
    void plug ();

    //  Queues event_ for sending. Returns 0 on success, otherwise -1 with
    //  errno set to EMSGSIZE or ERANGE (event cannot be encoded), EAGAIN
    //  (sndhwm events already queued) or ENOTCONN (engine closed).
    int send (const event_t &event_);

    //  Stops accepting events, flushes those already queued and then
    //  closes the transport.
    void close ();

    //  Closes the transport at once, dropping unsent events.
    void terminate ();

    //  False once the sink has heard the final notification.
    bool active () const { return !_terminated; }

    //  Events accepted by send() but not yet handed to the encoder.
    size_t queued () const { return _tx_queue.size (); }

    const std::string &peer_address () const { return _peer; }

  private:
    void start_async_read ();
    void on_read_complete (const boost::system::error_code &ec_,
                           std::size_t bytes_transferred_);

    //  Feeds size_ bytes of the read buffer through the decoder. Returns
    //  false if the engine terminated on the way.
    bool process_input (size_t size_);

    void end_of_stream ();

    void start_async_write ();
    void on_write_complete (const boost::system::error_code &ec_,
                            std::size_t bytes_transferred_);

    //  Refills the write buffer from the queue, up to out_batch_size.
    void process_output ();

    void arm_read_timer ();
    void cancel_read_timer ();
    void on_read_timeout (const boost::system::error_code &ec_);

    //  Closes the transport and delivers the final notification. errno_
    //  0 means the stream ended cleanly.
    void error (int errno_);

    const std::unique_ptr<i_asio_transport> _transport;
    const options_t _options;
    i_event_sink *const _sink;
    const std::string _peer;

    event_decoder_t _decoder;
    event_encoder_t _encoder;

    std::vector<unsigned char> _read_buffer;
    std::vector<unsigned char> _write_buffer;
    size_t _write_offset;

    std::deque<event_t> _tx_queue;

    boost::asio::steady_timer _read_timer;
    bool _has_read_timer;

    bool _plugged;
    bool _read_pending;
    bool _write_pending;
    bool _closing;
    bool _terminated;

    TAPEWIRE_NON_COPYABLE_NOR_MOVABLE (stream_engine_t)
};
}

#endif
