/* SPDX-License-Identifier: MPL-2.0 */

#include "engine/asio/stream_engine.hpp"
#include "engine/asio/error_handler.hpp"
#include "core/i_event_sink.hpp"
#include "utils/debug.hpp"
#include "utils/err.hpp"

#include <chrono>

tapewire::stream_engine_t::stream_engine_t (
  boost::asio::io_context &io_context_,
  std::unique_ptr<i_asio_transport> transport_,
  const options_t &options_,
  i_event_sink *sink_,
  const std::string &peer_) :
    _transport (std::move (transport_)),
    _options (options_),
    _sink (sink_),
    _peer (peer_),
    _encoder (static_cast<size_t> (options_.out_batch_size)),
    _read_buffer (static_cast<size_t> (options_.in_batch_size)),
    _write_offset (0),
    _read_timer (io_context_),
    _has_read_timer (false),
    _plugged (false),
    _read_pending (false),
    _write_pending (false),
    _closing (false),
    _terminated (false)
{
    tapewire_assert (_transport);
    tapewire_assert (_sink);
    tapewire_assert (_options.in_batch_size > 0);
    tapewire_assert (_options.out_batch_size > 0);
}

tapewire::stream_engine_t::~stream_engine_t ()
{
    TW_DBG_ENGINE ("destroyed, peer=%s", _peer.c_str ());
    if (_transport->is_open ())
        _transport->close ();
}

void tapewire::stream_engine_t::plug ()
{
    tapewire_assert (!_plugged);
    _plugged = true;

    TW_DBG_ENGINE ("plug: peer=%s transport=%s", _peer.c_str (),
                   _transport->name ());

    _sink->connected (_peer);

    //  The sink may have closed us from inside connected().
    if (_terminated)
        return;

    start_async_read ();
    start_async_write ();
}

int tapewire::stream_engine_t::send (const event_t &event_)
{
    if (_terminated || _closing) {
        errno = ENOTCONN;
        return -1;
    }

    if (event_.check () == -1)
        return -1;

    if (_options.sndhwm > 0
        && _tx_queue.size () >= static_cast<size_t> (_options.sndhwm)) {
        errno = EAGAIN;
        return -1;
    }

    _tx_queue.push_back (event_);
    start_async_write ();
    return 0;
}

void tapewire::stream_engine_t::close ()
{
    if (_terminated || _closing)
        return;

    TW_DBG_ENGINE ("close: peer=%s queued=%zu", _peer.c_str (),
                   _tx_queue.size ());

    _closing = true;
    start_async_write ();
}

void tapewire::stream_engine_t::terminate ()
{
    if (_terminated)
        return;

    TW_DBG_ENGINE ("terminate: peer=%s in_frame=%d", _peer.c_str (),
                   _decoder.in_frame ());

    error (_decoder.in_frame () ? EINCOMPLETE : 0);
}

void tapewire::stream_engine_t::start_async_read ()
{
    if (_read_pending || _terminated || !_plugged)
        return;

    _read_pending = true;
    arm_read_timer ();

    const std::shared_ptr<stream_engine_t> self = shared_from_this ();
    _transport->async_read_some (
      &_read_buffer[0], _read_buffer.size (),
      [self] (const boost::system::error_code &ec, std::size_t bytes) {
          self->on_read_complete (ec, bytes);
      });
}

void tapewire::stream_engine_t::on_read_complete (
  const boost::system::error_code &ec_, std::size_t bytes_transferred_)
{
    _read_pending = false;
    TW_DBG_ENGINE ("on_read_complete: ec=%s, bytes=%zu, terminated=%d",
                   ec_.message ().c_str (), bytes_transferred_, _terminated);

    if (_terminated)
        return;

    cancel_read_timer ();

    if (ec_) {
        const asio_error::error_info_t info = asio_error::classify (ec_);
        if (asio_error::should_ignore (info))
            return;
        if (info.sev == asio_error::end_of_stream)
            end_of_stream ();
        else
            error (info.errnum);
        return;
    }

    if (bytes_transferred_ == 0) {
        end_of_stream ();
        return;
    }

    if (!process_input (bytes_transferred_))
        return;

    start_async_read ();
}

bool tapewire::stream_engine_t::process_input (size_t size_)
{
    const unsigned char *inpos = &_read_buffer[0];
    size_t insize = size_;

    while (insize > 0) {
        size_t processed = 0;
        const int rc = _decoder.decode (inpos, insize, processed);
        inpos += processed;
        insize -= processed;

        if (rc == -1) {
            TW_LOG_ERROR ("decode failed: peer=%s errno=%d", _peer.c_str (),
                          errno);
            error (errno);
            return false;
        }

        if (rc == 1) {
            _sink->event_received (_peer, _decoder.release_event ());
            if (_terminated)
                return false;
        }
    }
    return true;
}

void tapewire::stream_engine_t::end_of_stream ()
{
    //  A peer closing between frames is a clean end. Anything buffered
    //  means the last frame was cut short.
    const int rc = _decoder.finish ();
    error (rc == 0 ? 0 : errno);
}

void tapewire::stream_engine_t::start_async_write ()
{
    if (_write_pending || _terminated || !_plugged)
        return;

    if (_write_offset == _write_buffer.size ()) {
        process_output ();
        if (_write_buffer.empty ()) {
            //  Everything queued before close() is on the wire.
            if (_closing)
                error (0);
            return;
        }
    }

    _write_pending = true;

    const std::shared_ptr<stream_engine_t> self = shared_from_this ();
    _transport->async_write_some (
      &_write_buffer[_write_offset], _write_buffer.size () - _write_offset,
      [self] (const boost::system::error_code &ec, std::size_t bytes) {
          self->on_write_complete (ec, bytes);
      });
}

void tapewire::stream_engine_t::on_write_complete (
  const boost::system::error_code &ec_, std::size_t bytes_transferred_)
{
    _write_pending = false;
    TW_DBG_ENGINE ("on_write_complete: ec=%s, bytes=%zu, terminated=%d",
                   ec_.message ().c_str (), bytes_transferred_, _terminated);

    if (_terminated)
        return;

    if (ec_) {
        const asio_error::error_info_t info = asio_error::classify (ec_);
        if (asio_error::should_ignore (info))
            return;
        error (info.sev == asio_error::end_of_stream ? EPIPE : info.errnum);
        return;
    }

    _write_offset += bytes_transferred_;
    tapewire_assert (_write_offset <= _write_buffer.size ());

    start_async_write ();
}

void tapewire::stream_engine_t::process_output ()
{
    const size_t batch = static_cast<size_t> (_options.out_batch_size);

    _write_buffer.clear ();
    _write_offset = 0;

    while (_write_buffer.size () < batch) {
        if (!_encoder.busy ()) {
            if (_tx_queue.empty ())
                break;
            const int rc = _encoder.load_event (_tx_queue.front ());
            //  send() rejected anything the encoder would refuse.
            errno_assert (rc == 0);
            _tx_queue.pop_front ();
        }

        const size_t offset = _write_buffer.size ();
        _write_buffer.resize (batch);
        unsigned char *bufptr = &_write_buffer[offset];
        const size_t n = _encoder.encode (&bufptr, batch - offset);
        _write_buffer.resize (offset + n);
    }
}

void tapewire::stream_engine_t::arm_read_timer ()
{
    if (_options.rcvtimeo < 0)
        return;

    _has_read_timer = true;
    _read_timer.expires_after (std::chrono::milliseconds (_options.rcvtimeo));

    const std::shared_ptr<stream_engine_t> self = shared_from_this ();
    _read_timer.async_wait ([self] (const boost::system::error_code &ec) {
        self->on_read_timeout (ec);
    });
}

void tapewire::stream_engine_t::cancel_read_timer ()
{
    if (_has_read_timer) {
        _read_timer.cancel ();
        _has_read_timer = false;
    }
}

void tapewire::stream_engine_t::on_read_timeout (
  const boost::system::error_code &ec_)
{
    if (ec_ == boost::asio::error::operation_aborted)
        return;

    if (_terminated || !_has_read_timer)
        return;

    //  Expired while a completed read was already queued and re-armed it.
    if (_read_timer.expiry () > boost::asio::steady_timer::clock_type::now ())
        return;

    TW_DBG_ENGINE ("read deadline expired: peer=%s", _peer.c_str ());
    _has_read_timer = false;
    error (ETIMEDOUT);
}

void tapewire::stream_engine_t::error (int errno_)
{
    if (_terminated)
        return;
    _terminated = true;

    TW_DBG_ENGINE ("error: peer=%s errno=%d", _peer.c_str (), errno_);

    cancel_read_timer ();
    _tx_queue.clear ();
    _transport->close ();

    if (!_plugged)
        return;

    if (errno_ == 0)
        _sink->disconnected (_peer);
    else
        _sink->failed (_peer, errno_);
}
