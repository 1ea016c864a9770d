/* SPDX-License-Identifier: MPL-2.0 */

//  Sends mock trading telemetry to a consumer.
//
//  usage: tapewire_producer [endpoint] [count] [interval_ms]
//
//  count 0 sends until interrupted. The endpoint defaults to
//  TAPEWIRE_ENDPOINT, then to tcp://127.0.0.1:12345. Connection options
//  are read from TAPEWIRE_SNDHWM, TAPEWIRE_RECONNECT_IVL, TAPEWIRE_RCVTIMEO,
//  TAPEWIRE_OUT_BATCH_SIZE, TAPEWIRE_IN_BATCH_SIZE and TAPEWIRE_TCP_NODELAY.

#include <boost/asio.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <stdint.h>
#include <string>
#include <vector>

#include "../include/tapewire.h"
#include "core/i_event_sink.hpp"
#include "core/log_sink.hpp"
#include "core/options.hpp"
#include "protocol/event.hpp"
#include "transports/tcp/tcp_connecter.hpp"

namespace
{
const int default_interval_ms = 500;

tapewire::event_t mock_price_update (const char *symbol_,
                                     float old_price_,
                                     float new_price_)
{
    tapewire::price_update_event_t update;
    update.symbol = symbol_;
    update.old_price = old_price_;
    update.new_price = new_price_;
    return tapewire::event_t (update);
}

tapewire::event_t mock_match (const char *side_,
                              int64_t quantity_,
                              const char *symbol_,
                              float price_)
{
    tapewire::match_event_t event;
    event.side = side_;
    event.quantity = quantity_;
    event.symbol = symbol_;
    event.price = price_;
    return tapewire::event_t (event);
}

tapewire::event_t mock_log (const char *level_, const char *message_)
{
    tapewire::log_event_t event;
    event.level = level_;
    event.message = message_;
    return tapewire::event_t (event);
}

std::vector<tapewire::event_t> make_mock_events ()
{
    std::vector<tapewire::event_t> events;
    events.push_back (mock_price_update ("BTC/USD", 67203.00f, 67210.50f));
    events.push_back (mock_price_update ("ETH/USD", 3212.45f, 3217.10f));
    events.push_back (mock_price_update ("SPY", 528.75f, 529.00f));
    events.push_back (mock_match ("BUY", 100, "AAPL", 172.34f));
    events.push_back (mock_match ("SELL", 5, "BTC", 67200.00f));
    events.push_back (mock_match ("BUY", 50, "TSLA", 187.90f));
    events.push_back (mock_log ("INFO", "TCP server started on port 9001"));
    events.push_back (
      mock_log ("DEBUG", "Received order: ID#14352 (BUY 25 ETH @ $3,200)"));
    events.push_back (mock_log (
      "INFO", "Trade executed: Order#14352 matched with Order#14349"));
    return events;
}

//  Prints connection status and paces the sends once connected.
class producer_t TAPEWIRE_FINAL : public tapewire::i_event_sink
{
  public:
    producer_t (boost::asio::io_context &io_context_,
                const tapewire::options_t &options_,
                long count_,
                int interval_ms_) :
        _status (stderr),
        _connecter (io_context_, options_, this),
        _timer (io_context_),
        _signals (io_context_, SIGINT, SIGTERM),
        _events (make_mock_events ()),
        _rng (std::random_device () ()),
        _count (count_),
        _sent (0),
        _interval_ms (interval_ms_),
        _exit_code (0)
    {
        _signals.async_wait (
          [this] (const boost::system::error_code &ec, int) {
              if (!ec)
                  stop ();
          });
    }

    int start (const std::string &endpoint_)
    {
        if (_connecter.connect (endpoint_) != 0) {
            fprintf (stderr, "error in connect: %s\n",
                     tapewire_strerror (tapewire_errno ()));
            _signals.cancel ();
            return -1;
        }
        return 0;
    }

    int exit_code () const { return _exit_code; }

    void connected (const std::string &peer_) TAPEWIRE_OVERRIDE
    {
        _status.connected (peer_);
        schedule ();
    }

    void event_received (const std::string &peer_,
                         std::unique_ptr<tapewire::event_t> event_)
      TAPEWIRE_OVERRIDE
    {
        //  Consumers never talk back.
        _status.event_received (peer_, std::move (event_));
    }

    void disconnected (const std::string &peer_) TAPEWIRE_OVERRIDE
    {
        _status.disconnected (peer_);
        finish ();
    }

    void failed (const std::string &peer_, int errno_) TAPEWIRE_OVERRIDE
    {
        _status.failed (peer_, errno_);
        _exit_code = 1;
        finish ();
    }

  private:
    void schedule ()
    {
        _timer.expires_after (std::chrono::milliseconds (_interval_ms));
        _timer.async_wait ([this] (const boost::system::error_code &ec) {
            if (!ec)
                send_one ();
        });
    }

    void send_one ()
    {
        std::uniform_int_distribution<size_t> pick (0, _events.size () - 1);
        const tapewire::event_t &event = _events[pick (_rng)];

        if (_connecter.send (event) != 0) {
            const int err = tapewire_errno ();
            fprintf (stderr, "error in send: %s\n", tapewire_strerror (err));
            //  A full queue drains; anything else ends the run.
            if (err != EAGAIN) {
                stop ();
                return;
            }
        } else {
            printf ("%s\n", tapewire::format_event (event).c_str ());
            fflush (stdout);
            ++_sent;
        }

        if (_count > 0 && _sent >= _count) {
            stop ();
            return;
        }
        schedule ();
    }

    //  Flushes what is queued and closes; the sink hears the outcome.
    void stop ()
    {
        _timer.cancel ();
        _signals.cancel ();
        if (_connecter.connected ())
            _connecter.close ();
        else {
            _connecter.close ();
            finish ();
        }
    }

    void finish ()
    {
        _timer.cancel ();
        _signals.cancel ();
    }

    tapewire::log_sink_t _status;
    tapewire::tcp_connecter_t _connecter;
    boost::asio::steady_timer _timer;
    boost::asio::signal_set _signals;
    const std::vector<tapewire::event_t> _events;
    std::mt19937 _rng;
    const long _count;
    long _sent;
    const int _interval_ms;
    int _exit_code;
};
}

int main (int argc, char *argv[])
{
    if (argc > 4) {
        printf ("usage: tapewire_producer [endpoint] [count] [interval_ms]\n");
        return 1;
    }

    std::string endpoint = TAPEWIRE_DEFAULT_ENDPOINT;
    const char *env = getenv ("TAPEWIRE_ENDPOINT");
    if (env && *env)
        endpoint = env;
    if (argc > 1)
        endpoint = argv[1];

    const long count = argc > 2 ? atol (argv[2]) : 0;
    const int interval_ms = argc > 3 ? atoi (argv[3]) : default_interval_ms;
    if (count < 0 || interval_ms < 0) {
        printf ("count and interval_ms must not be negative\n");
        return 1;
    }

    tapewire::options_t options;
    if (options.load_env () != 0) {
        fprintf (stderr, "invalid option in environment: %s\n",
                 tapewire_strerror (tapewire_errno ()));
        return 1;
    }
    boost::asio::io_context io_context;

    producer_t producer (io_context, options, count, interval_ms);
    if (producer.start (endpoint) != 0)
        return 1;

    io_context.run ();
    return producer.exit_code ();
}
