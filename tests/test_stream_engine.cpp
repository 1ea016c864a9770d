/* SPDX-License-Identifier: MPL-2.0 */

/*
 * Stream engine over a scripted in-memory transport.
 *
 * The transport decides how many bytes each read and write moves, so the
 * tests can force one-byte reads, partial writes and a peer that closes
 * in the middle of a frame.
 */

#include "testutil.hpp"

#include "engine/asio/stream_engine.hpp"

#include <unity.h>
#include <memory>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

static const char peer[] = "scripted://peer";

static std::vector<tapewire::event_t> sample_events ()
{
    std::vector<tapewire::event_t> events;
    events.push_back (make_log_event ("INFO", "TCP server started on port 9001"));
    events.push_back (make_match_event ("BUY", 100, "AAPL", 172.34f));
    events.push_back (make_price_update_event ("ETH/USD", 3212.45f, 3217.1f));
    events.push_back (make_log_event ("", ""));
    events.push_back (make_match_event ("SELL", 5, "BTC", 67200.0f));
    return events;
}

static std::shared_ptr<tapewire::stream_engine_t>
make_engine (boost::asio::io_context &io_context_,
             const tapewire::options_t &options_,
             collecting_sink_t &sink_,
             scripted_transport_t *&transport_)
{
    transport_ = new scripted_transport_t (io_context_);
    return std::make_shared<tapewire::stream_engine_t> (
      io_context_, std::unique_ptr<tapewire::i_asio_transport> (transport_),
      options_, &sink_, peer);
}

static void assert_events_equal (const std::vector<tapewire::event_t> &expected_,
                                 const std::vector<tapewire::event_t> &actual_)
{
    TEST_ASSERT_EQUAL_UINT (expected_.size (), actual_.size ());
    for (size_t i = 0; i != expected_.size (); ++i)
        TEST_ASSERT_TRUE (expected_[i] == actual_[i]);
}

static void receive_stream (const tapewire::options_t &options_,
                            size_t max_read_)
{
    boost::asio::io_context io_context;
    collecting_sink_t sink;
    scripted_transport_t *transport = NULL;
    std::shared_ptr<tapewire::stream_engine_t> engine =
      make_engine (io_context, options_, sink, transport);
    transport->set_max_read (max_read_);

    engine->plug ();
    TEST_ASSERT_EQUAL_UINT (1, sink.connects.size ());
    TEST_ASSERT_EQUAL_STRING (peer, sink.connects[0].c_str ());

    const std::vector<tapewire::event_t> events = sample_events ();
    transport->push_input (encode_stream (events));
    transport->push_eof ();

    TEST_ASSERT_TRUE (run_until (
      io_context, [&sink] () { return sink.terminal_count () > 0; }));

    assert_events_equal (events, sink.events);
    TEST_ASSERT_EQUAL_INT (1, sink.disconnects);
    TEST_ASSERT_EQUAL_UINT (0, sink.failures.size ());
    TEST_ASSERT_FALSE (engine->active ());
    TEST_ASSERT_FALSE (transport->is_open ());
}

void test_receive_in_order ()
{
    receive_stream (tapewire::options_t (), 0);
}

void test_one_byte_reads ()
{
    receive_stream (tapewire::options_t (), 1);
}

void test_small_read_buffer ()
{
    tapewire::options_t options;
    options.in_batch_size = 3;
    receive_stream (options, 0);
}

void test_input_arriving_in_pieces ()
{
    boost::asio::io_context io_context;
    collecting_sink_t sink;
    scripted_transport_t *transport = NULL;
    std::shared_ptr<tapewire::stream_engine_t> engine =
      make_engine (io_context, tapewire::options_t (), sink, transport);
    engine->plug ();

    const std::vector<tapewire::event_t> events = sample_events ();
    const std::vector<unsigned char> stream = encode_stream (events);

    //  Half of everything, then the rest.
    const size_t half = stream.size () / 2;
    transport->push_input (
      std::vector<unsigned char> (stream.begin (), stream.begin () + half));
    run_for (io_context, 20);
    TEST_ASSERT_TRUE (sink.events.size () < events.size ());
    TEST_ASSERT_TRUE (engine->active ());

    transport->push_input (
      std::vector<unsigned char> (stream.begin () + half, stream.end ()));
    transport->push_eof ();

    TEST_ASSERT_TRUE (run_until (
      io_context, [&sink] () { return sink.terminal_count () > 0; }));
    assert_events_equal (events, sink.events);
    TEST_ASSERT_EQUAL_INT (1, sink.disconnects);
}

void test_peer_close_mid_frame ()
{
    boost::asio::io_context io_context;
    collecting_sink_t sink;
    scripted_transport_t *transport = NULL;
    std::shared_ptr<tapewire::stream_engine_t> engine =
      make_engine (io_context, tapewire::options_t (), sink, transport);
    engine->plug ();

    std::vector<unsigned char> stream;
    TEST_ASSERT_SUCCESS_ERRNO (
      tapewire::encode_event (make_log_event ("INFO", "complete"), stream));
    std::vector<unsigned char> second;
    TEST_ASSERT_SUCCESS_ERRNO (tapewire::encode_event (
      make_match_event ("BUY", 100, "AAPL", 172.34f), second));
    stream.insert (stream.end (), second.begin (), second.begin () + 8);

    transport->push_input (stream);
    transport->push_eof ();

    TEST_ASSERT_TRUE (run_until (
      io_context, [&sink] () { return sink.terminal_count () > 0; }));

    //  The complete frame is delivered, the partial one is not.
    TEST_ASSERT_EQUAL_UINT (1, sink.events.size ());
    TEST_ASSERT_EQUAL_UINT (1, sink.failures.size ());
    TEST_ASSERT_EQUAL_INT (EINCOMPLETE, sink.failures[0]);
    TEST_ASSERT_EQUAL_INT (0, sink.disconnects);

    //  Nothing more arrives later.
    run_for (io_context, 50);
    TEST_ASSERT_EQUAL_UINT (1, sink.terminal_count ());
}

void test_peer_close_before_any_frame ()
{
    boost::asio::io_context io_context;
    collecting_sink_t sink;
    scripted_transport_t *transport = NULL;
    std::shared_ptr<tapewire::stream_engine_t> engine =
      make_engine (io_context, tapewire::options_t (), sink, transport);
    engine->plug ();

    transport->push_eof ();

    TEST_ASSERT_TRUE (run_until (
      io_context, [&sink] () { return sink.terminal_count () > 0; }));
    TEST_ASSERT_EQUAL_UINT (0, sink.events.size ());
    TEST_ASSERT_EQUAL_INT (1, sink.disconnects);
    TEST_ASSERT_EQUAL_STRING (peer, sink.closed_peers[0].c_str ());
}

void test_unknown_tag ()
{
    boost::asio::io_context io_context;
    collecting_sink_t sink;
    scripted_transport_t *transport = NULL;
    std::shared_ptr<tapewire::stream_engine_t> engine =
      make_engine (io_context, tapewire::options_t (), sink, transport);
    engine->plug ();

    std::vector<unsigned char> stream;
    TEST_ASSERT_SUCCESS_ERRNO (
      tapewire::encode_event (make_log_event ("INFO", "before"), stream));
    stream.push_back (0x09);
    TEST_ASSERT_SUCCESS_ERRNO (
      tapewire::encode_event (make_log_event ("INFO", "after"), stream));
    transport->push_input (stream);

    TEST_ASSERT_TRUE (run_until (
      io_context, [&sink] () { return sink.terminal_count () > 0; }));

    TEST_ASSERT_EQUAL_UINT (1, sink.events.size ());
    TEST_ASSERT_TRUE (sink.events[0] == make_log_event ("INFO", "before"));
    TEST_ASSERT_EQUAL_UINT (1, sink.failures.size ());
    TEST_ASSERT_EQUAL_INT (EPROTO, sink.failures[0]);
    TEST_ASSERT_FALSE (transport->is_open ());
}

void test_read_deadline ()
{
    tapewire::options_t options;
    options.rcvtimeo = 200;

    boost::asio::io_context io_context;
    collecting_sink_t sink;
    scripted_transport_t *transport = NULL;
    std::shared_ptr<tapewire::stream_engine_t> engine =
      make_engine (io_context, options, sink, transport);
    engine->plug ();

    //  Data keeps the connection alive past the deadline.
    std::vector<unsigned char> frame;
    TEST_ASSERT_SUCCESS_ERRNO (
      tapewire::encode_event (make_log_event ("INFO", "tick"), frame));
    for (int i = 0; i != 3; ++i) {
        run_for (io_context, 30);
        transport->push_input (frame);
    }
    TEST_ASSERT_TRUE (run_until (
      io_context, [&sink] () { return sink.events.size () == 3; }));
    TEST_ASSERT_EQUAL_UINT (0, sink.terminal_count ());

    //  Silence does not.
    TEST_ASSERT_TRUE (run_until (
      io_context, [&sink] () { return sink.terminal_count () > 0; }));
    TEST_ASSERT_EQUAL_UINT (1, sink.failures.size ());
    TEST_ASSERT_EQUAL_INT (ETIMEDOUT, sink.failures[0]);
    TEST_ASSERT_FALSE (engine->active ());
}

void test_partial_writes ()
{
    boost::asio::io_context io_context;
    collecting_sink_t sink;
    scripted_transport_t *transport = NULL;
    std::shared_ptr<tapewire::stream_engine_t> engine =
      make_engine (io_context, tapewire::options_t (), sink, transport);
    transport->set_max_write (3);
    engine->plug ();

    const std::vector<tapewire::event_t> events = sample_events ();
    for (size_t i = 0; i != events.size (); ++i)
        TEST_ASSERT_SUCCESS_ERRNO (engine->send (events[i]));
    engine->close ();

    TEST_ASSERT_TRUE (run_until (
      io_context, [&sink] () { return sink.terminal_count () > 0; }));

    //  close() flushed everything before disconnecting.
    const std::vector<unsigned char> expected = encode_stream (events);
    TEST_ASSERT_EQUAL_INT (1, sink.disconnects);
    TEST_ASSERT_EQUAL_UINT (expected.size (), transport->written ().size ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (&expected[0], &transport->written ()[0],
                                  expected.size ());
    TEST_ASSERT_TRUE (transport->write_calls () >= expected.size () / 3);
}

void test_small_write_batches ()
{
    tapewire::options_t options;
    options.out_batch_size = 5;

    boost::asio::io_context io_context;
    collecting_sink_t sink;
    scripted_transport_t *transport = NULL;
    std::shared_ptr<tapewire::stream_engine_t> engine =
      make_engine (io_context, options, sink, transport);
    engine->plug ();

    const std::vector<tapewire::event_t> events = sample_events ();
    for (size_t i = 0; i != events.size (); ++i)
        TEST_ASSERT_SUCCESS_ERRNO (engine->send (events[i]));
    engine->close ();

    TEST_ASSERT_TRUE (run_until (
      io_context, [&sink] () { return sink.terminal_count () > 0; }));

    const std::vector<unsigned char> expected = encode_stream (events);
    TEST_ASSERT_EQUAL_UINT (expected.size (), transport->written ().size ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (&expected[0], &transport->written ()[0],
                                  expected.size ());
}

void test_send_errors ()
{
    tapewire::options_t options;
    options.sndhwm = 2;

    boost::asio::io_context io_context;
    collecting_sink_t sink;
    scripted_transport_t *transport = NULL;
    std::shared_ptr<tapewire::stream_engine_t> engine =
      make_engine (io_context, options, sink, transport);

    const std::string too_long (TAPEWIRE_MAX_TEXT_SIZE + 1, 'x');
    TEST_ASSERT_FAILURE_ERRNO (
      EMSGSIZE, engine->send (make_log_event ("INFO", too_long.c_str ())));
    TEST_ASSERT_FAILURE_ERRNO (
      ERANGE, engine->send (make_match_event ("BUY", -1, "AAPL", 1.0f)));

    //  Nothing is written before plug(), so the queue fills up.
    TEST_ASSERT_SUCCESS_ERRNO (engine->send (make_log_event ("INFO", "1")));
    TEST_ASSERT_SUCCESS_ERRNO (engine->send (make_log_event ("INFO", "2")));
    TEST_ASSERT_FAILURE_ERRNO (EAGAIN,
                               engine->send (make_log_event ("INFO", "3")));
    TEST_ASSERT_EQUAL_UINT (2, engine->queued ());

    engine->plug ();
    TEST_ASSERT_TRUE (run_until (
      io_context, [&engine] () { return engine->queued () == 0; }));
    TEST_ASSERT_SUCCESS_ERRNO (engine->send (make_log_event ("INFO", "3")));

    engine->terminate ();
    TEST_ASSERT_EQUAL_INT (1, sink.disconnects);
    TEST_ASSERT_FAILURE_ERRNO (ENOTCONN,
                               engine->send (make_log_event ("INFO", "4")));
}

void test_send_after_close ()
{
    boost::asio::io_context io_context;
    collecting_sink_t sink;
    scripted_transport_t *transport = NULL;
    std::shared_ptr<tapewire::stream_engine_t> engine =
      make_engine (io_context, tapewire::options_t (), sink, transport);
    engine->plug ();

    engine->close ();
    TEST_ASSERT_FAILURE_ERRNO (ENOTCONN,
                               engine->send (make_log_event ("INFO", "late")));

    TEST_ASSERT_TRUE (run_until (
      io_context, [&sink] () { return sink.terminal_count () > 0; }));
    TEST_ASSERT_EQUAL_INT (1, sink.disconnects);
    TEST_ASSERT_TRUE (transport->written ().empty ());
}

void test_terminate_mid_frame ()
{
    boost::asio::io_context io_context;
    collecting_sink_t sink;
    scripted_transport_t *transport = NULL;
    std::shared_ptr<tapewire::stream_engine_t> engine =
      make_engine (io_context, tapewire::options_t (), sink, transport);
    engine->plug ();

    std::vector<unsigned char> frame;
    TEST_ASSERT_SUCCESS_ERRNO (tapewire::encode_event (
      make_price_update_event ("SPY", 528.75f, 529.0f), frame));
    frame.resize (frame.size () - 1);
    transport->push_input (frame);
    run_for (io_context, 20);

    engine->terminate ();
    engine->terminate ();

    TEST_ASSERT_EQUAL_UINT (1, sink.terminal_count ());
    TEST_ASSERT_EQUAL_INT (EINCOMPLETE, sink.failures[0]);

    run_for (io_context, 20);
    TEST_ASSERT_EQUAL_UINT (1, sink.terminal_count ());
    TEST_ASSERT_EQUAL_UINT (0, sink.events.size ());
}

void test_read_error_reported_once ()
{
    boost::asio::io_context io_context;
    collecting_sink_t sink;
    scripted_transport_t *transport = NULL;
    std::shared_ptr<tapewire::stream_engine_t> engine =
      make_engine (io_context, tapewire::options_t (), sink, transport);
    engine->plug ();

    //  One whole frame, then the connection is reset.
    const std::vector<tapewire::event_t> events (
      1, make_match_event ("BUY", 100, "AAPL", 172.34f));
    transport->push_input (encode_stream (events));
    transport->push_error (boost::asio::error::connection_reset);

    TEST_ASSERT_TRUE (run_until (
      io_context, [&sink] () { return sink.terminal_count () > 0; }));
    run_for (io_context, 50);

    assert_events_equal (events, sink.events);
    TEST_ASSERT_EQUAL_UINT (1, sink.terminal_count ());
    TEST_ASSERT_EQUAL_INT (0, sink.disconnects);
    TEST_ASSERT_EQUAL_UINT (1, sink.failures.size ());
    TEST_ASSERT_EQUAL_INT (ECONNRESET, sink.failures[0]);
    TEST_ASSERT_FALSE (engine->active ());
    TEST_ASSERT_FALSE (transport->is_open ());
}

void test_write_error_reported_once ()
{
    boost::asio::io_context io_context;
    collecting_sink_t sink;
    scripted_transport_t *transport = NULL;
    std::shared_ptr<tapewire::stream_engine_t> engine =
      make_engine (io_context, tapewire::options_t (), sink, transport);
    transport->fail_writes (boost::asio::error::broken_pipe);
    engine->plug ();

    const std::vector<tapewire::event_t> events = sample_events ();
    for (size_t i = 0; i != events.size (); ++i)
        TEST_ASSERT_SUCCESS_ERRNO (engine->send (events[i]));

    TEST_ASSERT_TRUE (run_until (
      io_context, [&sink] () { return sink.terminal_count () > 0; }));

    //  Closing a dead engine adds nothing.
    engine->close ();
    engine->terminate ();
    run_for (io_context, 50);

    TEST_ASSERT_EQUAL_UINT (1, sink.terminal_count ());
    TEST_ASSERT_EQUAL_INT (0, sink.disconnects);
    TEST_ASSERT_EQUAL_UINT (1, sink.failures.size ());
    TEST_ASSERT_EQUAL_INT (EPIPE, sink.failures[0]);
    TEST_ASSERT_EQUAL_UINT (0, transport->written ().size ());
    TEST_ASSERT_EQUAL_UINT (0, engine->queued ());
    TEST_ASSERT_FAILURE_ERRNO (ENOTCONN,
                               engine->send (make_log_event ("INFO", "x")));
}

int main (void)
{
    UNITY_BEGIN ();

    RUN_TEST (test_receive_in_order);
    RUN_TEST (test_one_byte_reads);
    RUN_TEST (test_small_read_buffer);
    RUN_TEST (test_input_arriving_in_pieces);
    RUN_TEST (test_peer_close_mid_frame);
    RUN_TEST (test_peer_close_before_any_frame);
    RUN_TEST (test_unknown_tag);
    RUN_TEST (test_read_deadline);
    RUN_TEST (test_partial_writes);
    RUN_TEST (test_small_write_batches);
    RUN_TEST (test_send_errors);
    RUN_TEST (test_send_after_close);
    RUN_TEST (test_terminate_mid_frame);
    RUN_TEST (test_read_error_reported_once);
    RUN_TEST (test_write_error_reported_once);

    return UNITY_END ();
}
