/* SPDX-License-Identifier: MPL-2.0 */

/*
 * Producer and consumer over TCP loopback, both driven by one io_context.
 */

#include "testutil.hpp"

#include "core/options.hpp"
#include "transports/tcp/tcp_connecter.hpp"
#include "transports/tcp/tcp_listener.hpp"

#include <unity.h>
#include <map>
#include <string>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

static std::vector<tapewire::event_t> numbered_events (const char *symbol_,
                                                       int count_)
{
    std::vector<tapewire::event_t> events;
    for (int i = 0; i < count_; ++i) {
        switch (i % 3) {
            case 0:
                events.push_back (make_match_event (
                  "BUY", i, symbol_, 100.0f + static_cast<float> (i)));
                break;
            case 1:
                events.push_back (make_price_update_event (
                  symbol_, static_cast<float> (i), static_cast<float> (i + 1)));
                break;
            default:
                events.push_back (make_log_event (symbol_, "tick"));
                break;
        }
    }
    return events;
}

static void bind_loopback (tapewire::tcp_listener_t &listener_,
                           std::string &endpoint_)
{
    TEST_ASSERT_SUCCESS_ERRNO (listener_.bind ("tcp://127.0.0.1:*"));
    endpoint_ = listener_.last_endpoint ();
    TEST_ASSERT_TRUE (endpoint_.find ("tcp://127.0.0.1:") == 0);
    TEST_ASSERT_TRUE (endpoint_ != "tcp://127.0.0.1:0");
}

void test_producer_to_consumer_order ()
{
    boost::asio::io_context io_context;
    const tapewire::options_t options;
    collecting_sink_t consumer_sink;
    collecting_sink_t producer_sink;

    tapewire::tcp_listener_t listener (io_context, options, &consumer_sink);
    std::string endpoint;
    bind_loopback (listener, endpoint);

    tapewire::tcp_connecter_t connecter (io_context, options, &producer_sink);
    TEST_ASSERT_SUCCESS_ERRNO (connecter.connect (endpoint));
    TEST_ASSERT_TRUE (run_until (io_context, [&] () {
        return producer_sink.connects.size () == 1
               && consumer_sink.connects.size () == 1;
    }));
    TEST_ASSERT_TRUE (connecter.connected ());
    TEST_ASSERT_EQUAL_STRING (endpoint.c_str (),
                              producer_sink.connects[0].c_str ());
    TEST_ASSERT_EQUAL_UINT (1, listener.connection_count ());

    const std::vector<tapewire::event_t> events = numbered_events ("AAPL", 300);
    for (size_t i = 0; i != events.size (); ++i)
        TEST_ASSERT_SUCCESS_ERRNO (connecter.send (events[i]));
    connecter.close ();

    TEST_ASSERT_TRUE (run_until (io_context, [&] () {
        return consumer_sink.terminal_count () == 1
               && producer_sink.terminal_count () == 1;
    }));

    TEST_ASSERT_EQUAL_UINT (events.size (), consumer_sink.events.size ());
    for (size_t i = 0; i != events.size (); ++i)
        TEST_ASSERT_TRUE (consumer_sink.events[i] == events[i]);
    TEST_ASSERT_EQUAL_INT (1, consumer_sink.disconnects);
    TEST_ASSERT_EQUAL_INT (1, producer_sink.disconnects);
    TEST_ASSERT_EQUAL_UINT (0, listener.connection_count ());

    listener.close ();
}

void test_two_producers_isolated ()
{
    boost::asio::io_context io_context;
    tapewire::options_t options;
    options.sndhwm = 0;
    collecting_sink_t consumer_sink;
    collecting_sink_t producer_sink;

    tapewire::tcp_listener_t listener (io_context, options, &consumer_sink);
    std::string endpoint;
    bind_loopback (listener, endpoint);

    tapewire::tcp_connecter_t first (io_context, options, &producer_sink);
    tapewire::tcp_connecter_t second (io_context, options, &producer_sink);
    TEST_ASSERT_SUCCESS_ERRNO (first.connect (endpoint));
    TEST_ASSERT_SUCCESS_ERRNO (second.connect (endpoint));
    TEST_ASSERT_TRUE (run_until (io_context, [&] () {
        return consumer_sink.connects.size () == 2 && first.connected ()
               && second.connected ();
    }));
    TEST_ASSERT_TRUE (consumer_sink.connects[0] != consumer_sink.connects[1]);

    //  Interleave the sends; each stream must still arrive whole.
    const std::vector<tapewire::event_t> a = numbered_events ("AAA", 200);
    const std::vector<tapewire::event_t> b = numbered_events ("BBB", 200);
    for (size_t i = 0; i != a.size (); ++i) {
        TEST_ASSERT_SUCCESS_ERRNO (first.send (a[i]));
        TEST_ASSERT_SUCCESS_ERRNO (second.send (b[i]));
    }
    first.close ();
    second.close ();

    TEST_ASSERT_TRUE (run_until (io_context, [&] () {
        return consumer_sink.terminal_count () == 2;
    }));
    TEST_ASSERT_EQUAL_INT (2, consumer_sink.disconnects);
    TEST_ASSERT_EQUAL_UINT (a.size () + b.size (), consumer_sink.events.size ());

    std::map<std::string, std::vector<tapewire::event_t> > by_peer;
    for (size_t i = 0; i != consumer_sink.events.size (); ++i)
        by_peer[consumer_sink.event_peers[i]].push_back (
          consumer_sink.events[i]);
    TEST_ASSERT_EQUAL_UINT (2, by_peer.size ());

    for (std::map<std::string, std::vector<tapewire::event_t> >::const_iterator
           it = by_peer.begin ();
         it != by_peer.end (); ++it) {
        const std::vector<tapewire::event_t> &received = it->second;
        TEST_ASSERT_EQUAL_UINT (a.size (), received.size ());
        const std::vector<tapewire::event_t> &expected =
          received[0] == a[0] ? a : b;
        for (size_t i = 0; i != expected.size (); ++i)
            TEST_ASSERT_TRUE (received[i] == expected[i]);
    }

    listener.close ();
}

void test_connection_refused ()
{
    boost::asio::io_context io_context;
    tapewire::options_t options;
    options.reconnect_ivl = -1;
    collecting_sink_t consumer_sink;
    collecting_sink_t producer_sink;

    //  Find a port nobody listens on.
    std::string endpoint;
    {
        tapewire::tcp_listener_t listener (io_context, options, &consumer_sink);
        bind_loopback (listener, endpoint);
        listener.close ();
    }

    tapewire::tcp_connecter_t connecter (io_context, options, &producer_sink);
    TEST_ASSERT_SUCCESS_ERRNO (connecter.connect (endpoint));
    TEST_ASSERT_TRUE (run_until (io_context, [&] () {
        return producer_sink.terminal_count () == 1;
    }));

    TEST_ASSERT_EQUAL_UINT (0, producer_sink.connects.size ());
    TEST_ASSERT_EQUAL_UINT (1, producer_sink.failures.size ());
    TEST_ASSERT_EQUAL_INT (ECONNREFUSED, producer_sink.failures[0]);
    TEST_ASSERT_EQUAL_STRING (endpoint.c_str (),
                              producer_sink.closed_peers[0].c_str ());
    TEST_ASSERT_FALSE (connecter.connected ());
    TEST_ASSERT_FAILURE_ERRNO (ENOTCONN,
                               connecter.send (make_log_event ("INFO", "x")));
}

void test_reconnect_until_listener_appears ()
{
    boost::asio::io_context io_context;
    tapewire::options_t options;
    options.reconnect_ivl = 20;
    collecting_sink_t consumer_sink;
    collecting_sink_t producer_sink;

    std::string endpoint;
    {
        tapewire::tcp_listener_t unused (io_context, options, &consumer_sink);
        bind_loopback (unused, endpoint);
        unused.close ();
    }

    tapewire::tcp_connecter_t connecter (io_context, options, &producer_sink);
    TEST_ASSERT_SUCCESS_ERRNO (connecter.connect (endpoint));
    run_for (io_context, 100);
    TEST_ASSERT_FALSE (connecter.connected ());
    TEST_ASSERT_EQUAL_UINT (0, producer_sink.terminal_count ());

    tapewire::tcp_listener_t listener (io_context, options, &consumer_sink);
    TEST_ASSERT_SUCCESS_ERRNO (listener.bind (endpoint));
    TEST_ASSERT_TRUE (run_until (io_context, [&] () {
        return consumer_sink.connects.size () == 1 && connecter.connected ();
    }));

    TEST_ASSERT_SUCCESS_ERRNO (connecter.send (make_log_event ("INFO", "up")));
    connecter.close ();
    TEST_ASSERT_TRUE (run_until (io_context, [&] () {
        return consumer_sink.terminal_count () == 1;
    }));
    TEST_ASSERT_EQUAL_UINT (1, consumer_sink.events.size ());

    listener.close ();
}

void test_send_before_connect ()
{
    boost::asio::io_context io_context;
    collecting_sink_t sink;
    tapewire::tcp_connecter_t connecter (io_context, tapewire::options_t (),
                                         &sink);

    TEST_ASSERT_FAILURE_ERRNO (ENOTCONN,
                               connecter.send (make_log_event ("INFO", "x")));
}

void test_bad_endpoints ()
{
    boost::asio::io_context io_context;
    const tapewire::options_t options;
    collecting_sink_t sink;

    tapewire::tcp_listener_t listener (io_context, options, &sink);
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, listener.bind ("tcp://127.0.0.1"));
    TEST_ASSERT_FAILURE_ERRNO (EPROTONOSUPPORT,
                               listener.bind ("ipc://127.0.0.1:5555"));

    std::string endpoint;
    bind_loopback (listener, endpoint);

    tapewire::tcp_listener_t other (io_context, options, &sink);
    TEST_ASSERT_FAILURE_ERRNO (EADDRINUSE, other.bind (endpoint));

    tapewire::tcp_connecter_t connecter (io_context, options, &sink);
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, connecter.connect ("tcp://*:5555"));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, connecter.connect ("127.0.0.1:0"));

    listener.close ();
}

void test_listener_close_ends_connections ()
{
    boost::asio::io_context io_context;
    const tapewire::options_t options;
    collecting_sink_t consumer_sink;
    collecting_sink_t producer_sink;

    tapewire::tcp_listener_t listener (io_context, options, &consumer_sink);
    std::string endpoint;
    bind_loopback (listener, endpoint);

    tapewire::tcp_connecter_t connecter (io_context, options, &producer_sink);
    TEST_ASSERT_SUCCESS_ERRNO (connecter.connect (endpoint));
    TEST_ASSERT_TRUE (run_until (io_context, [&] () {
        return consumer_sink.connects.size () == 1 && connecter.connected ();
    }));

    listener.close ();
    TEST_ASSERT_EQUAL_INT (1, consumer_sink.disconnects);
    TEST_ASSERT_EQUAL_UINT (0, listener.connection_count ());

    //  The producer sees the peer go away at a frame boundary.
    TEST_ASSERT_TRUE (run_until (io_context, [&] () {
        return producer_sink.terminal_count () == 1;
    }));
    TEST_ASSERT_EQUAL_INT (1, producer_sink.disconnects);
}

void test_destroyed_connecter_ends_connection ()
{
    boost::asio::io_context io_context;
    const tapewire::options_t options;
    collecting_sink_t consumer_sink;

    tapewire::tcp_listener_t listener (io_context, options, &consumer_sink);
    std::string endpoint;
    bind_loopback (listener, endpoint);

    collecting_sink_t *producer_sink = new collecting_sink_t;
    tapewire::tcp_connecter_t *connecter =
      new tapewire::tcp_connecter_t (io_context, options, producer_sink);
    TEST_ASSERT_SUCCESS_ERRNO (connecter->connect (endpoint));
    TEST_ASSERT_TRUE (run_until (io_context, [&] () {
        return consumer_sink.connects.size () == 1 && connecter->connected ();
    }));

    //  The connection ends with the connecter, not later.
    delete connecter;
    TEST_ASSERT_EQUAL_UINT (1, producer_sink->terminal_count ());
    TEST_ASSERT_EQUAL_INT (1, producer_sink->disconnects);
    delete producer_sink;

    //  Nothing may reach the freed sink from here on.
    TEST_ASSERT_TRUE (run_until (io_context, [&] () {
        return consumer_sink.terminal_count () == 1;
    }));
    listener.close ();
    run_for (io_context, 50);

    TEST_ASSERT_EQUAL_UINT (1, consumer_sink.terminal_count ());
    TEST_ASSERT_EQUAL_INT (1, consumer_sink.disconnects);
}

int main (void)
{
    UNITY_BEGIN ();

    RUN_TEST (test_producer_to_consumer_order);
    RUN_TEST (test_two_producers_isolated);
    RUN_TEST (test_connection_refused);
    RUN_TEST (test_reconnect_until_listener_appears);
    RUN_TEST (test_send_before_connect);
    RUN_TEST (test_bad_endpoints);
    RUN_TEST (test_listener_close_ends_connections);
    RUN_TEST (test_destroyed_connecter_ends_connection);

    return UNITY_END ();
}
