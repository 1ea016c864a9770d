/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

#include "core/log_sink.hpp"

#include <unity.h>
#include <stdio.h>
#include <string>

static FILE *out;

void setUp ()
{
    out = tmpfile ();
    TEST_ASSERT_NOT_NULL (out);
}

void tearDown ()
{
    fclose (out);
    out = NULL;
}

//  Everything written to out so far.
static std::string written ()
{
    std::string text;
    rewind (out);
    char buf[256];
    size_t n;
    while ((n = fread (buf, 1, sizeof (buf), out)) > 0)
        text.append (buf, n);
    return text;
}

void test_format_log ()
{
    TEST_ASSERT_EQUAL_STRING (
      "[LOG] INFO: TCP server started on port 9001",
      tapewire::format_event (
        make_log_event ("INFO", "TCP server started on port 9001"))
        .c_str ());
}

void test_format_match ()
{
    TEST_ASSERT_EQUAL_STRING (
      "[MATCH] BUY 100 AAPL @ $172.34",
      tapewire::format_event (make_match_event ("BUY", 100, "AAPL", 172.34f))
        .c_str ());
    TEST_ASSERT_EQUAL_STRING (
      "[MATCH] SELL 5 BTC @ $67200.00",
      tapewire::format_event (make_match_event ("SELL", 5, "BTC", 67200.0f))
        .c_str ());
}

void test_format_price_update ()
{
    TEST_ASSERT_EQUAL_STRING (
      "[PRICE] BTC/USD: $67203.00 -> $67210.50",
      tapewire::format_event (
        make_price_update_event ("BTC/USD", 67203.0f, 67210.5f))
        .c_str ());
}

void test_status_lines ()
{
    tapewire::log_sink_t sink (out);

    sink.connected ("tcp://127.0.0.1:40000");
    sink.event_received ("tcp://127.0.0.1:40000",
                         std::unique_ptr<tapewire::event_t> (
                           new tapewire::event_t (make_log_event ("WARN", "x"))));
    sink.disconnected ("tcp://127.0.0.1:40000");
    sink.failed ("tcp://127.0.0.1:40001", EINCOMPLETE);

    TEST_ASSERT_EQUAL_UINT (1, sink.events ());
    TEST_ASSERT_EQUAL_STRING (
      "[STATUS] Connected by tcp://127.0.0.1:40000\n"
      "[LOG] WARN: x\n"
      "[STATUS] Connection from tcp://127.0.0.1:40000 closed\n"
      "[ERROR] tcp://127.0.0.1:40001: Stream ended mid-frame\n",
      written ().c_str ());
}

int main (void)
{
    UNITY_BEGIN ();

    RUN_TEST (test_format_log);
    RUN_TEST (test_format_match);
    RUN_TEST (test_format_price_update);
    RUN_TEST (test_status_lines);

    return UNITY_END ();
}
