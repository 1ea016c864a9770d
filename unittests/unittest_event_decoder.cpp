/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/event_decoder.hpp"
#include "protocol/wire.hpp"

#include <unity.h>
#include <memory>
#include <string>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

static std::vector<tapewire::event_t> sample_events ()
{
    std::vector<tapewire::event_t> events;
    events.push_back (make_price_update_event ("BTC/USD", 67203.0f, 67210.5f));
    events.push_back (make_match_event ("BUY", 100, "AAPL", 172.34f));
    events.push_back (
      make_log_event ("INFO", "Trade executed: Order#14352 matched with "
                              "Order#14349"));
    events.push_back (make_log_event ("", ""));
    events.push_back (make_match_event ("SELL", 0xffffffffLL, "", -1.5f));
    return events;
}

//  Feeds data_ to decoder_ in pieces of at most chunk_ bytes and collects
//  every completed event. Returns the rc of the last decode() call.
static int feed (tapewire::event_decoder_t &decoder_,
                 const std::vector<unsigned char> &data_,
                 size_t chunk_,
                 std::vector<tapewire::event_t> &events_)
{
    size_t offset = 0;
    int rc = 0;
    while (offset < data_.size ()) {
        const size_t size = std::min (chunk_, data_.size () - offset);
        size_t pos = 0;
        while (pos < size) {
            size_t processed = 0;
            rc = decoder_.decode (&data_[offset + pos], size - pos, processed);
            if (rc == -1)
                return rc;
            pos += processed;
            if (rc == 1) {
                std::unique_ptr<tapewire::event_t> event =
                  decoder_.release_event ();
                TEST_ASSERT_NOT_NULL (event.get ());
                events_.push_back (*event);
            }
        }
        offset += size;
    }
    return rc;
}

void test_decode_match_event_bytes ()
{
    const unsigned char frame[] = {0x02, 0x00, 0x03, 0x00, 0x04, 0x00, 0x00,
                                   0x00, 0x64, 0x43, 0x2c, 0x57, 0x0a, 'B',
                                   'U',  'Y',  'A',  'A',  'P',  'L'};
    tapewire::event_decoder_t decoder;

    size_t processed = 0;
    const int rc = decoder.decode (frame, sizeof (frame), processed);
    TEST_ASSERT_EQUAL_INT (1, rc);
    TEST_ASSERT_EQUAL_UINT (sizeof (frame), processed);

    std::unique_ptr<tapewire::event_t> event = decoder.release_event ();
    TEST_ASSERT_NOT_NULL (event.get ());
    TEST_ASSERT_EQUAL_UINT8 (TAPEWIRE_EVENT_MATCH, event->type ());
    TEST_ASSERT_EQUAL_STRING ("BUY", event->match ().side.c_str ());
    TEST_ASSERT_EQUAL_STRING ("AAPL", event->match ().symbol.c_str ());
    TEST_ASSERT_EQUAL_INT64 (100, event->match ().quantity);
    TEST_ASSERT_EQUAL_FLOAT (172.34f, event->match ().price);
    TEST_ASSERT_TRUE (decoder.stage () == tapewire::event_decoder_t::awaiting_tag);
    TEST_ASSERT_EQUAL_INT (0, decoder.finish ());
}

void test_round_trip ()
{
    const std::vector<tapewire::event_t> events = sample_events ();

    for (size_t i = 0; i != events.size (); ++i) {
        std::vector<unsigned char> frame;
        TEST_ASSERT_SUCCESS_ERRNO (tapewire::encode_event (events[i], frame));

        tapewire::event_decoder_t decoder;
        size_t processed = 0;
        TEST_ASSERT_EQUAL_INT (
          1, decoder.decode (&frame[0], frame.size (), processed));
        TEST_ASSERT_EQUAL_UINT (frame.size (), processed);

        std::unique_ptr<tapewire::event_t> event = decoder.release_event ();
        TEST_ASSERT_NOT_NULL (event.get ());
        TEST_ASSERT_TRUE (*event == events[i]);
    }
}

void test_every_split_point ()
{
    const tapewire::event_t expected =
      make_log_event ("DEBUG", "Received order: ID#14352 (BUY 25 ETH @ $3,200)");
    std::vector<unsigned char> frame;
    TEST_ASSERT_SUCCESS_ERRNO (tapewire::encode_event (expected, frame));

    for (size_t split = 1; split < frame.size (); ++split) {
        tapewire::event_decoder_t decoder;

        size_t processed = 0;
        TEST_ASSERT_EQUAL_INT (0, decoder.decode (&frame[0], split, processed));
        TEST_ASSERT_EQUAL_UINT (split, processed);
        TEST_ASSERT_TRUE (decoder.in_frame ());
        TEST_ASSERT_NULL (decoder.release_event ().get ());

        TEST_ASSERT_EQUAL_INT (1, decoder.decode (&frame[split],
                                                  frame.size () - split,
                                                  processed));
        TEST_ASSERT_EQUAL_UINT (frame.size () - split, processed);

        std::unique_ptr<tapewire::event_t> event = decoder.release_event ();
        TEST_ASSERT_NOT_NULL (event.get ());
        TEST_ASSERT_TRUE (*event == expected);
    }
}

void test_byte_by_byte ()
{
    const std::vector<tapewire::event_t> events = sample_events ();
    const std::vector<unsigned char> stream = encode_stream (events);

    tapewire::event_decoder_t decoder;
    std::vector<tapewire::event_t> decoded;
    TEST_ASSERT_EQUAL_INT (1, feed (decoder, stream, 1, decoded));

    TEST_ASSERT_EQUAL_UINT (events.size (), decoded.size ());
    for (size_t i = 0; i != events.size (); ++i)
        TEST_ASSERT_TRUE (decoded[i] == events[i]);
}

void test_stages ()
{
    std::vector<unsigned char> frame;
    TEST_ASSERT_SUCCESS_ERRNO (tapewire::encode_event (
      make_price_update_event ("SPY", 528.75f, 529.0f), frame));

    tapewire::event_decoder_t decoder;
    TEST_ASSERT_TRUE (decoder.stage () == tapewire::event_decoder_t::awaiting_tag);

    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (0, decoder.decode (&frame[0], 1, processed));
    TEST_ASSERT_TRUE (decoder.stage ()
                      == tapewire::event_decoder_t::awaiting_header);

    TEST_ASSERT_EQUAL_INT (0, decoder.decode (&frame[1], 10, processed));
    TEST_ASSERT_TRUE (decoder.stage ()
                      == tapewire::event_decoder_t::awaiting_payload);

    TEST_ASSERT_EQUAL_INT (1, decoder.decode (&frame[11], 3, processed));
    TEST_ASSERT_TRUE (decoder.stage () == tapewire::event_decoder_t::awaiting_tag);
}

void test_multi_frame_order ()
{
    const std::vector<tapewire::event_t> events = sample_events ();
    const std::vector<unsigned char> stream = encode_stream (events);

    //  One buffer holding every frame: decode() stops after each one.
    tapewire::event_decoder_t decoder;
    std::vector<tapewire::event_t> decoded;
    TEST_ASSERT_EQUAL_INT (1, feed (decoder, stream, stream.size (), decoded));

    TEST_ASSERT_EQUAL_UINT (events.size (), decoded.size ());
    for (size_t i = 0; i != events.size (); ++i)
        TEST_ASSERT_TRUE (decoded[i] == events[i]);
}

void test_odd_chunk_sizes ()
{
    const std::vector<tapewire::event_t> events = sample_events ();
    const std::vector<unsigned char> stream = encode_stream (events);

    const size_t chunks[] = {2, 3, 7, 11, 19};
    for (size_t c = 0; c < sizeof (chunks) / sizeof (chunks[0]); ++c) {
        tapewire::event_decoder_t decoder;
        std::vector<tapewire::event_t> decoded;
        TEST_ASSERT_TRUE (feed (decoder, stream, chunks[c], decoded) != -1);
        TEST_ASSERT_EQUAL_UINT (events.size (), decoded.size ());
        for (size_t i = 0; i != events.size (); ++i)
            TEST_ASSERT_TRUE (decoded[i] == events[i]);
        TEST_ASSERT_EQUAL_INT (0, decoder.finish ());
    }
}

void test_unknown_tag ()
{
    const unsigned char data[] = {0x09, 0x00, 0x03, 0x00, 0x04};
    tapewire::event_decoder_t decoder;

    size_t processed = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EPROTO, decoder.decode (data, sizeof (data), processed));
    TEST_ASSERT_EQUAL_UINT (1, processed);
    TEST_ASSERT_NULL (decoder.release_event ().get ());
}

void test_unknown_tag_after_valid_frame ()
{
    std::vector<unsigned char> stream;
    TEST_ASSERT_SUCCESS_ERRNO (
      tapewire::encode_event (make_log_event ("INFO", "ok"), stream));
    stream.push_back (0x00);

    tapewire::event_decoder_t decoder;
    std::vector<tapewire::event_t> decoded;
    TEST_ASSERT_FAILURE_ERRNO (EPROTO, feed (decoder, stream, stream.size (),
                                             decoded));
    TEST_ASSERT_EQUAL_UINT (1, decoded.size ());
}

void test_dead_after_error ()
{
    const unsigned char bad[] = {0x09};
    tapewire::event_decoder_t decoder;

    size_t processed = 0;
    TEST_ASSERT_FAILURE_ERRNO (EPROTO, decoder.decode (bad, 1, processed));

    //  Valid input no longer helps.
    std::vector<unsigned char> frame;
    TEST_ASSERT_SUCCESS_ERRNO (
      tapewire::encode_event (make_log_event ("INFO", "ok"), frame));
    TEST_ASSERT_FAILURE_ERRNO (
      EPROTO, decoder.decode (&frame[0], frame.size (), processed));
    TEST_ASSERT_EQUAL_UINT (0, processed);
    TEST_ASSERT_FAILURE_ERRNO (EPROTO, decoder.finish ());
}

void test_truncated_frame ()
{
    std::vector<unsigned char> frame;
    TEST_ASSERT_SUCCESS_ERRNO (tapewire::encode_event (
      make_match_event ("BUY", 100, "AAPL", 172.34f), frame));

    //  Cut after the tag, inside the header, after the header and one byte
    //  short of the end.
    const size_t cuts[] = {1, 6, 13, frame.size () - 1};
    for (size_t i = 0; i < sizeof (cuts) / sizeof (cuts[0]); ++i) {
        tapewire::event_decoder_t decoder;
        size_t processed = 0;
        TEST_ASSERT_EQUAL_INT (0, decoder.decode (&frame[0], cuts[i],
                                                  processed));
        TEST_ASSERT_FAILURE_ERRNO (EINCOMPLETE, decoder.finish ());
        TEST_ASSERT_NULL (decoder.release_event ().get ());

        //  The failure sticks.
        TEST_ASSERT_FAILURE_ERRNO (EINCOMPLETE, decoder.finish ());
    }
}

void test_finish_on_boundary ()
{
    tapewire::event_decoder_t decoder;
    TEST_ASSERT_EQUAL_INT (0, decoder.finish ());

    std::vector<unsigned char> frame;
    TEST_ASSERT_SUCCESS_ERRNO (
      tapewire::encode_event (make_log_event ("WARN", "x"), frame));
    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (&frame[0], frame.size (),
                                              processed));
    TEST_ASSERT_FALSE (decoder.in_frame ());
    TEST_ASSERT_EQUAL_INT (0, decoder.finish ());
}

void test_zero_length_texts ()
{
    const unsigned char frame[] = {0x01, 0x00, 0x00, 0x00, 0x00};
    tapewire::event_decoder_t decoder;

    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (frame, sizeof (frame), processed));
    TEST_ASSERT_EQUAL_UINT (sizeof (frame), processed);

    std::unique_ptr<tapewire::event_t> event = decoder.release_event ();
    TEST_ASSERT_NOT_NULL (event.get ());
    TEST_ASSERT_EQUAL_UINT8 (TAPEWIRE_EVENT_LOG, event->type ());
    TEST_ASSERT_TRUE (event->log ().level.empty ());
    TEST_ASSERT_TRUE (event->log ().message.empty ());
}

void test_largest_quantity ()
{
    unsigned char frame[13] = {0x02, 0x00, 0x00, 0x00, 0x00};
    tapewire::put_uint32 (frame + 5, 0xffffffff);
    tapewire::put_float (frame + 9, 1.0f);

    tapewire::event_decoder_t decoder;
    size_t processed = 0;
    TEST_ASSERT_EQUAL_INT (1, decoder.decode (frame, sizeof (frame), processed));

    std::unique_ptr<tapewire::event_t> event = decoder.release_event ();
    TEST_ASSERT_NOT_NULL (event.get ());
    TEST_ASSERT_EQUAL_INT64 (INT64_C (0xffffffff), event->match ().quantity);
}

void test_text_sizes_follow_each_frame ()
{
    //  Long texts, then shorter and empty ones, then long again, all on
    //  one decoder. Each frame gets exactly its own text lengths.
    const std::string long_text (3000, 'x');
    std::vector<tapewire::event_t> events;
    events.push_back (make_log_event (long_text.c_str (), long_text.c_str ()));
    events.push_back (make_log_event ("WARN", ""));
    events.push_back (make_match_event ("BUY", 7, long_text.c_str (), 1.0f));
    events.push_back (make_match_event ("", 8, "X", 2.0f));
    events.push_back (make_price_update_event ("", 3.0f, 4.0f));
    events.push_back (make_log_event ("", long_text.c_str ()));

    const std::vector<unsigned char> stream = encode_stream (events);
    const size_t chunks[] = {1, 7, 4096};
    for (size_t c = 0; c != sizeof chunks / sizeof chunks[0]; ++c) {
        tapewire::event_decoder_t decoder;
        std::vector<tapewire::event_t> decoded;
        TEST_ASSERT_EQUAL_INT (1, feed (decoder, stream, chunks[c], decoded));
        TEST_ASSERT_EQUAL_UINT (events.size (), decoded.size ());
        for (size_t i = 0; i != events.size (); ++i)
            TEST_ASSERT_TRUE (decoded[i] == events[i]);
        TEST_ASSERT_EQUAL_UINT (0, decoded[1].log ().message.size ());
        TEST_ASSERT_EQUAL_UINT (1, decoded[3].match ().symbol.size ());
    }
}

int main (void)
{
    UNITY_BEGIN ();

    RUN_TEST (test_decode_match_event_bytes);
    RUN_TEST (test_round_trip);
    RUN_TEST (test_every_split_point);
    RUN_TEST (test_byte_by_byte);
    RUN_TEST (test_stages);
    RUN_TEST (test_multi_frame_order);
    RUN_TEST (test_odd_chunk_sizes);
    RUN_TEST (test_unknown_tag);
    RUN_TEST (test_unknown_tag_after_valid_frame);
    RUN_TEST (test_dead_after_error);
    RUN_TEST (test_truncated_frame);
    RUN_TEST (test_finish_on_boundary);
    RUN_TEST (test_zero_length_texts);
    RUN_TEST (test_largest_quantity);
    RUN_TEST (test_text_sizes_follow_each_frame);

    return UNITY_END ();
}
