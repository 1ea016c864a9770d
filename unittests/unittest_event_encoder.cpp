/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/event_encoder.hpp"

#include <unity.h>
#include <string>
#include <vector>

void setUp ()
{
}

void tearDown ()
{
}

static std::vector<unsigned char> frame_of (const tapewire::event_t &event_)
{
    std::vector<unsigned char> frame;
    TEST_ASSERT_SUCCESS_ERRNO (tapewire::encode_event (event_, frame));
    return frame;
}

//  Drains the encoder through a caller supplied buffer of chunk_ bytes.
static std::vector<unsigned char>
encode_in_chunks (tapewire::event_encoder_t &encoder_, size_t chunk_)
{
    std::vector<unsigned char> out;
    std::vector<unsigned char> buf (chunk_);
    while (true) {
        unsigned char *data = &buf[0];
        const size_t size = encoder_.encode (&data, buf.size ());
        if (size == 0)
            break;
        TEST_ASSERT_TRUE (size <= chunk_);
        out.insert (out.end (), data, data + size);
    }
    return out;
}

void test_match_event_bytes ()
{
    const unsigned char expected[] = {
      0x02,                         //  tag
      0x00, 0x03,                   //  len side
      0x00, 0x04,                   //  len symbol
      0x00, 0x00, 0x00, 0x64,       //  quantity 100
      0x43, 0x2c, 0x57, 0x0a,       //  price 172.34
      'B',  'U',  'Y',  'A', 'A', 'P', 'L'};

    const std::vector<unsigned char> frame =
      frame_of (make_match_event ("BUY", 100, "AAPL", 172.34f));

    TEST_ASSERT_EQUAL_UINT (sizeof (expected), frame.size ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (expected, &frame[0], sizeof (expected));
}

void test_log_event_bytes ()
{
    const unsigned char expected[] = {0x01, 0x00, 0x04, 0x00, 0x02, 'I',
                                      'N',  'F',  'O',  'o',  'k'};

    const std::vector<unsigned char> frame =
      frame_of (make_log_event ("INFO", "ok"));

    TEST_ASSERT_EQUAL_UINT (sizeof (expected), frame.size ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (expected, &frame[0], sizeof (expected));
}

void test_price_update_event_bytes ()
{
    const unsigned char expected[] = {
      0x03, 0x00, 0x07, 0x47, 0x83, 0x41, 0x80, 0x47, 0x83, 0x45,
      0x40, 'B',  'T',  'C',  '/',  'U',  'S',  'D'};

    const std::vector<unsigned char> frame =
      frame_of (make_price_update_event ("BTC/USD", 67203.0f, 67210.5f));

    TEST_ASSERT_EQUAL_UINT (sizeof (expected), frame.size ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (expected, &frame[0], sizeof (expected));
}

void test_zero_length_texts ()
{
    const unsigned char expected[] = {0x01, 0x00, 0x00, 0x00, 0x00};

    const std::vector<unsigned char> frame = frame_of (make_log_event ("", ""));

    TEST_ASSERT_EQUAL_UINT (sizeof (expected), frame.size ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (expected, &frame[0], sizeof (expected));
}

void test_unset_numbers_encode_as_zero ()
{
    tapewire::match_event_t match;
    match.side = "BUY";
    match.symbol = "X";
    const unsigned char match_expected[] = {0x02, 0x00, 0x03, 0x00, 0x01,
                                            0x00, 0x00, 0x00, 0x00, 0x00,
                                            0x00, 0x00, 0x00, 'B',  'U',
                                            'Y',  'X'};
    const std::vector<unsigned char> match_frame =
      frame_of (tapewire::event_t (match));
    TEST_ASSERT_EQUAL_UINT (sizeof (match_expected), match_frame.size ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (match_expected, &match_frame[0],
                                  sizeof (match_expected));

    tapewire::price_update_event_t update;
    update.symbol = "X";
    const unsigned char update_expected[] = {0x03, 0x00, 0x01, 0x00,
                                             0x00, 0x00, 0x00, 0x00,
                                             0x00, 0x00, 0x00, 'X'};
    const std::vector<unsigned char> update_frame =
      frame_of (tapewire::event_t (update));
    TEST_ASSERT_EQUAL_UINT (sizeof (update_expected), update_frame.size ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (update_expected, &update_frame[0],
                                  sizeof (update_expected));
}

void test_encode_event_appends ()
{
    std::vector<unsigned char> stream (2, 0xee);
    TEST_ASSERT_SUCCESS_ERRNO (
      tapewire::encode_event (make_log_event ("A", "B"), stream));
    TEST_ASSERT_EQUAL_UINT (2 + 1 + 4 + 2, stream.size ());
    TEST_ASSERT_EQUAL_HEX8 (0xee, stream[0]);
    TEST_ASSERT_EQUAL_HEX8 (0xee, stream[1]);
    TEST_ASSERT_EQUAL_HEX8 (TAPEWIRE_EVENT_LOG, stream[2]);
}

void test_longest_text_accepted ()
{
    const std::string message (TAPEWIRE_MAX_TEXT_SIZE, 'x');
    const std::vector<unsigned char> frame =
      frame_of (make_log_event ("INFO", message.c_str ()));

    TEST_ASSERT_EQUAL_UINT (1 + 4 + 4 + TAPEWIRE_MAX_TEXT_SIZE, frame.size ());
    TEST_ASSERT_EQUAL_HEX8 (0xff, frame[3]);
    TEST_ASSERT_EQUAL_HEX8 (0xff, frame[4]);
}

void test_text_too_long ()
{
    const std::string message (TAPEWIRE_MAX_TEXT_SIZE + 1, 'x');
    std::vector<unsigned char> frame (3, 0xaa);

    TEST_ASSERT_FAILURE_ERRNO (
      EMSGSIZE,
      tapewire::encode_event (make_log_event ("INFO", message.c_str ()), frame));

    //  Output left untouched.
    TEST_ASSERT_EQUAL_UINT (3, frame.size ());
    TEST_ASSERT_EQUAL_HEX8 (0xaa, frame[2]);
}

void test_symbol_too_long ()
{
    const std::string symbol (TAPEWIRE_MAX_TEXT_SIZE + 1, 'S');
    std::vector<unsigned char> frame;

    TEST_ASSERT_FAILURE_ERRNO (
      EMSGSIZE,
      tapewire::encode_event (
        make_price_update_event (symbol.c_str (), 1.0f, 2.0f), frame));
    TEST_ASSERT_TRUE (frame.empty ());
}

void test_quantity_out_of_range ()
{
    std::vector<unsigned char> frame;

    TEST_ASSERT_FAILURE_ERRNO (
      ERANGE, tapewire::encode_event (
                make_match_event ("BUY", -1, "AAPL", 172.34f), frame));
    TEST_ASSERT_FAILURE_ERRNO (
      ERANGE,
      tapewire::encode_event (
        make_match_event ("BUY", INT64_C (0x100000000), "AAPL", 172.34f),
        frame));
    TEST_ASSERT_TRUE (frame.empty ());

    //  Both ends of the u32 range fit.
    TEST_ASSERT_SUCCESS_ERRNO (tapewire::encode_event (
      make_match_event ("BUY", 0, "AAPL", 1.0f), frame));
    TEST_ASSERT_SUCCESS_ERRNO (tapewire::encode_event (
      make_match_event ("BUY", INT64_C (0xffffffff), "AAPL", 1.0f), frame));
    TEST_ASSERT_EQUAL_HEX8 (0xff, frame[frame.size () - 7 - 4 - 1]);
}

void test_rejected_event_leaves_encoder_idle ()
{
    tapewire::event_encoder_t encoder (64);

    TEST_ASSERT_FAILURE_ERRNO (
      ERANGE, encoder.load_event (make_match_event ("BUY", -5, "AAPL", 1.0f)));
    TEST_ASSERT_FALSE (encoder.busy ());

    unsigned char *data = NULL;
    TEST_ASSERT_EQUAL_UINT (0, encoder.encode (&data, 0));
}

void test_chunked_output_identical ()
{
    const tapewire::event_t event =
      make_log_event ("DEBUG", "Received order: ID#14352 (BUY 25 ETH @ $3,200)");
    const std::vector<unsigned char> expected = frame_of (event);

    const size_t chunks[] = {1, 2, 3, 5, 7, 13, 64, 1024};
    for (size_t i = 0; i < sizeof (chunks) / sizeof (chunks[0]); ++i) {
        tapewire::event_encoder_t encoder (16);
        TEST_ASSERT_SUCCESS_ERRNO (encoder.load_event (event));
        TEST_ASSERT_TRUE (encoder.busy ());

        const std::vector<unsigned char> out =
          encode_in_chunks (encoder, chunks[i]);
        TEST_ASSERT_FALSE (encoder.busy ());
        TEST_ASSERT_EQUAL_UINT (expected.size (), out.size ());
        TEST_ASSERT_EQUAL_HEX8_ARRAY (&expected[0], &out[0], expected.size ());
    }
}

void test_own_buffer_output_identical ()
{
    const tapewire::event_t event =
      make_match_event ("SELL", 5, "BTC", 67200.0f);
    const std::vector<unsigned char> expected = frame_of (event);

    const size_t bufsizes[] = {1, 4, 9, 18, 256};
    for (size_t i = 0; i < sizeof (bufsizes) / sizeof (bufsizes[0]); ++i) {
        tapewire::event_encoder_t encoder (bufsizes[i]);
        TEST_ASSERT_SUCCESS_ERRNO (encoder.load_event (event));

        std::vector<unsigned char> out;
        while (true) {
            unsigned char *data = NULL;
            const size_t size = encoder.encode (&data, 0);
            if (size == 0)
                break;
            out.insert (out.end (), data, data + size);
        }
        TEST_ASSERT_EQUAL_UINT (expected.size (), out.size ());
        TEST_ASSERT_EQUAL_HEX8_ARRAY (&expected[0], &out[0], expected.size ());
    }
}

void test_encoder_reusable ()
{
    tapewire::event_encoder_t encoder (8);
    std::vector<tapewire::event_t> events;
    events.push_back (make_log_event ("INFO", "first"));
    events.push_back (make_price_update_event ("SPY", 528.75f, 529.0f));
    events.push_back (make_match_event ("BUY", 50, "TSLA", 187.9f));

    std::vector<unsigned char> out;
    for (size_t i = 0; i != events.size (); ++i) {
        TEST_ASSERT_SUCCESS_ERRNO (encoder.load_event (events[i]));
        const std::vector<unsigned char> frame = encode_in_chunks (encoder, 3);
        out.insert (out.end (), frame.begin (), frame.end ());
    }

    const std::vector<unsigned char> expected = encode_stream (events);
    TEST_ASSERT_EQUAL_UINT (expected.size (), out.size ());
    TEST_ASSERT_EQUAL_HEX8_ARRAY (&expected[0], &out[0], expected.size ());
}

int main (void)
{
    UNITY_BEGIN ();

    RUN_TEST (test_match_event_bytes);
    RUN_TEST (test_log_event_bytes);
    RUN_TEST (test_price_update_event_bytes);
    RUN_TEST (test_zero_length_texts);
    RUN_TEST (test_unset_numbers_encode_as_zero);
    RUN_TEST (test_encode_event_appends);
    RUN_TEST (test_longest_text_accepted);
    RUN_TEST (test_text_too_long);
    RUN_TEST (test_symbol_too_long);
    RUN_TEST (test_quantity_out_of_range);
    RUN_TEST (test_rejected_event_leaves_encoder_idle);
    RUN_TEST (test_chunked_output_identical);
    RUN_TEST (test_own_buffer_output_identical);
    RUN_TEST (test_encoder_reusable);

    return UNITY_END ();
}
