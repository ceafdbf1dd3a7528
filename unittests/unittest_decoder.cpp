/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/jtp_decoder.hpp"
#include "protocol/jtp_encoder.hpp"
#include "protocol/jtp_protocol.hpp"

#include <unity.h>
#include <stdlib.h>
#include <set>
#include <string.h>
#include <vector>

typedef recorded_event_t ev;

static const uint32_t source = 0x12345678;

void setUp ()
{
    //  Tests rely on the built-in payload size.
    unsetenv ("JTP_MAX_PAYLOAD");
}

void tearDown ()
{
}

static bool feed (jtp::decoder_t &decoder_,
                  const std::vector<unsigned char> &packet_)
{
    return decoder_.accept (&packet_[0], packet_.size ());
}

void test_single_fragment_message ()
{
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, &sink);

    const char *text = "Hello, World!";
    std::vector<unsigned char> packet = build_packet (5, 0, 0, 1, source, 13);
    memcpy (&packet[jtp::jtp_header_size], text, 13);

    TEST_ASSERT_TRUE (feed (decoder, packet));
    TEST_ASSERT_EQUAL_size_t (3, sink.events.size ());
    TEST_ASSERT_EQUAL_INT (ev::message_start, sink.events[0].kind);
    TEST_ASSERT_EQUAL_UINT16 (1, sink.events[0].fragment_count);
    TEST_ASSERT_EQUAL_INT (ev::fragment_received, sink.events[1].kind);
    TEST_ASSERT_EQUAL_UINT16 (1, sink.events[1].fragments_received);
    TEST_ASSERT_EQUAL_INT (ev::message_complete, sink.events[2].kind);

    const recorded_event_t &complete = sink.events[2];
    TEST_ASSERT_EQUAL_UINT8 (5, complete.message_type);
    TEST_ASSERT_EQUAL_UINT16 (0, complete.message_id);
    TEST_ASSERT_EQUAL_UINT16 (1, complete.fragment_count);
    TEST_ASSERT_EQUAL_size_t (13, complete.total_bytes);
    TEST_ASSERT_EQUAL_size_t (13, complete.payload.size ());
    TEST_ASSERT_EQUAL_MEMORY (text, &complete.payload[0], 13);
    TEST_ASSERT_EQUAL_size_t (0, decoder.in_flight_count ());
}

void test_out_of_order_reassembly ()
{
    jtp::encoder_t encoder (source);
    std::vector<unsigned char> payload (2500, 0);
    std::vector<std::vector<unsigned char> > fragments;
    TEST_ASSERT_EQUAL_INT (
      3, encoder.fragment_all (&payload[0], payload.size (), 10, fragments));
    TEST_ASSERT_EQUAL_size_t (12 + 1200, fragments[0].size ());
    TEST_ASSERT_EQUAL_size_t (12 + 100, fragments[2].size ());

    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, &sink);
    TEST_ASSERT_TRUE (feed (decoder, fragments[2]));
    TEST_ASSERT_TRUE (feed (decoder, fragments[0]));
    TEST_ASSERT_EQUAL_INT (0, sink.count (ev::message_complete));
    TEST_ASSERT_TRUE (feed (decoder, fragments[1]));

    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::message_start));
    TEST_ASSERT_EQUAL_INT (3, sink.count (ev::fragment_received));
    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::message_complete));
    TEST_ASSERT_EQUAL_INT (0, sink.count (ev::error));

    //  Progress counts up by one regardless of arrival order.
    for (uint16_t i = 0; i < 3; i++)
        TEST_ASSERT_EQUAL_UINT16 (
          i + 1, sink.events[sink.find (ev::fragment_received, i)]
                   .fragments_received);

    const recorded_event_t *complete = sink.last (ev::message_complete);
    TEST_ASSERT_EQUAL_size_t (2500, complete->payload.size ());
    TEST_ASSERT_TRUE (complete->payload == payload);
}

void test_round_trip_sizes_shuffled ()
{
    const size_t max_payload = 64;
    jtp::options_t options;
    options.source_id = source;
    options.max_payload_size = max_payload;

    for (size_t size = 0; size <= 5 * max_payload; size++) {
        jtp::encoder_t encoder (options);
        recording_decoder_sink_t sink;
        jtp::decoder_t decoder (options, &sink);

        const std::vector<unsigned char> payload =
          make_payload (size, static_cast<unsigned> (size));
        std::vector<std::vector<unsigned char> > fragments;
        const int count = encoder.fragment_all (
          payload.empty () ? NULL : &payload[0], size, 9, fragments);
        TEST_ASSERT_EQUAL_size_t (jtp::jtp_fragment_count (size, max_payload),
                                  static_cast<size_t> (count));

        const std::vector<size_t> order =
          shuffled_indices (fragments.size (), static_cast<unsigned> (size));
        for (size_t i = 0; i < order.size (); i++)
            TEST_ASSERT_TRUE (feed (decoder, fragments[order[i]]));

        TEST_ASSERT_EQUAL_INT (1, sink.count (ev::message_complete));
        TEST_ASSERT_EQUAL_INT (0, sink.count (ev::error));
        TEST_ASSERT_TRUE (sink.last (ev::message_complete)->payload
                          == payload);
    }
}

void test_duplicate_fragment ()
{
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, &sink);

    const std::vector<unsigned char> first =
      build_packet (1, 7, 0, 3, source, 10, 0xAA);
    TEST_ASSERT_TRUE (feed (decoder, first));
    TEST_ASSERT_FALSE (feed (decoder, build_packet (1, 7, 0, 3, source, 10,
                                                    0xBB)));

    const recorded_event_t *error = sink.last (ev::error);
    TEST_ASSERT_NOT_NULL (error);
    TEST_ASSERT_EQUAL_INT (JTP_ERR_DUPLICATE_FRAGMENT, error->error_code);
    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::fragment_received));

    uint16_t received = 0;
    TEST_ASSERT_TRUE (decoder.in_flight (1, NULL, &received, NULL));
    TEST_ASSERT_EQUAL_UINT16 (1, received);

    //  The first copy wins.
    TEST_ASSERT_TRUE (feed (decoder, build_packet (1, 7, 1, 3, source, 10,
                                                   0xAA)));
    TEST_ASSERT_TRUE (feed (decoder, build_packet (1, 7, 2, 3, source, 10,
                                                   0xAA)));
    const recorded_event_t *complete = sink.last (ev::message_complete);
    TEST_ASSERT_NOT_NULL (complete);
    TEST_ASSERT_EQUAL_size_t (30, complete->payload.size ());
    for (size_t i = 0; i < complete->payload.size (); i++)
        TEST_ASSERT_EQUAL_HEX8 (0xAA, complete->payload[i]);
}

void test_preemption_by_newer_id ()
{
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, &sink);

    TEST_ASSERT_TRUE (feed (decoder, build_packet (3, 100, 0, 2, source, 5)));
    TEST_ASSERT_TRUE (feed (decoder, build_packet (3, 101, 0, 2, source, 5)));

    const int incomplete = sink.find (ev::message_incomplete);
    const int second_start = sink.find (ev::message_start, 1);
    TEST_ASSERT_TRUE (incomplete >= 0);
    TEST_ASSERT_TRUE (incomplete < second_start);

    const recorded_event_t &event = sink.events[incomplete];
    TEST_ASSERT_EQUAL_UINT8 (3, event.message_type);
    TEST_ASSERT_EQUAL_UINT16 (100, event.message_id);
    TEST_ASSERT_EQUAL_UINT16 (1, event.fragments_received);
    TEST_ASSERT_EQUAL_UINT16 (2, event.fragment_count);
    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::message_incomplete));

    uint16_t id = 0;
    uint16_t count = 0;
    TEST_ASSERT_TRUE (decoder.in_flight (3, &id, NULL, &count));
    TEST_ASSERT_EQUAL_UINT16 (101, id);
    TEST_ASSERT_EQUAL_UINT16 (2, count);

    //  Late fragments of the abandoned message are dropped silently.
    const size_t before = sink.events.size ();
    TEST_ASSERT_FALSE (feed (decoder, build_packet (3, 100, 1, 2, source, 5)));
    TEST_ASSERT_EQUAL_size_t (before, sink.events.size ());
}

void test_id_wraparound ()
{
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, &sink);

    TEST_ASSERT_TRUE (feed (decoder, build_packet (2, 65535, 0, 2, source, 4)));
    TEST_ASSERT_TRUE (feed (decoder, build_packet (2, 0, 0, 1, source, 4)));

    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::message_incomplete));
    TEST_ASSERT_EQUAL_UINT16 (65535,
                              sink.last (ev::message_incomplete)->message_id);
    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::message_complete));
    TEST_ASSERT_EQUAL_UINT16 (0, sink.last (ev::message_complete)->message_id);
}

void test_half_window_id_mismatch ()
{
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, &sink);

    TEST_ASSERT_TRUE (feed (decoder, build_packet (2, 0, 0, 2, source, 4)));
    const size_t before = sink.events.size ();
    TEST_ASSERT_FALSE (
      feed (decoder, build_packet (2, 32768, 0, 2, source, 4)));

    //  Neither newer nor older: reported, and the message in flight stays.
    TEST_ASSERT_EQUAL_size_t (before + 1, sink.events.size ());
    TEST_ASSERT_EQUAL_INT (ev::error, sink.events.back ().kind);
    TEST_ASSERT_EQUAL_INT (JTP_ERR_MESSAGE_ID_MISMATCH,
                           sink.events.back ().error_code);
    TEST_ASSERT_EQUAL_INT (0, sink.count (ev::message_incomplete));

    uint16_t id = 1;
    uint16_t received = 0;
    TEST_ASSERT_TRUE (decoder.in_flight (2, &id, &received));
    TEST_ASSERT_EQUAL_UINT16 (0, id);
    TEST_ASSERT_EQUAL_UINT16 (1, received);
}

void test_type_isolation ()
{
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, &sink);

    TEST_ASSERT_TRUE (feed (decoder, build_packet (1, 10, 0, 2, source, 3, 1)));
    TEST_ASSERT_TRUE (feed (decoder, build_packet (2, 50, 0, 2, source, 3, 2)));
    TEST_ASSERT_TRUE (feed (decoder, build_packet (1, 10, 1, 2, source, 3, 1)));
    TEST_ASSERT_TRUE (feed (decoder, build_packet (2, 50, 1, 2, source, 3, 2)));

    TEST_ASSERT_EQUAL_INT (0, sink.count (ev::message_incomplete));
    TEST_ASSERT_EQUAL_INT (2, sink.count (ev::message_complete));

    const recorded_event_t &first =
      sink.events[sink.find (ev::message_complete, 0)];
    const recorded_event_t &second =
      sink.events[sink.find (ev::message_complete, 1)];
    TEST_ASSERT_EQUAL_UINT8 (1, first.message_type);
    TEST_ASSERT_EQUAL_HEX8 (1, first.payload[0]);
    TEST_ASSERT_EQUAL_UINT8 (2, second.message_type);
    TEST_ASSERT_EQUAL_HEX8 (2, second.payload[0]);
}

void test_type_filter ()
{
    std::set<uint8_t> accepted;
    accepted.insert (1);
    accepted.insert (2);

    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, accepted, &sink);

    TEST_ASSERT_FALSE (feed (decoder, build_packet (5, 0, 0, 1, source, 4)));
    TEST_ASSERT_TRUE (sink.events.empty ());
    TEST_ASSERT_TRUE (feed (decoder, build_packet (1, 0, 0, 1, source, 4)));
    TEST_ASSERT_TRUE (feed (decoder, build_packet (2, 0, 0, 1, source, 4)));
    TEST_ASSERT_EQUAL_INT (2, sink.count (ev::message_complete));
}

void test_empty_filter_accepts_nothing ()
{
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, std::set<uint8_t> (), &sink);
    TEST_ASSERT_FALSE (feed (decoder, build_packet (0, 0, 0, 1, source, 4)));
    TEST_ASSERT_TRUE (sink.events.empty ());
}

void test_foreign_and_other_source_are_silent ()
{
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, &sink);

    std::vector<unsigned char> foreign = build_packet (1, 0, 0, 1, source, 4);
    foreign[0] = 0x00;
    TEST_ASSERT_FALSE (feed (decoder, foreign));

    //  Not even long enough for a header, but not ours either.
    const unsigned char junk[3] = {0x17, 0x03, 0x03};
    TEST_ASSERT_FALSE (decoder.accept (junk, sizeof (junk)));
    TEST_ASSERT_FALSE (decoder.accept (NULL, 0));

    TEST_ASSERT_FALSE (
      feed (decoder, build_packet (1, 0, 0, 1, 0x87654321, 4)));
    TEST_ASSERT_TRUE (sink.events.empty ());
}

void test_packet_too_short ()
{
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, &sink);

    const unsigned char short_packet[5] = {jtp::jtp_magic, 0, 0, 0, 0};
    TEST_ASSERT_FALSE (decoder.accept (short_packet, sizeof (short_packet)));
    TEST_ASSERT_EQUAL_size_t (1, sink.events.size ());
    TEST_ASSERT_EQUAL_INT (JTP_ERR_PACKET_TOO_SHORT,
                           sink.events[0].error_code);
    TEST_ASSERT_FALSE (sink.events[0].reason.empty ());
}

void test_unsupported_version ()
{
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, &sink);

    std::vector<unsigned char> packet = build_packet (1, 0, 0, 1, source, 4);
    packet[1] = static_cast<unsigned char> ((1 << jtp::jtp_version_shift) | 1);
    TEST_ASSERT_FALSE (feed (decoder, packet));
    TEST_ASSERT_EQUAL_size_t (1, sink.events.size ());
    TEST_ASSERT_EQUAL_INT (JTP_ERR_UNSUPPORTED_VERSION,
                           sink.events[0].error_code);
}

void test_invalid_fragment ()
{
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, &sink);

    //  Zero fragment count.
    TEST_ASSERT_FALSE (feed (decoder, build_packet (1, 0, 0, 0, source, 4)));
    TEST_ASSERT_EQUAL_size_t (1, sink.events.size ());
    TEST_ASSERT_EQUAL_INT (JTP_ERR_INVALID_FRAGMENT,
                           sink.events[0].error_code);
    TEST_ASSERT_EQUAL_size_t (0, decoder.in_flight_count ());

    //  Index past the count.
    TEST_ASSERT_FALSE (feed (decoder, build_packet (1, 0, 3, 3, source, 4)));
    TEST_ASSERT_EQUAL_INT (JTP_ERR_INVALID_FRAGMENT,
                           sink.last (ev::error)->error_code);

    //  Payload larger than one fragment may carry.
    TEST_ASSERT_FALSE (feed (decoder,
                             build_packet (1, 0, 0, 2, source,
                                           decoder.options ().max_payload_size
                                             + 1)));
    TEST_ASSERT_EQUAL_INT (3, sink.count (ev::error));
    TEST_ASSERT_EQUAL_INT (0, sink.count (ev::message_start));
    TEST_ASSERT_EQUAL_size_t (0, decoder.in_flight_count ());
}

void test_zero_packet_with_magic ()
{
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (0, &sink);

    unsigned char packet[jtp::jtp_header_size];
    memset (packet, 0, sizeof (packet));
    packet[0] = jtp::jtp_magic;
    TEST_ASSERT_FALSE (decoder.accept (packet, sizeof (packet)));
    TEST_ASSERT_EQUAL_size_t (1, sink.events.size ());
    TEST_ASSERT_EQUAL_INT (JTP_ERR_INVALID_FRAGMENT,
                           sink.events[0].error_code);
    TEST_ASSERT_FALSE (decoder.in_flight (0));
}

void test_message_size_limit ()
{
    jtp::options_t options;
    options.source_id = source;
    options.max_payload_size = 100;
    options.max_message_size = 1000;

    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (options, &sink);

    //  12 fragments mean at least 1101 bytes.
    TEST_ASSERT_FALSE (feed (decoder, build_packet (1, 0, 0, 12, source, 1)));
    TEST_ASSERT_EQUAL_INT (JTP_ERR_INVALID_FRAGMENT,
                           sink.last (ev::error)->error_code);
    TEST_ASSERT_EQUAL_size_t (0, decoder.in_flight_count ());

    TEST_ASSERT_TRUE (feed (decoder, build_packet (1, 0, 0, 11, source, 1)));
}

void test_fragment_count_mismatch ()
{
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, &sink);

    TEST_ASSERT_TRUE (feed (decoder, build_packet (4, 9, 0, 3, source, 2)));
    //  Same message id, but a sender that disagrees about the count.
    TEST_ASSERT_TRUE (feed (decoder, build_packet (4, 9, 1, 5, source, 2)));
    TEST_ASSERT_TRUE (feed (decoder, build_packet (4, 9, 2, 5, source, 2)));
    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::message_complete));
    TEST_ASSERT_EQUAL_UINT16 (3,
                              sink.last (ev::message_complete)->fragment_count);

    //  Two fragments complete a two-fragment message, but index 1 never
    //  arrived.
    TEST_ASSERT_TRUE (feed (decoder, build_packet (4, 10, 0, 2, source, 2)));
    TEST_ASSERT_TRUE (feed (decoder, build_packet (4, 10, 3, 5, source, 2)));
    TEST_ASSERT_EQUAL_INT (JTP_ERR_REASSEMBLY_FAILED,
                           sink.last (ev::error)->error_code);
    TEST_ASSERT_EQUAL_size_t (0, decoder.in_flight_count ());
}

void test_reset ()
{
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, &sink);

    TEST_ASSERT_TRUE (feed (decoder, build_packet (1, 0, 0, 2, source, 4)));
    TEST_ASSERT_TRUE (feed (decoder, build_packet (2, 0, 0, 2, source, 4)));
    TEST_ASSERT_EQUAL_size_t (2, decoder.in_flight_count ());

    const size_t before = sink.events.size ();
    decoder.reset (1);
    TEST_ASSERT_FALSE (decoder.in_flight (1));
    TEST_ASSERT_TRUE (decoder.in_flight (2));
    decoder.reset ();
    TEST_ASSERT_EQUAL_size_t (0, decoder.in_flight_count ());
    TEST_ASSERT_EQUAL_size_t (before, sink.events.size ());

    //  After a reset any id starts a message again.
    TEST_ASSERT_TRUE (feed (decoder, build_packet (1, 0, 1, 2, source, 4)));
    TEST_ASSERT_EQUAL_INT (3, sink.count (ev::message_start));
}

//  Sink that feeds a follow-up datagram from inside message_complete.
class reentrant_sink_t : public recording_decoder_sink_t
{
  public:
    reentrant_sink_t () : decoder (NULL) {}

    void message_complete (uint8_t message_type_,
                           std::vector<unsigned char> &payload_,
                           const jtp::message_meta_t &meta_)
    {
        recording_decoder_sink_t::message_complete (message_type_, payload_,
                                                    meta_);
        if (meta_.message_id == 0) {
            const std::vector<unsigned char> next =
              build_packet (message_type_, 1, 0, 1, source, 2);
            decoder->accept (&next[0], next.size ());
        }
    }

    jtp::decoder_t *decoder;
};

void test_reentrant_message_complete ()
{
    reentrant_sink_t sink;
    jtp::decoder_t decoder (source, &sink);
    sink.decoder = &decoder;

    TEST_ASSERT_TRUE (feed (decoder, build_packet (6, 0, 0, 1, source, 2)));
    TEST_ASSERT_EQUAL_INT (2, sink.count (ev::message_complete));
    TEST_ASSERT_EQUAL_INT (0, sink.count (ev::message_incomplete));
    TEST_ASSERT_EQUAL_size_t (0, decoder.in_flight_count ());
}

int main ()
{
    UNITY_BEGIN ();
    RUN_TEST (test_single_fragment_message);
    RUN_TEST (test_out_of_order_reassembly);
    RUN_TEST (test_round_trip_sizes_shuffled);
    RUN_TEST (test_duplicate_fragment);
    RUN_TEST (test_preemption_by_newer_id);
    RUN_TEST (test_id_wraparound);
    RUN_TEST (test_half_window_id_mismatch);
    RUN_TEST (test_type_isolation);
    RUN_TEST (test_type_filter);
    RUN_TEST (test_empty_filter_accepts_nothing);
    RUN_TEST (test_foreign_and_other_source_are_silent);
    RUN_TEST (test_packet_too_short);
    RUN_TEST (test_unsupported_version);
    RUN_TEST (test_invalid_fragment);
    RUN_TEST (test_zero_packet_with_magic);
    RUN_TEST (test_message_size_limit);
    RUN_TEST (test_fragment_count_mismatch);
    RUN_TEST (test_reset);
    RUN_TEST (test_reentrant_message_complete);
    return UNITY_END ();
}
