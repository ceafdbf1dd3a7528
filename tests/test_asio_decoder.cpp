/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

#include "engine/asio/asio_decoder.hpp"
#include "protocol/jtp_decoder.hpp"
#include "protocol/jtp_encoder.hpp"

#include <boost/asio.hpp>
#include <unity.h>

typedef recorded_event_t ev;

static const uint32_t source = 0x0A0B0C0D;

void setUp ()
{
}

void tearDown ()
{
}

static jtp::options_t make_options (size_t max_payload_)
{
    jtp::options_t options;
    options.source_id = source;
    options.max_payload_size = max_payload_;
    return options;
}

void test_small_message_completes_inline ()
{
    boost::asio::io_context io_context;
    recording_decoder_sink_t sink;
    jtp::asio_decoder_t asio_decoder (io_context, make_options (100), &sink);

    const std::vector<unsigned char> packet =
      build_packet (1, 0, 0, 1, source, 20);
    TEST_ASSERT_TRUE (asio_decoder.decoder ().accept (&packet[0],
                                                      packet.size ()));
    //  Nothing was posted.
    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::message_complete));
    TEST_ASSERT_EQUAL_size_t (0, io_context.poll ());
}

void test_large_message_is_deferred ()
{
    boost::asio::io_context io_context;
    recording_decoder_sink_t sink;
    jtp::asio_decoder_t asio_decoder (io_context, make_options (10), &sink);

    jtp::encoder_t encoder (make_options (10));
    const std::vector<unsigned char> payload = make_payload (1010);
    std::vector<std::vector<unsigned char> > fragments;
    TEST_ASSERT_EQUAL_INT (101, encoder.fragment_all (&payload[0],
                                                      payload.size (), 7,
                                                      fragments));

    for (size_t i = 0; i < fragments.size (); i++)
        TEST_ASSERT_TRUE (asio_decoder.decoder ().accept (
          &fragments[i][0], fragments[i].size ()));

    //  Every fragment is acknowledged, the delivery waits for the loop.
    TEST_ASSERT_EQUAL_INT (101, sink.count (ev::fragment_received));
    TEST_ASSERT_EQUAL_INT (0, sink.count (ev::message_complete));
    TEST_ASSERT_TRUE (asio_decoder.decoder ().in_flight (7));

    io_context.run ();
    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::message_complete));
    TEST_ASSERT_TRUE (sink.last (ev::message_complete)->payload == payload);
    TEST_ASSERT_FALSE (asio_decoder.decoder ().in_flight (7));
}

void test_deferred_by_byte_threshold ()
{
    boost::asio::io_context io_context;
    recording_decoder_sink_t sink;
    jtp::options_t options = make_options (1000);
    options.defer_bytes = 1500;
    jtp::asio_decoder_t asio_decoder (io_context, options, &sink);

    jtp::encoder_t encoder (make_options (1000));
    const std::vector<unsigned char> payload = make_payload (2000);
    std::vector<std::vector<unsigned char> > fragments;
    TEST_ASSERT_EQUAL_INT (2, encoder.fragment_all (&payload[0],
                                                    payload.size (), 3,
                                                    fragments));
    for (size_t i = 0; i < fragments.size (); i++)
        asio_decoder.decoder ().accept (&fragments[i][0],
                                        fragments[i].size ());

    TEST_ASSERT_EQUAL_INT (0, sink.count (ev::message_complete));
    io_context.run ();
    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::message_complete));
}

void test_deferred_message_delivered_before_newer ()
{
    boost::asio::io_context io_context;
    recording_decoder_sink_t sink;
    jtp::options_t options = make_options (100);
    options.defer_fragments = 1;
    jtp::asio_decoder_t asio_decoder (io_context, options, &sink);
    jtp::decoder_t &decoder = asio_decoder.decoder ();

    const std::vector<unsigned char> a = build_packet (2, 40, 0, 2, source, 5);
    const std::vector<unsigned char> b = build_packet (2, 40, 1, 2, source, 5);
    const std::vector<unsigned char> c = build_packet (2, 41, 0, 1, source, 5);
    TEST_ASSERT_TRUE (decoder.accept (&a[0], a.size ()));
    TEST_ASSERT_TRUE (decoder.accept (&b[0], b.size ()));
    TEST_ASSERT_EQUAL_INT (0, sink.count (ev::message_complete));

    //  A newer message arrives before the loop gets to the reassembly; the
    //  fully received message is delivered first, not abandoned.
    TEST_ASSERT_TRUE (decoder.accept (&c[0], c.size ()));
    TEST_ASSERT_EQUAL_INT (0, sink.count (ev::message_incomplete));
    TEST_ASSERT_EQUAL_INT (2, sink.count (ev::message_complete));

    const recorded_event_t &first =
      sink.events[sink.find (ev::message_complete, 0)];
    const recorded_event_t &second =
      sink.events[sink.find (ev::message_complete, 1)];
    TEST_ASSERT_EQUAL_UINT16 (40, first.message_id);
    TEST_ASSERT_EQUAL_size_t (10, first.payload.size ());
    TEST_ASSERT_EQUAL_UINT16 (41, second.message_id);

    //  The posted reassembly has nothing left to do.
    io_context.run ();
    TEST_ASSERT_EQUAL_INT (2, sink.count (ev::message_complete));
}

void test_batch_matches_sequential_accept ()
{
    jtp::encoder_t encoder (make_options (10));
    const std::vector<unsigned char> large = make_payload (1010);
    const std::vector<unsigned char> small = make_payload (5, 7);
    jtp::asio_decoder_t::packets_t packets;
    TEST_ASSERT_EQUAL_INT (101, encoder.fragment_all (&large[0],
                                                      large.size (), 4,
                                                      packets));
    std::vector<std::vector<unsigned char> > tail;
    TEST_ASSERT_EQUAL_INT (
      1, encoder.fragment_all (&small[0], small.size (), 4, tail));
    packets.push_back (tail[0]);

    recording_decoder_sink_t plain_sink;
    jtp::decoder_t plain (make_options (10), &plain_sink);
    for (size_t i = 0; i < packets.size (); i++)
        plain.accept (&packets[i][0], packets[i].size ());

    boost::asio::io_context io_context;
    recording_decoder_sink_t sink;
    jtp::asio_decoder_t asio_decoder (io_context, make_options (10), &sink);
    asio_decoder.async_accept_batch (packets, 16,
                                    jtp::asio_decoder_t::batch_handler_t ());
    io_context.run ();

    TEST_ASSERT_EQUAL_INT (2, plain_sink.count (ev::message_complete));
    TEST_ASSERT_EQUAL_INT (2, sink.count (ev::message_complete));
    TEST_ASSERT_EQUAL_INT (0, sink.count (ev::message_incomplete));
    TEST_ASSERT_TRUE (sink.events[sink.find (ev::message_complete, 0)].payload
                      == large);
    TEST_ASSERT_TRUE (sink.events[sink.find (ev::message_complete, 1)].payload
                      == small);
}

void test_fragment_count_exceeded_while_deferred ()
{
    boost::asio::io_context io_context;
    recording_decoder_sink_t sink;
    jtp::options_t options = make_options (100);
    options.defer_fragments = 1;
    jtp::asio_decoder_t asio_decoder (io_context, options, &sink);
    jtp::decoder_t &decoder = asio_decoder.decoder ();

    const std::vector<unsigned char> a = build_packet (3, 8, 0, 2, source, 4);
    const std::vector<unsigned char> b = build_packet (3, 8, 1, 2, source, 4);
    TEST_ASSERT_TRUE (decoder.accept (&a[0], a.size ()));
    TEST_ASSERT_TRUE (decoder.accept (&b[0], b.size ()));

    //  Same message id, claiming a larger count, while the reassembly of
    //  the complete message is still pending.
    const std::vector<unsigned char> c = build_packet (3, 8, 3, 5, source, 4);
    TEST_ASSERT_FALSE (decoder.accept (&c[0], c.size ()));

    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::error));
    TEST_ASSERT_EQUAL_INT (JTP_ERR_FRAGMENT_COUNT_EXCEEDED,
                           sink.last (ev::error)->error_code);
    TEST_ASSERT_FALSE (decoder.in_flight (3));
    TEST_ASSERT_EQUAL_size_t (0, decoder.in_flight_count ());

    io_context.run ();
    TEST_ASSERT_EQUAL_INT (0, sink.count (ev::message_complete));
}

void test_async_accept_batch ()
{
    boost::asio::io_context io_context;
    recording_decoder_sink_t sink;
    jtp::asio_decoder_t asio_decoder (io_context, make_options (10), &sink);

    jtp::asio_decoder_t::packets_t packets;
    jtp::encoder_t encoder (make_options (10));
    const std::vector<unsigned char> payload = make_payload (95);
    TEST_ASSERT_EQUAL_INT (10, encoder.fragment_all (&payload[0],
                                                     payload.size (), 1,
                                                     packets));
    //  A duplicate and a datagram from another source in the middle.
    const std::vector<unsigned char> duplicate = packets[4];
    packets.insert (packets.begin () + 5, duplicate);
    packets.insert (packets.begin () + 7, build_packet (1, 0, 3, 10, 0x99, 1));

    size_t processed = 0;
    bool done = false;
    asio_decoder.async_accept_batch (packets, 3, [&] (size_t processed_) {
        processed = processed_;
        done = true;
    });

    //  One turn handles one group.
    TEST_ASSERT_EQUAL_size_t (1, io_context.run_one ());
    TEST_ASSERT_EQUAL_INT (3, sink.count (ev::fragment_received));
    TEST_ASSERT_FALSE (done);

    io_context.run ();
    TEST_ASSERT_TRUE (done);
    TEST_ASSERT_EQUAL_size_t (10, processed);
    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::message_complete));
    TEST_ASSERT_EQUAL_INT (JTP_ERR_DUPLICATE_FRAGMENT,
                           sink.last (ev::error)->error_code);
    TEST_ASSERT_TRUE (sink.last (ev::message_complete)->payload == payload);
}

void test_without_scheduler_reassembles_inline ()
{
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (make_options (10), &sink);
    const std::vector<unsigned char> payload = make_payload (2000);

    jtp::encoder_t encoder (make_options (10));
    std::vector<std::vector<unsigned char> > fragments;
    TEST_ASSERT_EQUAL_INT (200, encoder.fragment_all (&payload[0],
                                                      payload.size (), 0,
                                                      fragments));
    for (size_t i = 0; i < fragments.size (); i++)
        decoder.accept (&fragments[i][0], fragments[i].size ());
    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::message_complete));
}

int main ()
{
    UNITY_BEGIN ();
    RUN_TEST (test_small_message_completes_inline);
    RUN_TEST (test_large_message_is_deferred);
    RUN_TEST (test_deferred_by_byte_threshold);
    RUN_TEST (test_deferred_message_delivered_before_newer);
    RUN_TEST (test_batch_matches_sequential_accept);
    RUN_TEST (test_fragment_count_exceeded_while_deferred);
    RUN_TEST (test_async_accept_batch);
    RUN_TEST (test_without_scheduler_reassembles_inline);
    return UNITY_END ();
}
