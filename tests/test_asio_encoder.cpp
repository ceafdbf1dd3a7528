/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

#include "engine/asio/asio_encoder.hpp"
#include "protocol/jtp_decoder.hpp"

#include <boost/asio.hpp>
#include <unity.h>

typedef recorded_event_t ev;

static const uint32_t source = 0x00C0FFEE;

void setUp ()
{
}

void tearDown ()
{
}

static jtp::options_t make_options (size_t max_payload_, int yield_interval_)
{
    jtp::options_t options;
    options.source_id = source;
    options.max_payload_size = max_payload_;
    options.yield_interval = yield_interval_;
    return options;
}

struct collected_t
{
    std::vector<std::vector<unsigned char> > packets;
    bool completed;
    jtp::encode_summary_t summary;
};

static void collect (jtp::asio_encoder_t &encoder_,
                     const std::vector<unsigned char> &payload_,
                     int message_type_,
                     collected_t &out_)
{
    out_.completed = false;
    const int rc = encoder_.async_fragment (
      payload_.empty () ? NULL : &payload_[0], payload_.size (),
      message_type_,
      [&out_] (const unsigned char *data_, size_t size_) {
          out_.packets.push_back (
            std::vector<unsigned char> (data_, data_ + size_));
      },
      [&out_] (const jtp::encode_summary_t &summary_) {
          out_.completed = true;
          out_.summary = summary_;
      });
    TEST_ASSERT_SUCCESS_ERRNO (rc);
}

void test_fragments_in_groups ()
{
    boost::asio::io_context io_context;
    jtp::asio_encoder_t encoder (io_context, make_options (10, 4));
    const std::vector<unsigned char> payload = make_payload (95);

    collected_t out;
    collect (encoder, payload, 3, out);
    //  Nothing leaves before the loop runs.
    TEST_ASSERT_TRUE (out.packets.empty ());

    TEST_ASSERT_EQUAL_size_t (1, io_context.run_one ());
    TEST_ASSERT_EQUAL_size_t (4, out.packets.size ());
    TEST_ASSERT_FALSE (out.completed);

    io_context.run ();
    TEST_ASSERT_EQUAL_size_t (10, out.packets.size ());
    TEST_ASSERT_TRUE (out.completed);
    TEST_ASSERT_EQUAL_UINT16 (10, out.summary.fragment_count);
    TEST_ASSERT_EQUAL_UINT8 (3, out.summary.message_type);
    TEST_ASSERT_EQUAL_size_t (95, out.summary.total_bytes);
}

void test_payload_is_copied ()
{
    boost::asio::io_context io_context;
    jtp::asio_encoder_t encoder (io_context, make_options (10, 10));
    std::vector<unsigned char> payload = make_payload (30);
    const std::vector<unsigned char> original = payload;

    collected_t out;
    collect (encoder, payload, 1, out);
    //  The caller may reuse its buffer at once.
    payload.assign (payload.size (), 0xFF);
    io_context.run ();

    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (make_options (10, 10), &sink);
    for (size_t i = 0; i < out.packets.size (); i++)
        TEST_ASSERT_TRUE (
          decoder.accept (&out.packets[i][0], out.packets[i].size ()));
    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::message_complete));
    TEST_ASSERT_TRUE (sink.last (ev::message_complete)->payload == original);
}

void test_large_message_yields_per_fragment ()
{
    boost::asio::io_context io_context;
    jtp::asio_encoder_t encoder (io_context, make_options (1, 50));
    const std::vector<unsigned char> payload = make_payload (150);

    collected_t out;
    collect (encoder, payload, 1, out);
    TEST_ASSERT_EQUAL_size_t (1, io_context.run_one ());
    TEST_ASSERT_EQUAL_size_t (1, out.packets.size ());

    io_context.run ();
    TEST_ASSERT_EQUAL_size_t (150, out.packets.size ());
    TEST_ASSERT_TRUE (out.completed);
}

void test_id_taken_synchronously ()
{
    boost::asio::io_context io_context;
    jtp::asio_encoder_t encoder (io_context, make_options (10, 10));
    const std::vector<unsigned char> payload = make_payload (5);

    collected_t first;
    collected_t second;
    collect (encoder, payload, 1, first);
    collect (encoder, payload, 1, second);
    TEST_ASSERT_EQUAL_UINT16 (2, encoder.encoder ().message_id ());

    io_context.run ();
    TEST_ASSERT_EQUAL_UINT16 (0, first.summary.message_id);
    TEST_ASSERT_EQUAL_UINT16 (1, second.summary.message_id);
}

void test_errors_are_synchronous ()
{
    boost::asio::io_context io_context;
    recording_encoder_sink_t sink;
    jtp::asio_encoder_t encoder (io_context, make_options (10, 10), &sink);

    bool called = false;
    const unsigned char byte = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL,
      encoder.async_fragment (
        &byte, 1, 64,
        [&called] (const unsigned char *, size_t) { called = true; },
        [&called] (const jtp::encode_summary_t &) { called = true; }));
    TEST_ASSERT_EQUAL_INT (JTP_ERR_INVALID_MESSAGE_TYPE,
                           encoder.encoder ().last_error ());

    TEST_ASSERT_EQUAL_size_t (0, io_context.run ());
    TEST_ASSERT_FALSE (called);
    TEST_ASSERT_TRUE (sink.infos.empty ());
}

void test_sink_sees_fragments ()
{
    boost::asio::io_context io_context;
    recording_encoder_sink_t sink;
    jtp::asio_encoder_t encoder (io_context, make_options (10, 2), &sink);
    const std::vector<unsigned char> payload = make_payload (45);

    collected_t out;
    collect (encoder, payload, 8, out);
    io_context.run ();

    TEST_ASSERT_EQUAL_size_t (5, sink.infos.size ());
    TEST_ASSERT_EQUAL_size_t (1, sink.summaries.size ());
    for (size_t i = 0; i < sink.fragments.size (); i++)
        TEST_ASSERT_TRUE (sink.fragments[i] == out.packets[i]);
}

int main ()
{
    UNITY_BEGIN ();
    RUN_TEST (test_fragments_in_groups);
    RUN_TEST (test_payload_is_copied);
    RUN_TEST (test_large_message_yields_per_fragment);
    RUN_TEST (test_id_taken_synchronously);
    RUN_TEST (test_errors_are_synchronous);
    RUN_TEST (test_sink_sees_fragments);
    return UNITY_END ();
}
