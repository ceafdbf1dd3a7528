/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/header.hpp"
#include "protocol/jtp_encoder.hpp"
#include "protocol/jtp_protocol.hpp"

#include <unity.h>
#include <stdlib.h>
#include <string.h>
#include <vector>

void setUp ()
{
    //  Tests rely on the built-in payload size.
    unsetenv ("JTP_MAX_PAYLOAD");
}

void tearDown ()
{
}

static jtp::options_t make_options (uint32_t source_id_, size_t max_payload_)
{
    jtp::options_t options;
    options.source_id = source_id_;
    options.max_payload_size = max_payload_;
    return options;
}

void test_hello_world_single_fragment ()
{
    jtp::encoder_t encoder (0x12345678);
    const char *text = "Hello, World!";
    std::vector<std::vector<unsigned char> > fragments;
    const int rc = encoder.fragment_all (
      reinterpret_cast<const unsigned char *> (text), strlen (text), 5,
      fragments);
    TEST_ASSERT_EQUAL_INT (1, rc);
    TEST_ASSERT_EQUAL_size_t (1, fragments.size ());
    TEST_ASSERT_EQUAL_size_t (jtp::jtp_header_size + 13,
                              fragments[0].size ());
    TEST_ASSERT_EQUAL_HEX8 (0x05, fragments[0][1]);

    jtp::header_t header;
    TEST_ASSERT_SUCCESS_ERRNO (
      jtp::decode_header (&fragments[0][0], fragments[0].size (), header));
    TEST_ASSERT_EQUAL_UINT8 (jtp::jtp_magic, header.magic);
    TEST_ASSERT_EQUAL_UINT8 (0, header.version);
    TEST_ASSERT_EQUAL_UINT8 (5, header.message_type);
    TEST_ASSERT_EQUAL_UINT16 (0, header.message_id);
    TEST_ASSERT_EQUAL_UINT16 (0, header.fragment_index);
    TEST_ASSERT_EQUAL_UINT16 (1, header.fragment_count);
    TEST_ASSERT_EQUAL_HEX32 (0x12345678, header.source_id);
    TEST_ASSERT_EQUAL_MEMORY (text, &fragments[0][jtp::jtp_header_size], 13);
}

void test_split_sizes ()
{
    jtp::encoder_t encoder (make_options (1, 1200));
    const std::vector<unsigned char> payload = make_payload (2500);
    std::vector<std::vector<unsigned char> > fragments;
    TEST_ASSERT_EQUAL_INT (3, encoder.fragment_all (&payload[0],
                                                    payload.size (), 1,
                                                    fragments));
    TEST_ASSERT_EQUAL_size_t (3, fragments.size ());
    TEST_ASSERT_EQUAL_size_t (12 + 1200, fragments[0].size ());
    TEST_ASSERT_EQUAL_size_t (12 + 1200, fragments[1].size ());
    TEST_ASSERT_EQUAL_size_t (12 + 100, fragments[2].size ());

    size_t offset = 0;
    for (size_t i = 0; i < fragments.size (); i++) {
        jtp::header_t header;
        TEST_ASSERT_SUCCESS_ERRNO (jtp::decode_header (
          &fragments[i][0], fragments[i].size (), header));
        TEST_ASSERT_EQUAL_UINT16 (i, header.fragment_index);
        TEST_ASSERT_EQUAL_UINT16 (3, header.fragment_count);
        const size_t length = fragments[i].size () - jtp::jtp_header_size;
        TEST_ASSERT_EQUAL_MEMORY (&payload[offset],
                                  &fragments[i][jtp::jtp_header_size],
                                  length);
        offset += length;
    }
    TEST_ASSERT_EQUAL_size_t (payload.size (), offset);
}

void test_exact_multiple_has_no_empty_tail ()
{
    jtp::encoder_t encoder (make_options (1, 100));
    const std::vector<unsigned char> payload = make_payload (300);
    std::vector<std::vector<unsigned char> > fragments;
    TEST_ASSERT_EQUAL_INT (
      3, encoder.fragment_all (&payload[0], payload.size (), 0, fragments));
    TEST_ASSERT_EQUAL_size_t (112, fragments[2].size ());
}

void test_empty_payload ()
{
    jtp::encoder_t encoder (7);
    std::vector<std::vector<unsigned char> > fragments;
    TEST_ASSERT_EQUAL_INT (1, encoder.fragment_all (NULL, 0, 3, fragments));
    TEST_ASSERT_EQUAL_size_t (1, fragments.size ());
    TEST_ASSERT_EQUAL_size_t (jtp::jtp_header_size, fragments[0].size ());

    jtp::header_t header;
    TEST_ASSERT_SUCCESS_ERRNO (
      jtp::decode_header (&fragments[0][0], fragments[0].size (), header));
    TEST_ASSERT_EQUAL_UINT16 (0, header.fragment_index);
    TEST_ASSERT_EQUAL_UINT16 (1, header.fragment_count);
}

void test_message_id_increments_and_wraps ()
{
    jtp::encoder_t encoder (1);
    const unsigned char byte = 0x42;
    std::vector<std::vector<unsigned char> > fragments;

    for (unsigned i = 0; i < 65536; i++) {
        TEST_ASSERT_EQUAL_UINT16 (static_cast<uint16_t> (i),
                                  encoder.message_id ());
        jtp::fragment_stream_t stream;
        TEST_ASSERT_EQUAL_INT (1, encoder.fragment (&byte, 1, 0, stream));
    }
    TEST_ASSERT_EQUAL_UINT16 (0, encoder.message_id ());

    TEST_ASSERT_EQUAL_INT (1, encoder.fragment_all (&byte, 1, 0, fragments));
    jtp::header_t header;
    TEST_ASSERT_SUCCESS_ERRNO (
      jtp::decode_header (&fragments[0][0], fragments[0].size (), header));
    TEST_ASSERT_EQUAL_UINT16 (0, header.message_id);
}

void test_invalid_message_type ()
{
    jtp::encoder_t encoder (1);
    const unsigned char byte = 0;
    jtp::fragment_stream_t stream;
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, encoder.fragment (&byte, 1, 64, stream));
    TEST_ASSERT_EQUAL_INT (JTP_ERR_INVALID_MESSAGE_TYPE, encoder.last_error ());
    TEST_ASSERT_FAILURE_ERRNO (EINVAL, encoder.fragment (&byte, 1, -1, stream));

    //  A failed call does not consume an id.
    TEST_ASSERT_EQUAL_UINT16 (0, encoder.message_id ());
    TEST_ASSERT_EQUAL_INT (1, encoder.fragment (&byte, 1, 63, stream));
    TEST_ASSERT_EQUAL_INT (0, encoder.last_error ());
    TEST_ASSERT_EQUAL_UINT16 (1, encoder.message_id ());
}

void test_null_payload ()
{
    jtp::encoder_t encoder (1);
    jtp::fragment_stream_t stream;
    TEST_ASSERT_FAILURE_ERRNO (EFAULT, encoder.fragment (NULL, 10, 1, stream));
    TEST_ASSERT_EQUAL_INT (JTP_ERR_INVALID_INPUT_TYPE, encoder.last_error ());
    TEST_ASSERT_EQUAL_UINT16 (0, encoder.message_id ());
}

void test_message_too_large ()
{
    jtp::encoder_t encoder (make_options (1, 1));
    std::vector<unsigned char> payload (65536, 0x11);
    recording_encoder_sink_t sink;
    encoder.set_sink (&sink);

    jtp::fragment_stream_t stream;
    TEST_ASSERT_FAILURE_ERRNO (
      EMSGSIZE, encoder.fragment (&payload[0], payload.size (), 1, stream));
    TEST_ASSERT_EQUAL_INT (JTP_ERR_MESSAGE_TOO_LARGE, encoder.last_error ());
    TEST_ASSERT_EQUAL_UINT16 (0, encoder.message_id ());
    TEST_ASSERT_TRUE (sink.infos.empty ());
    TEST_ASSERT_TRUE (stream.done ());

    //  The largest message that fits still goes through.
    TEST_ASSERT_EQUAL_INT (
      65535, encoder.fragment (&payload[0], payload.size () - 1, 1, stream));
}

void test_stream_is_lazy ()
{
    recording_encoder_sink_t sink;
    jtp::encoder_t encoder (make_options (1, 10), &sink);
    const std::vector<unsigned char> payload = make_payload (25);

    jtp::fragment_stream_t stream;
    TEST_ASSERT_EQUAL_INT (3, encoder.fragment (&payload[0], payload.size (),
                                                2, stream));
    //  The id is taken at once, fragments only when pulled.
    TEST_ASSERT_EQUAL_UINT16 (1, encoder.message_id ());
    TEST_ASSERT_TRUE (sink.infos.empty ());
    TEST_ASSERT_EQUAL_size_t (22, stream.next_size ());

    unsigned char *data = NULL;
    TEST_ASSERT_EQUAL_size_t (22, stream.encode (&data, 0));
    TEST_ASSERT_EQUAL_size_t (1, sink.infos.size ());
    TEST_ASSERT_TRUE (sink.summaries.empty ());
    TEST_ASSERT_FALSE (stream.done ());

    data = NULL;
    TEST_ASSERT_EQUAL_size_t (22, stream.encode (&data, 0));
    data = NULL;
    TEST_ASSERT_EQUAL_size_t (17, stream.encode (&data, 0));
    TEST_ASSERT_TRUE (stream.done ());
    TEST_ASSERT_EQUAL_size_t (0, stream.next_size ());

    data = NULL;
    TEST_ASSERT_EQUAL_size_t (0, stream.encode (&data, 0));
}

void test_stream_into_caller_buffer ()
{
    jtp::encoder_t encoder (make_options (1, 10));
    const std::vector<unsigned char> payload = make_payload (15);
    jtp::fragment_stream_t stream;
    TEST_ASSERT_EQUAL_INT (2, encoder.fragment (&payload[0], payload.size (),
                                                2, stream));

    unsigned char small[10];
    unsigned char *data = small;
    errno = 0;
    TEST_ASSERT_EQUAL_size_t (0, stream.encode (&data, sizeof (small)));
    TEST_ASSERT_EQUAL_INT (ENOBUFS, errno);
    TEST_ASSERT_EQUAL_size_t (22, stream.next_size ());

    unsigned char big[64];
    data = big;
    TEST_ASSERT_EQUAL_size_t (22, stream.encode (&data, sizeof (big)));
    TEST_ASSERT_EQUAL_PTR (big, data);
    TEST_ASSERT_EQUAL_MEMORY (&payload[0], big + jtp::jtp_header_size, 10);
}

void test_sink_events ()
{
    recording_encoder_sink_t sink;
    jtp::encoder_t encoder (make_options (9, 4), &sink);
    const std::vector<unsigned char> payload = make_payload (10);
    std::vector<std::vector<unsigned char> > fragments;
    TEST_ASSERT_EQUAL_INT (
      3, encoder.fragment_all (&payload[0], payload.size (), 4, fragments));

    TEST_ASSERT_EQUAL_size_t (3, sink.infos.size ());
    for (size_t i = 0; i < sink.infos.size (); i++) {
        TEST_ASSERT_EQUAL_UINT16 (i, sink.infos[i].fragment_index);
        TEST_ASSERT_EQUAL_UINT16 (3, sink.infos[i].fragment_count);
        TEST_ASSERT_EQUAL_UINT8 (4, sink.infos[i].message_type);
        TEST_ASSERT_TRUE (sink.fragments[i] == fragments[i]);
    }
    TEST_ASSERT_EQUAL_size_t (1, sink.summaries.size ());
    TEST_ASSERT_EQUAL_UINT16 (0, sink.summaries[0].message_id);
    TEST_ASSERT_EQUAL_UINT8 (4, sink.summaries[0].message_type);
    TEST_ASSERT_EQUAL_UINT16 (3, sink.summaries[0].fragment_count);
    TEST_ASSERT_EQUAL_size_t (10, sink.summaries[0].total_bytes);
}

void test_source_id_is_fixed ()
{
    jtp::encoder_t encoder (0xAABBCCDD);
    const uint32_t other = 1;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, encoder.setopt (JTP_SOURCE_ID, &other, sizeof (other)));

    uint32_t value = 0;
    size_t size = sizeof (value);
    TEST_ASSERT_SUCCESS_ERRNO (encoder.getopt (JTP_SOURCE_ID, &value, &size));
    TEST_ASSERT_EQUAL_HEX32 (0xAABBCCDD, value);
}

int main ()
{
    UNITY_BEGIN ();
    RUN_TEST (test_hello_world_single_fragment);
    RUN_TEST (test_split_sizes);
    RUN_TEST (test_exact_multiple_has_no_empty_tail);
    RUN_TEST (test_empty_payload);
    RUN_TEST (test_message_id_increments_and_wraps);
    RUN_TEST (test_invalid_message_type);
    RUN_TEST (test_null_payload);
    RUN_TEST (test_message_too_large);
    RUN_TEST (test_stream_is_lazy);
    RUN_TEST (test_stream_into_caller_buffer);
    RUN_TEST (test_sink_events);
    RUN_TEST (test_source_id_is_fixed);
    return UNITY_END ();
}
