/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

#include "protocol/jtp_decoder.hpp"
#include "protocol/jtp_encoder.hpp"

#include <boost/asio.hpp>
#include <unity.h>
#include <stdlib.h>
#include <string.h>

typedef recorded_event_t ev;

static const uint32_t source = 0x12345678;

boost::asio::io_context *io_context;
boost::asio::ip::udp::socket *receiver;
boost::asio::ip::udp::socket *sender;

void setUp ()
{
    //  Tests rely on the built-in payload size.
    unsetenv ("JTP_MAX_PAYLOAD");
    io_context = new boost::asio::io_context;
    receiver = new boost::asio::ip::udp::socket (*io_context);
    sender = new boost::asio::ip::udp::socket (*io_context);

    receiver->open (boost::asio::ip::udp::v4 ());
    receiver->bind (boost::asio::ip::udp::endpoint (
      boost::asio::ip::address_v4::loopback (), 0));
    sender->open (boost::asio::ip::udp::v4 ());
}

void tearDown ()
{
    delete sender;
    delete receiver;
    delete io_context;
}

static void send_all (jtp::encoder_t &encoder_,
                      const unsigned char *data_,
                      size_t size_,
                      int message_type_)
{
    jtp::fragment_stream_t stream;
    TEST_ASSERT_SUCCESS_ERRNO (
      encoder_.fragment (data_, size_, message_type_, stream));
    while (!stream.done ()) {
        unsigned char *data = NULL;
        const size_t size = stream.encode (&data, 0);
        const size_t sent = sender->send_to (boost::asio::buffer (data, size),
                                             receiver->local_endpoint ());
        TEST_ASSERT_EQUAL_size_t (size, sent);
    }
}

static void receive_n (jtp::decoder_t &decoder_, size_t count_)
{
    unsigned char buf[65536];
    boost::asio::ip::udp::endpoint from;
    for (size_t i = 0; i < count_; i++) {
        const size_t size =
          receiver->receive_from (boost::asio::buffer (buf), from);
        decoder_.accept (buf, size);
    }
}

void test_hello_world_over_udp ()
{
    jtp::encoder_t encoder (source);
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, &sink);

    const char *text = "Hello, World!";
    send_all (encoder, reinterpret_cast<const unsigned char *> (text),
              strlen (text), 5);
    receive_n (decoder, 1);

    const recorded_event_t *complete = sink.last (ev::message_complete);
    TEST_ASSERT_NOT_NULL (complete);
    TEST_ASSERT_EQUAL_UINT8 (5, complete->message_type);
    TEST_ASSERT_EQUAL_size_t (strlen (text), complete->payload.size ());
    TEST_ASSERT_EQUAL_MEMORY (text, &complete->payload[0], strlen (text));
}

void test_fragmented_message_over_udp ()
{
    jtp::encoder_t encoder (source);
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, &sink);

    const std::vector<unsigned char> payload = make_payload (2500);
    send_all (encoder, &payload[0], payload.size (), 10);
    receive_n (decoder, 3);

    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::message_complete));
    TEST_ASSERT_TRUE (sink.last (ev::message_complete)->payload == payload);
}

void test_two_sources_share_a_socket ()
{
    jtp::encoder_t ours (source);
    jtp::encoder_t theirs (0x87654321);
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (source, &sink);

    const std::vector<unsigned char> a = make_payload (1500, 1);
    const std::vector<unsigned char> b = make_payload (1500, 2);
    send_all (theirs, &b[0], b.size (), 1);
    send_all (ours, &a[0], a.size (), 1);
    receive_n (decoder, 4);

    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::message_start));
    TEST_ASSERT_EQUAL_INT (1, sink.count (ev::message_complete));
    TEST_ASSERT_EQUAL_INT (0, sink.count (ev::error));
    TEST_ASSERT_TRUE (sink.last (ev::message_complete)->payload == a);
}

int main ()
{
    UNITY_BEGIN ();
    RUN_TEST (test_hello_world_over_udp);
    RUN_TEST (test_fragmented_message_over_udp);
    RUN_TEST (test_two_sources_share_a_socket);
    return UNITY_END ();
}
