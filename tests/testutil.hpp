/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __TESTUTIL_HPP_INCLUDED__
#define __TESTUTIL_HPP_INCLUDED__

#include "../include/jtp.h"
#include "protocol/i_events.hpp"

#include <stddef.h>
#include <stdint.h>
#include <string>
#include <vector>

#include <unity.h>

//  Asserts that a libjtp call succeeded, i.e. did not return -1.
#define TEST_ASSERT_SUCCESS_ERRNO(expr)                                        \
    test_assert_success_message_errno_helper (expr, NULL, #expr, __LINE__)

//  Asserts that a libjtp call failed with the given errno.
#define TEST_ASSERT_FAILURE_ERRNO(error_code, expr)                            \
    {                                                                          \
        int _rc = (expr);                                                      \
        TEST_ASSERT_EQUAL_INT (-1, _rc);                                       \
        TEST_ASSERT_EQUAL_INT (error_code, errno);                             \
    }

int test_assert_success_message_errno_helper (int rc_,
                                              const char *msg_,
                                              const char *expr_,
                                              int line_);

//  One event observed on a decoder.
struct recorded_event_t
{
    enum kind_t
    {
        message_start,
        fragment_received,
        message_complete,
        message_incomplete,
        error
    };

    kind_t kind;
    uint8_t message_type;
    uint16_t message_id;
    uint16_t fragment_index;
    uint16_t fragment_count;
    uint16_t fragments_received;
    size_t total_bytes;
    std::vector<unsigned char> payload;
    int error_code;
    std::string reason;
};

//  Decoder sink keeping every event in arrival order.
class recording_decoder_sink_t : public jtp::i_decoder_events
{
  public:
    void message_start (uint8_t message_type_,
                        uint16_t message_id_,
                        uint16_t fragment_count_);
    void fragment_received (const jtp::fragment_info_t &info_,
                            uint16_t fragments_received_);
    void message_complete (uint8_t message_type_,
                           std::vector<unsigned char> &payload_,
                           const jtp::message_meta_t &meta_);
    void message_incomplete (uint8_t message_type_,
                             uint16_t message_id_,
                             uint16_t fragments_received_,
                             uint16_t fragment_count_);
    void error (int code_, const char *reason_);

    size_t count (recorded_event_t::kind_t kind_) const;

    //  Index of the n_-th event of a kind, or -1.
    int find (recorded_event_t::kind_t kind_, size_t n_ = 0) const;

    const recorded_event_t *last (recorded_event_t::kind_t kind_) const;

    void clear () { events.clear (); }

    std::vector<recorded_event_t> events;
};

//  Encoder sink keeping copies of produced fragments and summaries.
class recording_encoder_sink_t : public jtp::i_encoder_events
{
  public:
    void fragment_produced (const jtp::fragment_info_t &info_,
                            const unsigned char *data_,
                            size_t size_);
    void message_encoded (const jtp::encode_summary_t &summary_);

    std::vector<jtp::fragment_info_t> infos;
    std::vector<std::vector<unsigned char> > fragments;
    std::vector<jtp::encode_summary_t> summaries;
};

//  Builds a raw datagram: a header with the given fields followed by
//  payload_size_ bytes of fill_.
std::vector<unsigned char> build_packet (uint8_t message_type_,
                                         uint16_t message_id_,
                                         uint16_t fragment_index_,
                                         uint16_t fragment_count_,
                                         uint32_t source_id_,
                                         size_t payload_size_,
                                         unsigned char fill_ = 0);

//  Payload whose byte i is (i * 31 + seed_) mod 251.
std::vector<unsigned char> make_payload (size_t size_, unsigned seed_ = 0);

//  Deterministic Fisher-Yates shuffle of an index permutation.
std::vector<size_t> shuffled_indices (size_t count_, unsigned seed_);

#endif
