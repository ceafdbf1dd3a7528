/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

#include "protocol/header.hpp"

#include <stdio.h>
#include <string.h>

int test_assert_success_message_errno_helper (int rc_,
                                              const char *msg_,
                                              const char *expr_,
                                              int line_)
{
    if (rc_ == -1) {
        char buffer[512];
        buffer[sizeof (buffer) - 1] =
          0; // to ensure defined behavior with VC++ <= 2013
        snprintf (buffer, sizeof (buffer) - 1,
                  "%s failed%s%s%s, errno = %i (%s)", expr_,
                  msg_ ? " (additional info: " : "", msg_ ? msg_ : "",
                  msg_ ? ")" : "", jtp_errno (), jtp_strerror (jtp_errno ()));
        UNITY_TEST_FAIL (line_, buffer);
    }
    return rc_;
}

static recorded_event_t make_event (recorded_event_t::kind_t kind_)
{
    recorded_event_t event;
    event.kind = kind_;
    event.message_type = 0;
    event.message_id = 0;
    event.fragment_index = 0;
    event.fragment_count = 0;
    event.fragments_received = 0;
    event.total_bytes = 0;
    event.error_code = 0;
    return event;
}

void recording_decoder_sink_t::message_start (uint8_t message_type_,
                                              uint16_t message_id_,
                                              uint16_t fragment_count_)
{
    recorded_event_t event = make_event (recorded_event_t::message_start);
    event.message_type = message_type_;
    event.message_id = message_id_;
    event.fragment_count = fragment_count_;
    events.push_back (event);
}

void recording_decoder_sink_t::fragment_received (
  const jtp::fragment_info_t &info_, uint16_t fragments_received_)
{
    recorded_event_t event = make_event (recorded_event_t::fragment_received);
    event.message_type = info_.message_type;
    event.message_id = info_.message_id;
    event.fragment_index = info_.fragment_index;
    event.fragment_count = info_.fragment_count;
    event.fragments_received = fragments_received_;
    events.push_back (event);
}

void recording_decoder_sink_t::message_complete (
  uint8_t message_type_,
  std::vector<unsigned char> &payload_,
  const jtp::message_meta_t &meta_)
{
    recorded_event_t event = make_event (recorded_event_t::message_complete);
    event.message_type = message_type_;
    event.message_id = meta_.message_id;
    event.fragment_count = meta_.fragment_count;
    event.total_bytes = meta_.total_bytes;
    event.payload.swap (payload_);
    events.push_back (event);
}

void recording_decoder_sink_t::message_incomplete (uint8_t message_type_,
                                                   uint16_t message_id_,
                                                   uint16_t fragments_received_,
                                                   uint16_t fragment_count_)
{
    recorded_event_t event =
      make_event (recorded_event_t::message_incomplete);
    event.message_type = message_type_;
    event.message_id = message_id_;
    event.fragments_received = fragments_received_;
    event.fragment_count = fragment_count_;
    events.push_back (event);
}

void recording_decoder_sink_t::error (int code_, const char *reason_)
{
    recorded_event_t event = make_event (recorded_event_t::error);
    event.error_code = code_;
    event.reason = reason_ ? reason_ : "";
    events.push_back (event);
}

size_t recording_decoder_sink_t::count (recorded_event_t::kind_t kind_) const
{
    size_t n = 0;
    for (size_t i = 0; i < events.size (); i++)
        if (events[i].kind == kind_)
            n++;
    return n;
}

int recording_decoder_sink_t::find (recorded_event_t::kind_t kind_,
                                    size_t n_) const
{
    for (size_t i = 0; i < events.size (); i++) {
        if (events[i].kind != kind_)
            continue;
        if (n_ == 0)
            return static_cast<int> (i);
        n_--;
    }
    return -1;
}

const recorded_event_t *
recording_decoder_sink_t::last (recorded_event_t::kind_t kind_) const
{
    for (size_t i = events.size (); i > 0; i--)
        if (events[i - 1].kind == kind_)
            return &events[i - 1];
    return NULL;
}

void recording_encoder_sink_t::fragment_produced (
  const jtp::fragment_info_t &info_, const unsigned char *data_, size_t size_)
{
    infos.push_back (info_);
    fragments.push_back (std::vector<unsigned char> (data_, data_ + size_));
}

void recording_encoder_sink_t::message_encoded (
  const jtp::encode_summary_t &summary_)
{
    summaries.push_back (summary_);
}

std::vector<unsigned char> build_packet (uint8_t message_type_,
                                         uint16_t message_id_,
                                         uint16_t fragment_index_,
                                         uint16_t fragment_count_,
                                         uint32_t source_id_,
                                         size_t payload_size_,
                                         unsigned char fill_)
{
    std::vector<unsigned char> packet (jtp::jtp_header_size + payload_size_,
                                       fill_);
    const int rc = jtp::encode_header (
      jtp::jtp_version, message_type_, message_id_, fragment_index_,
      fragment_count_, source_id_, &packet[0]);
    TEST_ASSERT_EQUAL_INT (0, rc);
    return packet;
}

std::vector<unsigned char> make_payload (size_t size_, unsigned seed_)
{
    std::vector<unsigned char> payload (size_);
    for (size_t i = 0; i < size_; i++)
        payload[i] = static_cast<unsigned char> ((i * 31 + seed_) % 251);
    return payload;
}

std::vector<size_t> shuffled_indices (size_t count_, unsigned seed_)
{
    std::vector<size_t> indices (count_);
    for (size_t i = 0; i < count_; i++)
        indices[i] = i;

    //  Small LCG so the order is the same on every platform.
    uint32_t state = seed_ * 2654435761u + 1;
    for (size_t i = count_; i > 1; i--) {
        state = state * 1664525u + 1013904223u;
        const size_t j = state % i;
        const size_t tmp = indices[i - 1];
        indices[i - 1] = indices[j];
        indices[j] = tmp;
    }
    return indices;
}
