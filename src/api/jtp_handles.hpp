/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __JTP_HANDLES_HPP_INCLUDED__
#define __JTP_HANDLES_HPP_INCLUDED__

#include "../include/jtp.h"
#include "protocol/jtp_decoder.hpp"
#include "protocol/jtp_encoder.hpp"
#include "utils/macros.hpp"

namespace jtp
{
//  Translates encoder events into jtp_encoder_event_t records for a C
//  callback.
class c_encoder_sink_t JTP_FINAL : public i_encoder_events
{
  public:
    c_encoder_sink_t ();

    void set_handler (jtp_encoder_event_fn *handler_, int events_, void *hint_);

    //  i_encoder_events implementation.
    void fragment_produced (const fragment_info_t &info_,
                            const unsigned char *data_,
                            size_t size_) JTP_OVERRIDE;
    void message_encoded (const encode_summary_t &summary_) JTP_OVERRIDE;

  private:
    void deliver (jtp_encoder_event_t &event_);

    jtp_encoder_event_fn *_handler;
    int _events;
    void *_hint;

    JTP_NON_COPYABLE_NOR_MOVABLE (c_encoder_sink_t)
};

//  Object behind a void * encoder handle of the C API.
class encoder_handle_t
{
  public:
    explicit encoder_handle_t (uint32_t source_id_);
    ~encoder_handle_t ();

    bool check_tag () const { return _tag == 0xcafe0e0c; }

    c_encoder_sink_t sink;
    encoder_t encoder;
    fragment_stream_t stream;

  private:
    uint32_t _tag;

    JTP_NON_COPYABLE_NOR_MOVABLE (encoder_handle_t)
};

//  Translates decoder events into jtp_decoder_event_t records for a C
//  callback.
class c_event_sink_t JTP_FINAL : public i_decoder_events
{
  public:
    c_event_sink_t ();

    void set_handler (jtp_event_fn *handler_, int events_, void *hint_);

    //  i_decoder_events implementation.
    void message_start (uint8_t message_type_,
                        uint16_t message_id_,
                        uint16_t fragment_count_) JTP_OVERRIDE;
    void fragment_received (const fragment_info_t &info_,
                            uint16_t fragments_received_) JTP_OVERRIDE;
    void message_complete (uint8_t message_type_,
                           std::vector<unsigned char> &payload_,
                           const message_meta_t &meta_) JTP_OVERRIDE;
    void message_incomplete (uint8_t message_type_,
                             uint16_t message_id_,
                             uint16_t fragments_received_,
                             uint16_t fragment_count_) JTP_OVERRIDE;
    void error (int code_, const char *reason_) JTP_OVERRIDE;

  private:
    void deliver (jtp_decoder_event_t &event_);

    jtp_event_fn *_handler;
    int _events;
    void *_hint;

    JTP_NON_COPYABLE_NOR_MOVABLE (c_event_sink_t)
};

//  Object behind a void * decoder handle of the C API.
class decoder_handle_t
{
  public:
    explicit decoder_handle_t (uint32_t source_id_);
    ~decoder_handle_t ();

    bool check_tag () const { return _tag == 0xcafe0dec; }

    c_event_sink_t sink;
    decoder_t decoder;

  private:
    uint32_t _tag;

    JTP_NON_COPYABLE_NOR_MOVABLE (decoder_handle_t)
};
}

#endif
