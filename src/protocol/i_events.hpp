/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __JTP_I_EVENTS_HPP_INCLUDED__
#define __JTP_I_EVENTS_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "utils/macros.hpp"

namespace jtp
{
class decoder_t;

//  Position of one fragment within its message.
struct fragment_info_t
{
    uint8_t message_type;
    uint16_t message_id;
    uint16_t fragment_index;
    uint16_t fragment_count;
};

//  Emitted by the encoder once every fragment of a message is out.
struct encode_summary_t
{
    uint16_t message_id;
    uint8_t message_type;
    uint16_t fragment_count;
    size_t total_bytes;
};

//  Metadata delivered together with a reassembled message.
struct message_meta_t
{
    uint16_t message_id;
    uint16_t fragment_count;
    size_t total_bytes;
};

//  Virtual interface to be exposed by objects that want to observe an
//  encoder.

struct i_encoder_events
{
    virtual ~i_encoder_events () JTP_DEFAULT;

    //  Called for every fragment, in index order. The data is valid only
    //  for the duration of the call.
    virtual void fragment_produced (const fragment_info_t &info_,
                                    const unsigned char *data_,
                                    size_t size_) = 0;

    //  Called after the last fragment of a message.
    virtual void message_encoded (const encode_summary_t &summary_) = 0;
};

//  Virtual interface to be exposed by objects that want to observe a
//  decoder. For each message the decoder calls message_start, then
//  fragment_received for every stored fragment, and finally either
//  message_complete or message_incomplete. Only message_complete and error
//  may call back into the decoder.

struct i_decoder_events
{
    virtual ~i_decoder_events () JTP_DEFAULT;

    virtual void message_start (uint8_t message_type_,
                                uint16_t message_id_,
                                uint16_t fragment_count_) = 0;

    virtual void fragment_received (const fragment_info_t &info_,
                                    uint16_t fragments_received_) = 0;

    //  The sink may take the payload by swapping it out.
    virtual void message_complete (uint8_t message_type_,
                                   std::vector<unsigned char> &payload_,
                                   const message_meta_t &meta_) = 0;

    //  A newer message of the same type arrived before this one completed.
    virtual void message_incomplete (uint8_t message_type_,
                                     uint16_t message_id_,
                                     uint16_t fragments_received_,
                                     uint16_t fragment_count_) = 0;

    //  code_ is one of the reported JTP_ERR_* values.
    virtual void error (int code_, const char *reason_) = 0;
};

//  Hook through which the decoder hands off reassembly of large messages.
//  The implementation must eventually call decoder_t::reassemble with the
//  same arguments, from the thread that owns the decoder.

struct i_reassembly_scheduler
{
    virtual ~i_reassembly_scheduler () JTP_DEFAULT;

    virtual void schedule_reassembly (decoder_t *decoder_,
                                      uint8_t message_type_,
                                      uint16_t message_id_) = 0;
};
}

#endif
