/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __JTP_PROTOCOL_HPP_INCLUDED__
#define __JTP_PROTOCOL_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include "../include/jtp.h"

namespace jtp
{
// JTP protocol constants (v0)
enum
{
    jtp_magic = JTP_MAGIC,
    jtp_version = JTP_PROTOCOL_VERSION,
    jtp_header_size = JTP_HEADER_SIZE,
    jtp_max_version = 0x03,
    jtp_max_message_type = JTP_MAX_MESSAGE_TYPES - 1,
    jtp_type_mask = 0x3F,
    jtp_version_shift = 6
};

const uint32_t jtp_max_fragment_count = JTP_MAX_FRAGMENT_COUNT;
const size_t jtp_default_max_payload = JTP_MAX_PAYLOAD_DFLT;

//  Half of the 16-bit id space. Ids closer than this in forward circular
//  distance are newer; the rest are older.
const uint16_t jtp_id_window = 0x8000;

inline const char *jtp_error_reason (int code_)
{
    switch (code_) {
        case JTP_ERR_NOT_PROTOCOL:
            return "not a JTP packet";
        case JTP_ERR_PACKET_TOO_SHORT:
            return "packet too short";
        case JTP_ERR_UNSUPPORTED_VERSION:
            return "unsupported version";
        case JTP_ERR_WRONG_SOURCE:
            return "wrong source";
        case JTP_ERR_FILTERED_TYPE:
            return "filtered message type";
        case JTP_ERR_INVALID_FRAGMENT:
            return "invalid fragment";
        case JTP_ERR_DUPLICATE_FRAGMENT:
            return "duplicate fragment";
        case JTP_ERR_FRAGMENT_COUNT_EXCEEDED:
            return "fragment count exceeded";
        case JTP_ERR_REASSEMBLY_FAILED:
            return "reassembly failed";
        case JTP_ERR_INVALID_MESSAGE_TYPE:
            return "invalid message type";
        case JTP_ERR_INVALID_INPUT_TYPE:
            return "invalid input";
        case JTP_ERR_MESSAGE_TOO_LARGE:
            return "message too large";
        case JTP_ERR_MESSAGE_ID_MISMATCH:
            return "message id mismatch";
        default:
            return "unknown";
    }
}

//  True if message id a_ follows b_ within half the id space, so that
//  65535 -> 0 counts as a step forward.
inline bool jtp_is_newer_id (uint16_t a_, uint16_t b_)
{
    const uint16_t distance = static_cast<uint16_t> (a_ - b_);
    return distance > 0 && distance < jtp_id_window;
}

//  Number of fragments a payload of size_ bytes occupies; an empty payload
//  still travels as one zero-length fragment.
inline size_t jtp_fragment_count (size_t size_, size_t max_payload_)
{
    if (size_ == 0)
        return 1;
    return size_ / max_payload_ + (size_ % max_payload_ != 0 ? 1 : 0);
}

//  Payload size shared by both ends. JTP_MAX_PAYLOAD in the environment
//  overrides the built-in default for links with a smaller path MTU.
size_t default_max_payload_size ();
}

#endif
