/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __JTP_HEADER_HPP_INCLUDED__
#define __JTP_HEADER_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>

#include "protocol/jtp_protocol.hpp"

namespace jtp
{
//  Fields of the fixed 12-byte fragment header.
//
//   0      1         2        4          6          8          12
//  +------+---------+--------+----------+----------+----------+
//  | 0x4A | ver|typ | msg id | frag idx | frag cnt | source   |
//  +------+---------+--------+----------+----------+----------+
//
//  Multi-byte fields are little-endian. The version occupies bits 6-7 and
//  the message type bits 0-5 of byte 1.
struct header_t
{
    uint8_t magic;
    uint8_t version;
    uint8_t message_type;
    uint16_t message_id;
    uint16_t fragment_index;
    uint16_t fragment_count;
    uint32_t source_id;
};

//  Writes a header to buf_, which must hold jtp_header_size bytes.
//  Returns -1 with errno set to EINVAL if version_ or message_type_ do not
//  fit their bit fields.
int encode_header (uint8_t version_,
                   uint8_t message_type_,
                   uint16_t message_id_,
                   uint16_t fragment_index_,
                   uint16_t fragment_count_,
                   uint32_t source_id_,
                   unsigned char *buf_);

//  Parses the header at the start of buf_. Returns -1 with errno set to
//  EPROTO if fewer than jtp_header_size bytes are available. The magic byte
//  is copied but not checked.
int decode_header (const unsigned char *buf_, size_t size_, header_t &header_);
}

#endif
