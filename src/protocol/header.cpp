/* SPDX-License-Identifier: MPL-2.0 */

#include "protocol/header.hpp"
#include "protocol/wire.hpp"
#include "utils/err.hpp"

int jtp::encode_header (uint8_t version_,
                        uint8_t message_type_,
                        uint16_t message_id_,
                        uint16_t fragment_index_,
                        uint16_t fragment_count_,
                        uint32_t source_id_,
                        unsigned char *buf_)
{
    if (unlikely (version_ > jtp_max_version
                  || message_type_ > jtp_max_message_type)) {
        errno = EINVAL;
        return -1;
    }

    put_uint8 (buf_, jtp_magic);
    put_uint8 (buf_ + 1,
               static_cast<uint8_t> ((version_ << jtp_version_shift)
                                     | (message_type_ & jtp_type_mask)));
    put_uint16 (buf_ + 2, message_id_);
    put_uint16 (buf_ + 4, fragment_index_);
    put_uint16 (buf_ + 6, fragment_count_);
    put_uint32 (buf_ + 8, source_id_);
    return 0;
}

int jtp::decode_header (const unsigned char *buf_,
                        size_t size_,
                        header_t &header_)
{
    if (unlikely (size_ < jtp_header_size)) {
        errno = EPROTO;
        return -1;
    }

    const uint8_t version_and_type = get_uint8 (buf_ + 1);
    header_.magic = get_uint8 (buf_);
    header_.version =
      static_cast<uint8_t> ((version_and_type >> jtp_version_shift) & 0x03);
    header_.message_type = static_cast<uint8_t> (version_and_type & jtp_type_mask);
    header_.message_id = get_uint16 (buf_ + 2);
    header_.fragment_index = get_uint16 (buf_ + 4);
    header_.fragment_count = get_uint16 (buf_ + 6);
    header_.source_id = get_uint32 (buf_ + 8);
    return 0;
}
