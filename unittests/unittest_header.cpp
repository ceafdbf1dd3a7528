/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "protocol/header.hpp"
#include "protocol/jtp_protocol.hpp"
#include "protocol/wire.hpp"

#include <unity.h>
#include <string.h>

void setUp ()
{
}

void tearDown ()
{
}

void test_encode_layout ()
{
    unsigned char buf[jtp::jtp_header_size];
    TEST_ASSERT_SUCCESS_ERRNO (
      jtp::encode_header (0, 5, 0x0102, 0x0304, 0x0506, 0x12345678, buf));

    const unsigned char expected[jtp::jtp_header_size] = {
      0x4A, 0x05, 0x02, 0x01, 0x04, 0x03, 0x06, 0x05, 0x78, 0x56, 0x34, 0x12};
    TEST_ASSERT_EQUAL_UINT8_ARRAY (expected, buf, jtp::jtp_header_size);
}

void test_version_and_type_share_byte ()
{
    unsigned char buf[jtp::jtp_header_size];
    TEST_ASSERT_SUCCESS_ERRNO (jtp::encode_header (2, 63, 0, 0, 1, 0, buf));
    TEST_ASSERT_EQUAL_HEX8 (0xBF, buf[1]);

    jtp::header_t header;
    TEST_ASSERT_SUCCESS_ERRNO (
      jtp::decode_header (buf, sizeof (buf), header));
    TEST_ASSERT_EQUAL_UINT8 (2, header.version);
    TEST_ASSERT_EQUAL_UINT8 (63, header.message_type);
}

void test_encode_rejects_out_of_range_fields ()
{
    unsigned char buf[jtp::jtp_header_size];
    TEST_ASSERT_FAILURE_ERRNO (EINVAL,
                               jtp::encode_header (0, 64, 0, 0, 1, 0, buf));
    TEST_ASSERT_FAILURE_ERRNO (EINVAL,
                               jtp::encode_header (4, 1, 0, 0, 1, 0, buf));
}

void test_decode_fields ()
{
    const unsigned char buf[] = {0x4A, 0x05, 0x34, 0x12, 0x02, 0x00,
                                 0x03, 0x00, 0x78, 0x56, 0x34, 0x12,
                                 'x',  'y'};
    jtp::header_t header;
    TEST_ASSERT_SUCCESS_ERRNO (
      jtp::decode_header (buf, sizeof (buf), header));
    TEST_ASSERT_EQUAL_UINT8 (0x4A, header.magic);
    TEST_ASSERT_EQUAL_UINT8 (0, header.version);
    TEST_ASSERT_EQUAL_UINT8 (5, header.message_type);
    TEST_ASSERT_EQUAL_UINT16 (0x1234, header.message_id);
    TEST_ASSERT_EQUAL_UINT16 (2, header.fragment_index);
    TEST_ASSERT_EQUAL_UINT16 (3, header.fragment_count);
    TEST_ASSERT_EQUAL_HEX32 (0x12345678, header.source_id);
}

void test_decode_short_buffer ()
{
    unsigned char buf[jtp::jtp_header_size];
    memset (buf, 0, sizeof (buf));
    buf[0] = jtp::jtp_magic;
    jtp::header_t header;
    TEST_ASSERT_FAILURE_ERRNO (
      EPROTO, jtp::decode_header (buf, jtp::jtp_header_size - 1, header));
}

void test_decode_does_not_check_magic ()
{
    unsigned char buf[jtp::jtp_header_size];
    memset (buf, 0, sizeof (buf));
    buf[0] = 0x00;
    jtp::header_t header;
    TEST_ASSERT_SUCCESS_ERRNO (
      jtp::decode_header (buf, sizeof (buf), header));
    TEST_ASSERT_EQUAL_UINT8 (0x00, header.magic);
}

void test_wire_little_endian ()
{
    unsigned char buf[4];
    jtp::put_uint16 (buf, 0xBEEF);
    TEST_ASSERT_EQUAL_HEX8 (0xEF, buf[0]);
    TEST_ASSERT_EQUAL_HEX8 (0xBE, buf[1]);
    TEST_ASSERT_EQUAL_HEX16 (0xBEEF, jtp::get_uint16 (buf));

    jtp::put_uint32 (buf, 0xDEADBEEF);
    TEST_ASSERT_EQUAL_HEX8 (0xEF, buf[0]);
    TEST_ASSERT_EQUAL_HEX8 (0xDE, buf[3]);
    TEST_ASSERT_EQUAL_HEX32 (0xDEADBEEF, jtp::get_uint32 (buf));
}

void test_is_newer_id ()
{
    TEST_ASSERT_TRUE (jtp::jtp_is_newer_id (101, 100));
    TEST_ASSERT_FALSE (jtp::jtp_is_newer_id (100, 101));
    TEST_ASSERT_FALSE (jtp::jtp_is_newer_id (100, 100));
    TEST_ASSERT_TRUE (jtp::jtp_is_newer_id (0, 65535));
    TEST_ASSERT_FALSE (jtp::jtp_is_newer_id (65535, 0));
    TEST_ASSERT_TRUE (jtp::jtp_is_newer_id (32767, 0));
    //  Exactly half the id space away is not newer in either direction.
    TEST_ASSERT_FALSE (jtp::jtp_is_newer_id (32768, 0));
    TEST_ASSERT_FALSE (jtp::jtp_is_newer_id (0, 32768));
}

void test_fragment_count ()
{
    TEST_ASSERT_EQUAL_size_t (1, jtp::jtp_fragment_count (0, 1200));
    TEST_ASSERT_EQUAL_size_t (1, jtp::jtp_fragment_count (1, 1200));
    TEST_ASSERT_EQUAL_size_t (1, jtp::jtp_fragment_count (1200, 1200));
    TEST_ASSERT_EQUAL_size_t (2, jtp::jtp_fragment_count (1201, 1200));
    TEST_ASSERT_EQUAL_size_t (3, jtp::jtp_fragment_count (2500, 1200));
    TEST_ASSERT_EQUAL_size_t (65535,
                              jtp::jtp_fragment_count (65535 * 10, 10));
    TEST_ASSERT_EQUAL_size_t (65536,
                              jtp::jtp_fragment_count (65535 * 10 + 1, 10));
}

void test_error_reason ()
{
    TEST_ASSERT_EQUAL_STRING ("duplicate fragment",
                              jtp_error_reason (JTP_ERR_DUPLICATE_FRAGMENT));
    TEST_ASSERT_EQUAL_STRING ("message too large",
                              jtp_error_reason (JTP_ERR_MESSAGE_TOO_LARGE));
    TEST_ASSERT_EQUAL_STRING ("unknown", jtp_error_reason (0));
}

int main ()
{
    UNITY_BEGIN ();
    RUN_TEST (test_encode_layout);
    RUN_TEST (test_version_and_type_share_byte);
    RUN_TEST (test_encode_rejects_out_of_range_fields);
    RUN_TEST (test_decode_fields);
    RUN_TEST (test_decode_short_buffer);
    RUN_TEST (test_decode_does_not_check_magic);
    RUN_TEST (test_wire_little_endian);
    RUN_TEST (test_is_newer_id);
    RUN_TEST (test_fragment_count);
    RUN_TEST (test_error_reason);
    return UNITY_END ();
}
