/* SPDX-License-Identifier: MPL-2.0 */

#include "../tests/testutil.hpp"

#include "core/options.hpp"
#include "protocol/jtp_protocol.hpp"

#include <unity.h>
#include <stdlib.h>

void setUp ()
{
    unsetenv ("JTP_MAX_PAYLOAD");
}

void tearDown ()
{
    unsetenv ("JTP_MAX_PAYLOAD");
}

void test_defaults ()
{
    jtp::options_t options;
    TEST_ASSERT_EQUAL_UINT32 (0, options.source_id);
    TEST_ASSERT_EQUAL_size_t (1200, options.max_payload_size);
    TEST_ASSERT_FALSE (options.filter_types);
    TEST_ASSERT_TRUE (options.accepts (0));
    TEST_ASSERT_TRUE (options.accepts (63));
    TEST_ASSERT_EQUAL_INT64 (-1, options.max_message_size);
    TEST_ASSERT_EQUAL_INT (100, options.defer_fragments);
    TEST_ASSERT_EQUAL_INT64 (65536, options.defer_bytes);
    TEST_ASSERT_EQUAL_INT (10, options.yield_interval);
}

void test_max_payload_from_environment ()
{
    setenv ("JTP_MAX_PAYLOAD", "512", 1);
    jtp::options_t options;
    TEST_ASSERT_EQUAL_size_t (512, options.max_payload_size);
}

void test_bad_environment_falls_back ()
{
    setenv ("JTP_MAX_PAYLOAD", "lots", 1);
    TEST_ASSERT_EQUAL_size_t (1200, jtp::default_max_payload_size ());
    setenv ("JTP_MAX_PAYLOAD", "0", 1);
    TEST_ASSERT_EQUAL_size_t (1200, jtp::default_max_payload_size ());
    setenv ("JTP_MAX_PAYLOAD", "70000", 1);
    TEST_ASSERT_EQUAL_size_t (1200, jtp::default_max_payload_size ());
}

void test_int_options ()
{
    jtp::options_t options;
    int value = 800;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setopt (JTP_MAX_PAYLOAD, &value, sizeof (value)));
    value = 0;
    size_t size = sizeof (value);
    TEST_ASSERT_SUCCESS_ERRNO (options.getopt (JTP_MAX_PAYLOAD, &value, &size));
    TEST_ASSERT_EQUAL_INT (800, value);

    value = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.setopt (JTP_MAX_PAYLOAD, &value, sizeof (value)));
    value = 65496;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.setopt (JTP_MAX_PAYLOAD, &value, sizeof (value)));

    value = 3;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setopt (JTP_YIELD_INTERVAL, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_INT (3, options.yield_interval);
    value = 0;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.setopt (JTP_YIELD_INTERVAL, &value, sizeof (value)));

    value = 5;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setopt (JTP_DEFER_FRAGMENTS, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_INT (5, options.defer_fragments);

    //  Wrong option length.
    const int64_t wide = 5;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.setopt (JTP_DEFER_FRAGMENTS, &wide, sizeof (wide)));
}

void test_int64_options ()
{
    jtp::options_t options;
    int64_t value = 4096;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setopt (JTP_MAX_MESSAGE_SIZE, &value, sizeof (value)));
    TEST_ASSERT_EQUAL_INT64 (4096, options.max_message_size);

    value = -1;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setopt (JTP_MAX_MESSAGE_SIZE, &value, sizeof (value)));
    value = -2;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.setopt (JTP_MAX_MESSAGE_SIZE, &value, sizeof (value)));

    value = 1024;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setopt (JTP_DEFER_BYTES, &value, sizeof (value)));
    value = 0;
    size_t size = sizeof (value);
    TEST_ASSERT_SUCCESS_ERRNO (options.getopt (JTP_DEFER_BYTES, &value, &size));
    TEST_ASSERT_EQUAL_INT64 (1024, value);
}

void test_accept_type_filter ()
{
    jtp::options_t options;
    int type = 7;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setopt (JTP_ACCEPT_TYPE, &type, sizeof (type)));
    type = 9;
    TEST_ASSERT_SUCCESS_ERRNO (
      options.setopt (JTP_ACCEPT_TYPE, &type, sizeof (type)));
    TEST_ASSERT_TRUE (options.accepts (7));
    TEST_ASSERT_TRUE (options.accepts (9));
    TEST_ASSERT_FALSE (options.accepts (8));

    type = 64;
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.setopt (JTP_ACCEPT_TYPE, &type, sizeof (type)));

    //  The filter is write-only.
    size_t size = sizeof (type);
    TEST_ASSERT_FAILURE_ERRNO (EINVAL,
                               options.getopt (JTP_ACCEPT_TYPE, &type, &size));

    TEST_ASSERT_SUCCESS_ERRNO (options.setopt (JTP_ACCEPT_TYPE, NULL, 0));
    TEST_ASSERT_TRUE (options.accepts (8));
}

void test_getopt_short_buffer ()
{
    jtp::options_t options;
    uint16_t small = 0;
    size_t size = sizeof (small);
    TEST_ASSERT_FAILURE_ERRNO (
      EINVAL, options.getopt (JTP_SOURCE_ID, &small, &size));
}

void test_unknown_option ()
{
    jtp::options_t options;
    int value = 1;
    TEST_ASSERT_FAILURE_ERRNO (EINVAL,
                               options.setopt (999, &value, sizeof (value)));
}

int main ()
{
    UNITY_BEGIN ();
    RUN_TEST (test_defaults);
    RUN_TEST (test_max_payload_from_environment);
    RUN_TEST (test_bad_environment_falls_back);
    RUN_TEST (test_int_options);
    RUN_TEST (test_int64_options);
    RUN_TEST (test_accept_type_filter);
    RUN_TEST (test_getopt_short_buffer);
    RUN_TEST (test_unknown_option);
    return UNITY_END ();
}
