/* SPDX-License-Identifier: MPL-2.0 */

#include "testutil.hpp"

#include "jtp_debug.h"
#include "protocol/jtp_decoder.hpp"
#include "protocol/jtp_encoder.hpp"

#include <unity.h>

void setUp ()
{
    jtp_debug_reset_counters ();
}

void tearDown ()
{
}

#if defined(JTP_DEBUG_COUNTERS)

void test_counters_follow_traffic ()
{
    jtp::options_t options;
    options.source_id = 1;
    options.max_payload_size = 10;

    jtp::encoder_t encoder (options);
    recording_decoder_sink_t sink;
    jtp::decoder_t decoder (options, &sink);

    const std::vector<unsigned char> payload = make_payload (25);
    std::vector<std::vector<unsigned char> > fragments;
    TEST_ASSERT_EQUAL_INT (
      3, encoder.fragment_all (&payload[0], payload.size (), 1, fragments));
    TEST_ASSERT_EQUAL_size_t (3, jtp_debug_get_fragments_encoded ());

    for (size_t i = 0; i < fragments.size (); i++)
        decoder.accept (&fragments[i][0], fragments[i].size ());
    decoder.accept (&fragments[0][0], fragments[0].size ());

    const std::vector<unsigned char> foreign =
      build_packet (1, 0, 0, 1, 2, 1);
    decoder.accept (&foreign[0], foreign.size ());

    const std::vector<unsigned char> a = build_packet (2, 5, 0, 2, 1, 1);
    const std::vector<unsigned char> b = build_packet (2, 6, 0, 2, 1, 1);
    decoder.accept (&a[0], a.size ());
    decoder.accept (&b[0], b.size ());

    //  The repeated fragment 0 starts a fresh message once the first one
    //  is delivered, so it is stored, not rejected.
    TEST_ASSERT_EQUAL_size_t (6, jtp_debug_get_fragments_accepted ());
    TEST_ASSERT_EQUAL_size_t (1, jtp_debug_get_fragments_ignored ());
    TEST_ASSERT_EQUAL_size_t (1, jtp_debug_get_messages_completed ());
    TEST_ASSERT_EQUAL_size_t (1, jtp_debug_get_messages_abandoned ());
    TEST_ASSERT_EQUAL_size_t (0, jtp_debug_get_errors_reported ());

    jtp_debug_reset_counters ();
    TEST_ASSERT_EQUAL_size_t (0, jtp_debug_get_fragments_accepted ());
}

#else

void test_counters_not_enabled ()
{
    TEST_IGNORE_MESSAGE ("Debug counters not enabled, skipping tests");
}

#endif

int main ()
{
    UNITY_BEGIN ();
#if defined(JTP_DEBUG_COUNTERS)
    RUN_TEST (test_counters_follow_traffic);
#else
    RUN_TEST (test_counters_not_enabled);
#endif
    return UNITY_END ();
}
