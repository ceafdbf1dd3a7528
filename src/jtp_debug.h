/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __JTP_DEBUG_H_INCLUDED__
#define __JTP_DEBUG_H_INCLUDED__

#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// Debug counters - only active when JTP_DEBUG_COUNTERS is defined
// These are for testing purposes only, not part of the public API

#if defined(JTP_DEBUG_COUNTERS)

// Fragments written by encoders
size_t jtp_debug_get_fragments_encoded();

// Fragments stored by decoders
size_t jtp_debug_get_fragments_accepted();

// Fragments dropped silently (foreign, wrong source, filtered, stale)
size_t jtp_debug_get_fragments_ignored();

// Errors reported through the decoder error channel
size_t jtp_debug_get_errors_reported();

// Messages reassembled and delivered
size_t jtp_debug_get_messages_completed();

// Messages preempted by a newer message id
size_t jtp_debug_get_messages_abandoned();

// Reassemblies handed to a scheduler instead of running inline
size_t jtp_debug_get_deferred_reassemblies();

// Reset all counters
void jtp_debug_reset_counters();

// Increment functions (internal use)
void jtp_debug_inc_fragments_encoded();
void jtp_debug_inc_fragments_accepted();
void jtp_debug_inc_fragments_ignored();
void jtp_debug_inc_errors_reported();
void jtp_debug_inc_messages_completed();
void jtp_debug_inc_messages_abandoned();
void jtp_debug_inc_deferred_reassemblies();

#else

// Stub macros when counters are disabled
#define jtp_debug_get_fragments_encoded() 0
#define jtp_debug_get_fragments_accepted() 0
#define jtp_debug_get_fragments_ignored() 0
#define jtp_debug_get_errors_reported() 0
#define jtp_debug_get_messages_completed() 0
#define jtp_debug_get_messages_abandoned() 0
#define jtp_debug_get_deferred_reassemblies() 0
#define jtp_debug_reset_counters() ((void)0)
#define jtp_debug_inc_fragments_encoded() ((void)0)
#define jtp_debug_inc_fragments_accepted() ((void)0)
#define jtp_debug_inc_fragments_ignored() ((void)0)
#define jtp_debug_inc_errors_reported() ((void)0)
#define jtp_debug_inc_messages_completed() ((void)0)
#define jtp_debug_inc_messages_abandoned() ((void)0)
#define jtp_debug_inc_deferred_reassemblies() ((void)0)

#endif // JTP_DEBUG_COUNTERS

#ifdef __cplusplus
}
#endif

#endif // __JTP_DEBUG_H_INCLUDED__
