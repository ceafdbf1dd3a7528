/* SPDX-License-Identifier: MPL-2.0 */

#include "jtp_debug.h"

#if defined(JTP_DEBUG_COUNTERS)

#include <atomic>

static std::atomic<size_t> s_fragments_encoded{0};
static std::atomic<size_t> s_fragments_accepted{0};
static std::atomic<size_t> s_fragments_ignored{0};
static std::atomic<size_t> s_errors_reported{0};
static std::atomic<size_t> s_messages_completed{0};
static std::atomic<size_t> s_messages_abandoned{0};
static std::atomic<size_t> s_deferred_reassemblies{0};

extern "C" {

size_t jtp_debug_get_fragments_encoded()
{
    return s_fragments_encoded.load(std::memory_order_relaxed);
}

size_t jtp_debug_get_fragments_accepted()
{
    return s_fragments_accepted.load(std::memory_order_relaxed);
}

size_t jtp_debug_get_fragments_ignored()
{
    return s_fragments_ignored.load(std::memory_order_relaxed);
}

size_t jtp_debug_get_errors_reported()
{
    return s_errors_reported.load(std::memory_order_relaxed);
}

size_t jtp_debug_get_messages_completed()
{
    return s_messages_completed.load(std::memory_order_relaxed);
}

size_t jtp_debug_get_messages_abandoned()
{
    return s_messages_abandoned.load(std::memory_order_relaxed);
}

size_t jtp_debug_get_deferred_reassemblies()
{
    return s_deferred_reassemblies.load(std::memory_order_relaxed);
}

void jtp_debug_reset_counters()
{
    s_fragments_encoded.store(0, std::memory_order_relaxed);
    s_fragments_accepted.store(0, std::memory_order_relaxed);
    s_fragments_ignored.store(0, std::memory_order_relaxed);
    s_errors_reported.store(0, std::memory_order_relaxed);
    s_messages_completed.store(0, std::memory_order_relaxed);
    s_messages_abandoned.store(0, std::memory_order_relaxed);
    s_deferred_reassemblies.store(0, std::memory_order_relaxed);
}

void jtp_debug_inc_fragments_encoded()
{
    s_fragments_encoded.fetch_add(1, std::memory_order_relaxed);
}

void jtp_debug_inc_fragments_accepted()
{
    s_fragments_accepted.fetch_add(1, std::memory_order_relaxed);
}

void jtp_debug_inc_fragments_ignored()
{
    s_fragments_ignored.fetch_add(1, std::memory_order_relaxed);
}

void jtp_debug_inc_errors_reported()
{
    s_errors_reported.fetch_add(1, std::memory_order_relaxed);
}

void jtp_debug_inc_messages_completed()
{
    s_messages_completed.fetch_add(1, std::memory_order_relaxed);
}

void jtp_debug_inc_messages_abandoned()
{
    s_messages_abandoned.fetch_add(1, std::memory_order_relaxed);
}

void jtp_debug_inc_deferred_reassemblies()
{
    s_deferred_reassemblies.fetch_add(1, std::memory_order_relaxed);
}

} // extern "C"

#endif // JTP_DEBUG_COUNTERS
