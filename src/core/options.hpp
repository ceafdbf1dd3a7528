/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __JTP_OPTIONS_HPP_INCLUDED__
#define __JTP_OPTIONS_HPP_INCLUDED__

#include <set>
#include <stddef.h>
#include <stdint.h>

namespace jtp
{
//  Largest fragment payload that still fits a single UDP datagram.
const size_t max_datagram_payload = 65495;

struct options_t
{
    options_t ();

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

    //  True if fragments of message_type_ pass the type filter.
    bool accepts (uint8_t message_type_) const;

    //  Cooperative label stamped into, and matched against, every header.
    uint32_t source_id;

    //  Largest payload carried by one fragment. Not negotiated on the wire;
    //  both ends must agree on it.
    size_t max_payload_size;

    //  If true, only message types in accepted_types are decoded.
    bool filter_types;
    std::set<uint8_t> accepted_types;

    //  Upper bound on the bytes a single in-flight message may claim, or -1
    //  for no limit.
    int64_t max_message_size;

    //  Completed messages with more fragments or bytes than these are
    //  reassembled on a later scheduling turn when a scheduler is attached.
    int defer_fragments;
    int64_t defer_bytes;

    //  Fragments produced between two yields of an asynchronous encoder.
    int yield_interval;
};

int do_getopt (void *optval_,
               size_t *optvallen_,
               const void *value_,
               size_t value_len_);
}

#endif
