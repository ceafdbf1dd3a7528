/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __JTP_DECODER_HPP_INCLUDED__
#define __JTP_DECODER_HPP_INCLUDED__

#include <map>
#include <set>
#include <stddef.h>
#include <stdint.h>
#include <unordered_map>
#include <vector>

#include "core/options.hpp"
#include "protocol/header.hpp"
#include "protocol/i_events.hpp"
#include "protocol/jtp_protocol.hpp"

namespace jtp
{
//  Reassembles JTP fragments from one source into messages. Keeps at most
//  one message in flight per message type; a newer message id preempts the
//  older one and stale ids are dropped. Not thread safe.
class decoder_t
{
  public:
    explicit decoder_t (uint32_t source_id_, i_decoder_events *sink_ = NULL);
    decoder_t (uint32_t source_id_,
               const std::set<uint8_t> &accepted_types_,
               i_decoder_events *sink_ = NULL);
    explicit decoder_t (const options_t &options_,
                        i_decoder_events *sink_ = NULL);
    ~decoder_t ();

    //  Feeds one datagram. Returns true if it was processed towards a
    //  message, false if it was ignored or rejected.
    bool accept (const unsigned char *data_, size_t size_);

    //  Drops the in-flight message of one type, or of all types. No events
    //  are emitted.
    void reset (uint8_t message_type_);
    void reset ();

    //  Runs a reassembly handed to the scheduler. Returns false if the
    //  message was preempted, reset or already delivered in the meantime.
    bool reassemble (uint8_t message_type_, uint16_t message_id_);

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

    void set_sink (i_decoder_events *sink_) { _sink = sink_; }
    void set_scheduler (i_reassembly_scheduler *scheduler_)
    {
        _scheduler = scheduler_;
    }

    uint32_t source_id () const { return _options.source_id; }
    const options_t &options () const { return _options; }

    //  Introspection of the in-flight message of a type. Returns false if
    //  there is none.
    bool in_flight (uint8_t message_type_,
                    uint16_t *message_id_ = NULL,
                    uint16_t *fragments_received_ = NULL,
                    uint16_t *fragment_count_ = NULL) const;

    //  Number of message types with a message in flight.
    size_t in_flight_count () const { return _accumulators.size (); }

  private:
    //  Reassembly state of the one in-flight message of a type.
    struct accumulator_t
    {
        uint16_t message_id;
        uint16_t fragment_count;
        uint32_t fragments_received;
        size_t total_bytes;
        bool reassembly_pending;

        //  Received payloads by fragment index.
        typedef std::unordered_map<uint16_t, std::vector<unsigned char> >
          fragments_t;
        fragments_t fragments;
    };

    typedef std::map<uint8_t, accumulator_t> accumulators_t;

    //  Message id freshness check. Returns the accumulator to store into,
    //  starting a new message if needed, or NULL if the fragment belongs to
    //  an older message.
    accumulator_t *select_accumulator (const header_t &header_);

    //  Concatenates the fragments of a complete message and delivers it.
    bool reassemble (accumulators_t::iterator it_);

    bool should_defer (const accumulator_t &acc_) const;

    void report (int code_, const char *format_, ...);

    options_t _options;
    i_decoder_events *_sink;
    i_reassembly_scheduler *_scheduler;
    accumulators_t _accumulators;

    JTP_NON_COPYABLE_NOR_MOVABLE (decoder_t)
};
}

#endif
