/* SPDX-License-Identifier: MPL-2.0 */

#include <stdarg.h>
#include <stdio.h>

#include "protocol/jtp_decoder.hpp"
#include "utils/err.hpp"
#include "jtp_debug.h"

jtp::decoder_t::decoder_t (uint32_t source_id_, i_decoder_events *sink_) :
    _sink (sink_),
    _scheduler (NULL)
{
    _options.source_id = source_id_;
}

jtp::decoder_t::decoder_t (uint32_t source_id_,
                           const std::set<uint8_t> &accepted_types_,
                           i_decoder_events *sink_) :
    _sink (sink_),
    _scheduler (NULL)
{
    _options.source_id = source_id_;
    for (std::set<uint8_t>::const_iterator it = accepted_types_.begin ();
         it != accepted_types_.end (); ++it) {
        if (*it <= jtp_max_message_type)
            _options.accepted_types.insert (*it);
    }
    _options.filter_types = true;
}

jtp::decoder_t::decoder_t (const options_t &options_,
                           i_decoder_events *sink_) :
    _options (options_),
    _sink (sink_),
    _scheduler (NULL)
{
}

jtp::decoder_t::~decoder_t ()
{
}

bool jtp::decoder_t::accept (const unsigned char *data_, size_t size_)
{
    //  Cheapest check first; foreign traffic may share the transport.
    if (size_ < 1 || data_ == NULL || data_[0] != jtp_magic) {
        jtp_debug_inc_fragments_ignored ();
        return false;
    }

    header_t header;
    if (decode_header (data_, size_, header) == -1) {
        report (JTP_ERR_PACKET_TOO_SHORT, "packet too short: %u bytes",
                static_cast<unsigned> (size_));
        return false;
    }

    if (header.version != jtp_version) {
        report (JTP_ERR_UNSUPPORTED_VERSION, "unsupported version: %u",
                static_cast<unsigned> (header.version));
        return false;
    }

    //  Other sources multiplexed on the same transport, and types this
    //  decoder does not listen to, are not errors.
    if (header.source_id != _options.source_id
        || !_options.accepts (header.message_type)) {
        jtp_debug_inc_fragments_ignored ();
        return false;
    }

    const size_t payload_size = size_ - jtp_header_size;
    if (header.fragment_count == 0
        || header.fragment_index >= header.fragment_count
        || payload_size > _options.max_payload_size) {
        report (JTP_ERR_INVALID_FRAGMENT,
                "invalid fragment: idx=%u, cnt=%u, size=%u",
                static_cast<unsigned> (header.fragment_index),
                static_cast<unsigned> (header.fragment_count),
                static_cast<unsigned> (payload_size));
        return false;
    }

    //  Smallest message the sender can have meant by this fragment count.
    if (_options.max_message_size >= 0) {
        const uint64_t claimed =
          static_cast<uint64_t> (header.fragment_count - 1)
          * _options.max_payload_size;
        if (claimed > static_cast<uint64_t> (_options.max_message_size)) {
            report (JTP_ERR_INVALID_FRAGMENT,
                    "invalid fragment: cnt=%u exceeds message size limit",
                    static_cast<unsigned> (header.fragment_count));
            return false;
        }
    }

    accumulator_t *acc = select_accumulator (header);
    if (!acc)
        return false;

    if (acc->fragments.find (header.fragment_index) != acc->fragments.end ()) {
        report (JTP_ERR_DUPLICATE_FRAGMENT,
                "duplicate fragment %u for message %u",
                static_cast<unsigned> (header.fragment_index),
                static_cast<unsigned> (header.message_id));
        return false;
    }

    acc->fragments[header.fragment_index].assign (data_ + jtp_header_size,
                                                  data_ + size_);
    acc->fragments_received++;
    acc->total_bytes += payload_size;

    if (unlikely (acc->fragments_received > acc->fragment_count)) {
        const uint32_t received = acc->fragments_received;
        const uint16_t count = acc->fragment_count;
        _accumulators.erase (header.message_type);
        report (JTP_ERR_FRAGMENT_COUNT_EXCEEDED,
                "fragment count exceeded: %u > %u",
                static_cast<unsigned> (received),
                static_cast<unsigned> (count));
        return false;
    }

    jtp_debug_inc_fragments_accepted ();

    const uint16_t received = static_cast<uint16_t> (acc->fragments_received);
    const bool complete = acc->fragments_received == acc->fragment_count;
    const bool defer = complete && should_defer (*acc);
    if (defer)
        acc->reassembly_pending = true;

    if (_sink) {
        fragment_info_t info;
        info.message_type = header.message_type;
        info.message_id = header.message_id;
        info.fragment_index = header.fragment_index;
        info.fragment_count = header.fragment_count;
        _sink->fragment_received (info, received);
    }

    if (complete) {
        if (defer) {
            jtp_debug_inc_deferred_reassemblies ();
            _scheduler->schedule_reassembly (this, header.message_type,
                                             header.message_id);
        } else {
            const accumulators_t::iterator it =
              _accumulators.find (header.message_type);
            if (it != _accumulators.end ())
                reassemble (it);
        }
    }

    return true;
}

jtp::decoder_t::accumulator_t *
jtp::decoder_t::select_accumulator (const header_t &header_)
{
    accumulators_t::iterator it = _accumulators.find (header_.message_type);

    if (it != _accumulators.end ()) {
        accumulator_t &acc = it->second;
        if (acc.message_id == header_.message_id)
            return &acc;

        //  Leftover of an older message.
        if (jtp_is_newer_id (acc.message_id, header_.message_id)) {
            jtp_debug_inc_fragments_ignored ();
            return NULL;
        }

        //  Exactly half the id space away: neither newer nor older.
        if (!jtp_is_newer_id (header_.message_id, acc.message_id)) {
            report (JTP_ERR_MESSAGE_ID_MISMATCH,
                    "message id mismatch: expected %u, got %u",
                    static_cast<unsigned> (acc.message_id),
                    static_cast<unsigned> (header_.message_id));
            return NULL;
        }

        //  Every fragment is in, only the deferred copy is outstanding.
        //  Deliver it now; the sink may have started another message of
        //  this type from message_complete, so look again afterwards.
        if (acc.reassembly_pending) {
            reassemble (it);
            return select_accumulator (header_);
        }

        jtp_debug_inc_messages_abandoned ();
        if (_sink)
            _sink->message_incomplete (
              header_.message_type, acc.message_id,
              static_cast<uint16_t> (acc.fragments_received),
              acc.fragment_count);
    } else {
        it = _accumulators
               .insert (accumulators_t::value_type (header_.message_type,
                                                    accumulator_t ()))
               .first;
    }

    accumulator_t &acc = it->second;
    acc.message_id = header_.message_id;
    acc.fragment_count = header_.fragment_count;
    acc.fragments_received = 0;
    acc.total_bytes = 0;
    acc.reassembly_pending = false;
    acc.fragments.clear ();

    if (_sink)
        _sink->message_start (header_.message_type, header_.message_id,
                              header_.fragment_count);
    return &acc;
}

bool jtp::decoder_t::should_defer (const accumulator_t &acc_) const
{
    if (!_scheduler)
        return false;
    return acc_.fragment_count > _options.defer_fragments
           || static_cast<int64_t> (acc_.total_bytes) > _options.defer_bytes;
}

bool jtp::decoder_t::reassemble (uint8_t message_type_, uint16_t message_id_)
{
    const accumulators_t::iterator it = _accumulators.find (message_type_);
    if (it == _accumulators.end ())
        return false;

    const accumulator_t &acc = it->second;
    if (acc.message_id != message_id_ || !acc.reassembly_pending
        || acc.fragments_received != acc.fragment_count)
        return false;

    return reassemble (it);
}

bool jtp::decoder_t::reassemble (accumulators_t::iterator it_)
{
    const uint8_t message_type = it_->first;
    const accumulator_t &acc = it_->second;

    message_meta_t meta;
    meta.message_id = acc.message_id;
    meta.fragment_count = acc.fragment_count;
    meta.total_bytes = acc.total_bytes;

    std::vector<unsigned char> payload;
    payload.reserve (acc.total_bytes);
    for (uint32_t i = 0; i < acc.fragment_count; i++) {
        const accumulator_t::fragments_t::const_iterator fragment =
          acc.fragments.find (static_cast<uint16_t> (i));
        if (unlikely (fragment == acc.fragments.end ())) {
            _accumulators.erase (it_);
            report (JTP_ERR_REASSEMBLY_FAILED,
                    "reassembly failed for message %u: missing fragment %u",
                    static_cast<unsigned> (meta.message_id),
                    static_cast<unsigned> (i));
            return false;
        }
        payload.insert (payload.end (), fragment->second.begin (),
                        fragment->second.end ());
    }

    //  Gone before the sink runs, so the sink may feed the decoder again.
    _accumulators.erase (it_);
    jtp_debug_inc_messages_completed ();

    if (_sink)
        _sink->message_complete (message_type, payload, meta);
    return true;
}

void jtp::decoder_t::reset (uint8_t message_type_)
{
    _accumulators.erase (message_type_);
}

void jtp::decoder_t::reset ()
{
    _accumulators.clear ();
}

bool jtp::decoder_t::in_flight (uint8_t message_type_,
                                uint16_t *message_id_,
                                uint16_t *fragments_received_,
                                uint16_t *fragment_count_) const
{
    const accumulators_t::const_iterator it =
      _accumulators.find (message_type_);
    if (it == _accumulators.end ())
        return false;

    if (message_id_)
        *message_id_ = it->second.message_id;
    if (fragments_received_)
        *fragments_received_ =
          static_cast<uint16_t> (it->second.fragments_received);
    if (fragment_count_)
        *fragment_count_ = it->second.fragment_count;
    return true;
}

int jtp::decoder_t::setopt (int option_,
                            const void *optval_,
                            size_t optvallen_)
{
    //  The source is fixed for the lifetime of the decoder.
    if (option_ == JTP_SOURCE_ID) {
        errno = EINVAL;
        return -1;
    }
    return _options.setopt (option_, optval_, optvallen_);
}

int jtp::decoder_t::getopt (int option_,
                            void *optval_,
                            size_t *optvallen_) const
{
    return _options.getopt (option_, optval_, optvallen_);
}

void jtp::decoder_t::report (int code_, const char *format_, ...)
{
    jtp_debug_inc_errors_reported ();
    if (!_sink)
        return;

    char reason[128];
    va_list args;
    va_start (args, format_);
    vsnprintf (reason, sizeof (reason), format_, args);
    va_end (args);

    _sink->error (code_, reason);
}
