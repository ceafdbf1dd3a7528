/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __JTP_ENCODER_HPP_INCLUDED__
#define __JTP_ENCODER_HPP_INCLUDED__

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "core/options.hpp"
#include "protocol/i_encoder.hpp"
#include "protocol/i_events.hpp"
#include "protocol/jtp_protocol.hpp"

namespace jtp
{
//  Lazy sequence of wire fragments for one message, armed by
//  encoder_t::fragment. Each encode call yields exactly one datagram.
//
//  BUFFER LIFETIME POLICY:
//  The stream reads the payload straight from the caller's memory, which
//  must stay valid until encode has returned 0. When encode writes into the
//  stream's own buffer (data_ is NULL) the returned pointer is valid only
//  until the next encode call.
class fragment_stream_t JTP_FINAL : public i_encoder
{
  public:
    fragment_stream_t ();
    ~fragment_stream_t () JTP_OVERRIDE;

    //  i_encoder implementation. If a supplied buffer is smaller than
    //  next_size, returns 0 with errno set to ENOBUFS and does not advance.
    size_t encode (unsigned char **data_, size_t size_) JTP_OVERRIDE;
    size_t next_size () const JTP_OVERRIDE;

    //  True once every fragment has been produced, or if never armed.
    bool done () const { return _next_index >= _fragment_count; }

    uint16_t message_id () const { return _message_id; }
    uint8_t message_type () const { return _message_type; }
    uint16_t fragment_count () const
    {
        return static_cast<uint16_t> (_fragment_count);
    }

  private:
    friend class encoder_t;

    void arm (const options_t &options_,
              i_encoder_events *sink_,
              const unsigned char *data_,
              size_t size_,
              uint8_t message_type_,
              uint16_t message_id_,
              uint32_t fragment_count_);

    //  Writes fragment _next_index into buf_ and returns its size.
    size_t fragment_ready (unsigned char *buf_);

    //  Payload being fragmented.
    const unsigned char *_data;
    size_t _size;

    size_t _max_payload;
    uint32_t _source_id;
    uint8_t _message_type;
    uint16_t _message_id;
    uint32_t _fragment_count;
    uint32_t _next_index;

    i_encoder_events *_sink;

    //  Scratch space used when the caller supplies no buffer.
    std::vector<unsigned char> _buf;

    JTP_NON_COPYABLE_NOR_MOVABLE (fragment_stream_t)
};

//  Splits payloads into JTP fragments for one source. Owns the 16-bit
//  message id counter; every successfully started message consumes one id.
//  Not thread safe.
class encoder_t
{
  public:
    explicit encoder_t (uint32_t source_id_, i_encoder_events *sink_ = NULL);
    explicit encoder_t (const options_t &options_,
                        i_encoder_events *sink_ = NULL);
    ~encoder_t ();

    //  Validates the payload, takes the next message id and arms stream_.
    //  Returns the fragment count, or -1 with errno set to EINVAL (bad
    //  message type), EFAULT (NULL payload) or EMSGSIZE (more than 65535
    //  fragments). A failed call leaves the encoder untouched.
    int fragment (const unsigned char *data_,
                  size_t size_,
                  int message_type_,
                  fragment_stream_t &stream_);

    //  Same as fragment but collects every fragment into fragments_.
    int fragment_all (const unsigned char *data_,
                      size_t size_,
                      int message_type_,
                      std::vector<std::vector<unsigned char> > &fragments_);

    int setopt (int option_, const void *optval_, size_t optvallen_);
    int getopt (int option_, void *optval_, size_t *optvallen_) const;

    void set_sink (i_encoder_events *sink_) { _sink = sink_; }

    //  Id the next message will carry.
    uint16_t message_id () const { return _message_id; }
    uint32_t source_id () const { return _options.source_id; }
    const options_t &options () const { return _options; }

    //  JTP_ERR_* code of the last failed fragment call, 0 if none failed.
    int last_error () const { return _last_error; }

  private:
    int fail (int code_, int errno_);

    options_t _options;
    i_encoder_events *_sink;
    uint16_t _message_id;
    int _last_error;

    JTP_NON_COPYABLE_NOR_MOVABLE (encoder_t)
};
}

#endif
