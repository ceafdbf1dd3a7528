/* SPDX-License-Identifier: MPL-2.0 */

#include <string.h>
#include <algorithm>

#include "protocol/jtp_encoder.hpp"
#include "protocol/header.hpp"
#include "utils/err.hpp"
#include "jtp_debug.h"

jtp::fragment_stream_t::fragment_stream_t () :
    _data (NULL),
    _size (0),
    _max_payload (jtp_default_max_payload),
    _source_id (0),
    _message_type (0),
    _message_id (0),
    _fragment_count (0),
    _next_index (0),
    _sink (NULL)
{
}

jtp::fragment_stream_t::~fragment_stream_t ()
{
}

void jtp::fragment_stream_t::arm (const options_t &options_,
                                  i_encoder_events *sink_,
                                  const unsigned char *data_,
                                  size_t size_,
                                  uint8_t message_type_,
                                  uint16_t message_id_,
                                  uint32_t fragment_count_)
{
    _data = data_;
    _size = size_;
    _max_payload = options_.max_payload_size;
    _source_id = options_.source_id;
    _message_type = message_type_;
    _message_id = message_id_;
    _fragment_count = fragment_count_;
    _next_index = 0;
    _sink = sink_;

    //  Never larger than one full fragment.
    const size_t largest = jtp_header_size + std::min (_size, _max_payload);
    if (_buf.size () < largest)
        _buf.resize (largest);
}

size_t jtp::fragment_stream_t::next_size () const
{
    if (done ())
        return 0;
    const size_t offset = static_cast<size_t> (_next_index) * _max_payload;
    return jtp_header_size + std::min (_max_payload, _size - offset);
}

size_t jtp::fragment_stream_t::encode (unsigned char **data_, size_t size_)
{
    if (done ())
        return 0;

    if (*data_ != NULL && size_ < next_size ()) {
        errno = ENOBUFS;
        return 0;
    }

    unsigned char *buffer = *data_ != NULL ? *data_ : &_buf[0];
    const size_t written = fragment_ready (buffer);
    *data_ = buffer;
    return written;
}

size_t jtp::fragment_stream_t::fragment_ready (unsigned char *buf_)
{
    const size_t offset = static_cast<size_t> (_next_index) * _max_payload;
    const size_t length = std::min (_max_payload, _size - offset);

    const int rc = encode_header (
      jtp_version, _message_type, _message_id,
      static_cast<uint16_t> (_next_index),
      static_cast<uint16_t> (_fragment_count), _source_id, buf_);
    errno_assert (rc == 0);
    if (length > 0)
        memcpy (buf_ + jtp_header_size, _data + offset, length);

    fragment_info_t info;
    info.message_type = _message_type;
    info.message_id = _message_id;
    info.fragment_index = static_cast<uint16_t> (_next_index);
    info.fragment_count = static_cast<uint16_t> (_fragment_count);

    _next_index++;
    jtp_debug_inc_fragments_encoded ();

    const size_t written = jtp_header_size + length;
    if (_sink) {
        _sink->fragment_produced (info, buf_, written);
        if (done ()) {
            encode_summary_t summary;
            summary.message_id = _message_id;
            summary.message_type = _message_type;
            summary.fragment_count = static_cast<uint16_t> (_fragment_count);
            summary.total_bytes = _size;
            _sink->message_encoded (summary);
        }
    }
    return written;
}

jtp::encoder_t::encoder_t (uint32_t source_id_, i_encoder_events *sink_) :
    _sink (sink_),
    _message_id (0),
    _last_error (0)
{
    _options.source_id = source_id_;
}

jtp::encoder_t::encoder_t (const options_t &options_,
                           i_encoder_events *sink_) :
    _options (options_),
    _sink (sink_),
    _message_id (0),
    _last_error (0)
{
}

jtp::encoder_t::~encoder_t ()
{
}

int jtp::encoder_t::fail (int code_, int errno_)
{
    _last_error = code_;
    errno = errno_;
    return -1;
}

int jtp::encoder_t::fragment (const unsigned char *data_,
                              size_t size_,
                              int message_type_,
                              fragment_stream_t &stream_)
{
    if (message_type_ < 0 || message_type_ > jtp_max_message_type)
        return fail (JTP_ERR_INVALID_MESSAGE_TYPE, EINVAL);

    if (data_ == NULL && size_ > 0)
        return fail (JTP_ERR_INVALID_INPUT_TYPE, EFAULT);

    const size_t fragment_count =
      jtp_fragment_count (size_, _options.max_payload_size);
    if (fragment_count > jtp_max_fragment_count)
        return fail (JTP_ERR_MESSAGE_TOO_LARGE, EMSGSIZE);

    //  The id is consumed here, once, before any fragment is produced.
    const uint16_t message_id = _message_id;
    _message_id = static_cast<uint16_t> (_message_id + 1);
    _last_error = 0;

    stream_.arm (_options, _sink, data_, size_,
                 static_cast<uint8_t> (message_type_), message_id,
                 static_cast<uint32_t> (fragment_count));
    return static_cast<int> (fragment_count);
}

int jtp::encoder_t::fragment_all (
  const unsigned char *data_,
  size_t size_,
  int message_type_,
  std::vector<std::vector<unsigned char> > &fragments_)
{
    fragment_stream_t stream;
    const int rc = fragment (data_, size_, message_type_, stream);
    if (rc == -1)
        return -1;

    fragments_.clear ();
    fragments_.reserve (static_cast<size_t> (rc));
    while (!stream.done ()) {
        unsigned char *data = NULL;
        const size_t size = stream.encode (&data, 0);
        fragments_.push_back (std::vector<unsigned char> (data, data + size));
    }
    return rc;
}

int jtp::encoder_t::setopt (int option_,
                            const void *optval_,
                            size_t optvallen_)
{
    //  The source is fixed for the lifetime of the encoder.
    if (option_ == JTP_SOURCE_ID) {
        errno = EINVAL;
        return -1;
    }
    return _options.setopt (option_, optval_, optvallen_);
}

int jtp::encoder_t::getopt (int option_,
                            void *optval_,
                            size_t *optvallen_) const
{
    return _options.getopt (option_, optval_, optvallen_);
}
