/* SPDX-License-Identifier: MPL-2.0 */

#include <string.h>
#include <new>

#include "api/jtp_handles.hpp"
#include "protocol/jtp_protocol.hpp"
#include "utils/err.hpp"

jtp::encoder_handle_t::encoder_handle_t (uint32_t source_id_) :
    encoder (source_id_, &sink),
    _tag (0xcafe0e0c)
{
}

jtp::encoder_handle_t::~encoder_handle_t ()
{
    _tag = 0xdeadbeef;
}

jtp::decoder_handle_t::decoder_handle_t (uint32_t source_id_) :
    decoder (source_id_, &sink),
    _tag (0xcafe0dec)
{
}

jtp::decoder_handle_t::~decoder_handle_t ()
{
    _tag = 0xdeadbeef;
}

jtp::c_encoder_sink_t::c_encoder_sink_t () :
    _handler (NULL),
    _events (0),
    _hint (NULL)
{
}

void jtp::c_encoder_sink_t::set_handler (jtp_encoder_event_fn *handler_,
                                         int events_,
                                         void *hint_)
{
    _handler = handler_;
    _events = events_;
    _hint = hint_;
}

void jtp::c_encoder_sink_t::deliver (jtp_encoder_event_t &event_)
{
    if (_handler && (_events & event_.event))
        _handler (&event_, _hint);
}

void jtp::c_encoder_sink_t::fragment_produced (const fragment_info_t &info_,
                                               const unsigned char *data_,
                                               size_t size_)
{
    jtp_encoder_event_t event;
    memset (&event, 0, sizeof (event));
    event.event = JTP_EVENT_FRAGMENT_PRODUCED;
    event.message_type = info_.message_type;
    event.message_id = info_.message_id;
    event.fragment_index = info_.fragment_index;
    event.fragment_count = info_.fragment_count;
    event.data = data_;
    event.size = size_;
    deliver (event);
}

void jtp::c_encoder_sink_t::message_encoded (const encode_summary_t &summary_)
{
    jtp_encoder_event_t event;
    memset (&event, 0, sizeof (event));
    event.event = JTP_EVENT_MESSAGE_ENCODED;
    event.message_type = summary_.message_type;
    event.message_id = summary_.message_id;
    event.fragment_count = summary_.fragment_count;
    event.total_bytes = summary_.total_bytes;
    deliver (event);
}

jtp::c_event_sink_t::c_event_sink_t () :
    _handler (NULL),
    _events (0),
    _hint (NULL)
{
}

void jtp::c_event_sink_t::set_handler (jtp_event_fn *handler_,
                                       int events_,
                                       void *hint_)
{
    _handler = handler_;
    _events = events_;
    _hint = hint_;
}

void jtp::c_event_sink_t::deliver (jtp_decoder_event_t &event_)
{
    if (_handler && (_events & event_.event))
        _handler (&event_, _hint);
}

static void init_event (jtp_decoder_event_t &event_, int type_)
{
    memset (&event_, 0, sizeof (event_));
    event_.event = type_;
}

void jtp::c_event_sink_t::message_start (uint8_t message_type_,
                                         uint16_t message_id_,
                                         uint16_t fragment_count_)
{
    jtp_decoder_event_t event;
    init_event (event, JTP_EVENT_MESSAGE_START);
    event.message_type = message_type_;
    event.message_id = message_id_;
    event.fragment_count = fragment_count_;
    deliver (event);
}

void jtp::c_event_sink_t::fragment_received (const fragment_info_t &info_,
                                             uint16_t fragments_received_)
{
    jtp_decoder_event_t event;
    init_event (event, JTP_EVENT_FRAGMENT_RECEIVED);
    event.message_type = info_.message_type;
    event.message_id = info_.message_id;
    event.fragment_index = info_.fragment_index;
    event.fragment_count = info_.fragment_count;
    event.fragments_received = fragments_received_;
    deliver (event);
}

void jtp::c_event_sink_t::message_complete (
  uint8_t message_type_,
  std::vector<unsigned char> &payload_,
  const message_meta_t &meta_)
{
    jtp_decoder_event_t event;
    init_event (event, JTP_EVENT_MESSAGE_COMPLETE);
    event.message_type = message_type_;
    event.message_id = meta_.message_id;
    event.fragment_count = meta_.fragment_count;
    event.fragments_received = meta_.fragment_count;
    event.total_bytes = meta_.total_bytes;
    event.data = payload_.empty () ? NULL : &payload_[0];
    event.size = payload_.size ();
    deliver (event);
}

void jtp::c_event_sink_t::message_incomplete (uint8_t message_type_,
                                              uint16_t message_id_,
                                              uint16_t fragments_received_,
                                              uint16_t fragment_count_)
{
    jtp_decoder_event_t event;
    init_event (event, JTP_EVENT_MESSAGE_INCOMPLETE);
    event.message_type = message_type_;
    event.message_id = message_id_;
    event.fragments_received = fragments_received_;
    event.fragment_count = fragment_count_;
    deliver (event);
}

void jtp::c_event_sink_t::error (int code_, const char *reason_)
{
    jtp_decoder_event_t event;
    init_event (event, JTP_EVENT_ERROR);
    event.message_type = -1;
    event.error = code_;
    event.reason = reason_;
    deliver (event);
}

static inline jtp::encoder_handle_t *as_encoder_handle (void *encoder_)
{
    jtp::encoder_handle_t *handle =
      static_cast<jtp::encoder_handle_t *> (encoder_);
    if (!handle || !handle->check_tag ()) {
        errno = EFAULT;
        return NULL;
    }
    return handle;
}

static inline jtp::decoder_handle_t *as_decoder_handle (void *decoder_)
{
    jtp::decoder_handle_t *handle =
      static_cast<jtp::decoder_handle_t *> (decoder_);
    if (!handle || !handle->check_tag ()) {
        errno = EFAULT;
        return NULL;
    }
    return handle;
}

void jtp_version (int *major_, int *minor_, int *patch_)
{
    *major_ = JTP_VERSION_MAJOR;
    *minor_ = JTP_VERSION_MINOR;
    *patch_ = JTP_VERSION_PATCH;
}

const char *jtp_strerror (int errnum_)
{
    return jtp::errno_to_string (errnum_);
}

int jtp_errno (void)
{
    return errno;
}

const char *jtp_error_reason (int code_)
{
    return jtp::jtp_error_reason (code_);
}

//  Encoder API

void *jtp_encoder_new (uint32_t source_id_)
{
    jtp::encoder_handle_t *handle =
      new (std::nothrow) jtp::encoder_handle_t (source_id_);
    if (!handle)
        errno = ENOMEM;
    return handle;
}

int jtp_encoder_close (void *encoder_)
{
    jtp::encoder_handle_t *handle = as_encoder_handle (encoder_);
    if (!handle)
        return -1;
    delete handle;
    return 0;
}

int jtp_encoder_setopt (void *encoder_,
                        int option_,
                        const void *optval_,
                        size_t optvallen_)
{
    jtp::encoder_handle_t *handle = as_encoder_handle (encoder_);
    if (!handle)
        return -1;
    return handle->encoder.setopt (option_, optval_, optvallen_);
}

int jtp_encoder_getopt (void *encoder_,
                        int option_,
                        void *optval_,
                        size_t *optvallen_)
{
    jtp::encoder_handle_t *handle = as_encoder_handle (encoder_);
    if (!handle)
        return -1;
    return handle->encoder.getopt (option_, optval_, optvallen_);
}

int jtp_encoder_set_handler (void *encoder_,
                             jtp_encoder_event_fn *handler_,
                             int events_,
                             void *hint_)
{
    jtp::encoder_handle_t *handle = as_encoder_handle (encoder_);
    if (!handle)
        return -1;
    if (events_ & ~JTP_EVENT_ENCODER_ALL) {
        errno = EINVAL;
        return -1;
    }
    handle->sink.set_handler (handler_, events_, hint_);
    return 0;
}

int jtp_encoder_fragment (void *encoder_,
                          const void *data_,
                          size_t size_,
                          int message_type_)
{
    jtp::encoder_handle_t *handle = as_encoder_handle (encoder_);
    if (!handle)
        return -1;
    return handle->encoder.fragment (static_cast<const unsigned char *> (data_),
                                     size_, message_type_, handle->stream);
}

int jtp_encoder_next (void *encoder_, void *buf_, size_t size_)
{
    jtp::encoder_handle_t *handle = as_encoder_handle (encoder_);
    if (!handle)
        return -1;
    if (!buf_) {
        errno = EFAULT;
        return -1;
    }
    if (handle->stream.done ())
        return 0;

    unsigned char *data = static_cast<unsigned char *> (buf_);
    const size_t written = handle->stream.encode (&data, size_);
    if (written == 0)
        return -1;
    return static_cast<int> (written);
}

//  Decoder API

void *jtp_decoder_new (uint32_t source_id_)
{
    jtp::decoder_handle_t *handle =
      new (std::nothrow) jtp::decoder_handle_t (source_id_);
    if (!handle)
        errno = ENOMEM;
    return handle;
}

int jtp_decoder_close (void *decoder_)
{
    jtp::decoder_handle_t *handle = as_decoder_handle (decoder_);
    if (!handle)
        return -1;
    delete handle;
    return 0;
}

int jtp_decoder_setopt (void *decoder_,
                        int option_,
                        const void *optval_,
                        size_t optvallen_)
{
    jtp::decoder_handle_t *handle = as_decoder_handle (decoder_);
    if (!handle)
        return -1;
    return handle->decoder.setopt (option_, optval_, optvallen_);
}

int jtp_decoder_getopt (void *decoder_,
                        int option_,
                        void *optval_,
                        size_t *optvallen_)
{
    jtp::decoder_handle_t *handle = as_decoder_handle (decoder_);
    if (!handle)
        return -1;
    return handle->decoder.getopt (option_, optval_, optvallen_);
}

int jtp_decoder_set_handler (void *decoder_,
                             jtp_event_fn *handler_,
                             int events_,
                             void *hint_)
{
    jtp::decoder_handle_t *handle = as_decoder_handle (decoder_);
    if (!handle)
        return -1;
    if (events_ & ~JTP_EVENT_ALL) {
        errno = EINVAL;
        return -1;
    }
    handle->sink.set_handler (handler_, events_, hint_);
    return 0;
}

int jtp_decoder_accept (void *decoder_, const void *data_, size_t size_)
{
    jtp::decoder_handle_t *handle = as_decoder_handle (decoder_);
    if (!handle)
        return -1;
    return handle->decoder.accept (static_cast<const unsigned char *> (data_),
                                   size_)
             ? 1
             : 0;
}

int jtp_decoder_reset (void *decoder_, int message_type_)
{
    jtp::decoder_handle_t *handle = as_decoder_handle (decoder_);
    if (!handle)
        return -1;
    if (message_type_ == -1) {
        handle->decoder.reset ();
        return 0;
    }
    if (message_type_ < 0 || message_type_ > jtp::jtp_max_message_type) {
        errno = EINVAL;
        return -1;
    }
    handle->decoder.reset (static_cast<uint8_t> (message_type_));
    return 0;
}
