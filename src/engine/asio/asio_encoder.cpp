/* SPDX-License-Identifier: MPL-2.0 */

#include "engine/asio/asio_encoder.hpp"
#include "utils/err.hpp"

namespace
{
//  Above this many fragments every fragment gets its own turn.
const int yield_every_fragment_threshold = 100;
}

jtp::asio_encoder_t::asio_encoder_t (boost::asio::io_context &io_context_,
                                     const options_t &options_,
                                     i_encoder_events *sink_) :
    _io_context (io_context_),
    _encoder (options_, sink_)
{
}

jtp::asio_encoder_t::~asio_encoder_t ()
{
}

int jtp::asio_encoder_t::async_fragment (
  const unsigned char *data_,
  size_t size_,
  int message_type_,
  packet_handler_t packet_handler_,
  completion_handler_t completion_handler_)
{
    std::shared_ptr<job_t> job (new job_t);
    if (data_ != NULL)
        job->payload.assign (data_, data_ + size_);

    //  Validation and the message id increment happen here, synchronously.
    const int rc = _encoder.fragment (
      job->payload.empty () ? data_ : &job->payload[0], size_,
      message_type_, job->stream);
    if (rc == -1)
        return -1;

    const int yield_interval = _encoder.options ().yield_interval;
    job->group_size = rc > yield_every_fragment_threshold || yield_interval < 1
                        ? 1
                        : static_cast<size_t> (yield_interval);
    job->packet_handler = packet_handler_;
    job->completion_handler = completion_handler_;

    boost::asio::post (_io_context, [this, job] () { fragment_step (job); });
    return rc;
}

void jtp::asio_encoder_t::fragment_step (const std::shared_ptr<job_t> &job_)
{
    for (size_t i = 0; i < job_->group_size && !job_->stream.done (); i++) {
        unsigned char *data = NULL;
        const size_t size = job_->stream.encode (&data, 0);
        errno_assert (size > 0);
        if (job_->packet_handler)
            job_->packet_handler (data, size);
    }

    if (!job_->stream.done ()) {
        std::shared_ptr<job_t> job = job_;
        boost::asio::post (_io_context, [this, job] () { fragment_step (job); });
        return;
    }

    if (job_->completion_handler) {
        encode_summary_t summary;
        summary.message_id = job_->stream.message_id ();
        summary.message_type = job_->stream.message_type ();
        summary.fragment_count = job_->stream.fragment_count ();
        summary.total_bytes = job_->payload.size ();
        job_->completion_handler (summary);
    }
}
