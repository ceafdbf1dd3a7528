/* SPDX-License-Identifier: MPL-2.0 */

#include <algorithm>

#include "engine/asio/asio_decoder.hpp"
#include "utils/err.hpp"

jtp::asio_decoder_t::asio_decoder_t (boost::asio::io_context &io_context_,
                                     const options_t &options_,
                                     i_decoder_events *sink_) :
    _io_context (io_context_),
    _decoder (options_, sink_)
{
    _decoder.set_scheduler (this);
}

jtp::asio_decoder_t::~asio_decoder_t ()
{
    _decoder.set_scheduler (NULL);
}

void jtp::asio_decoder_t::schedule_reassembly (decoder_t *decoder_,
                                               uint8_t message_type_,
                                               uint16_t message_id_)
{
    jtp_assert (decoder_ == &_decoder);

    //  The decoder re-checks the message id, so a message preempted or
    //  reset in the meantime is simply dropped here.
    boost::asio::post (_io_context, [this, message_type_, message_id_] () {
        _decoder.reassemble (message_type_, message_id_);
    });
}

void jtp::asio_decoder_t::async_accept_batch (const packets_t &packets_,
                                              size_t batch_size_,
                                              batch_handler_t handler_)
{
    std::shared_ptr<batch_t> batch (new batch_t);
    batch->packets = packets_;
    batch->next = 0;
    batch->batch_size = batch_size_ > 0 ? batch_size_ : 1;
    batch->processed = 0;
    batch->handler = handler_;

    boost::asio::post (_io_context, [this, batch] () { accept_step (batch); });
}

void jtp::asio_decoder_t::accept_step (const std::shared_ptr<batch_t> &batch_)
{
    const size_t end =
      std::min (batch_->packets.size (), batch_->next + batch_->batch_size);

    for (; batch_->next < end; batch_->next++) {
        const std::vector<unsigned char> &packet =
          batch_->packets[batch_->next];
        if (_decoder.accept (packet.empty () ? NULL : &packet[0],
                             packet.size ()))
            batch_->processed++;
    }

    if (batch_->next < batch_->packets.size ()) {
        std::shared_ptr<batch_t> batch = batch_;
        boost::asio::post (_io_context,
                           [this, batch] () { accept_step (batch); });
        return;
    }

    if (batch_->handler)
        batch_->handler (batch_->processed);
}
