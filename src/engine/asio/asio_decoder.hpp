/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __JTP_ASIO_DECODER_HPP_INCLUDED__
#define __JTP_ASIO_DECODER_HPP_INCLUDED__

#include <functional>
#include <memory>
#include <vector>

#include <boost/asio.hpp>

#include "core/options.hpp"
#include "protocol/i_events.hpp"
#include "protocol/jtp_decoder.hpp"

namespace jtp
{
//  Runs a decoder on a Boost.Asio io_context. Large messages are
//  reassembled on a later turn of the io_context, and batches of datagrams
//  are accepted in groups, giving other handlers a turn in between. Both
//  produce the same events as calling decoder_t::accept in order.
//
//  All calls, and io_context::run, must happen on one thread. The object
//  must outlive every handler it posted.
class asio_decoder_t JTP_FINAL : public i_reassembly_scheduler
{
  public:
    typedef std::vector<std::vector<unsigned char> > packets_t;

    //  Receives the number of datagrams accept returned true for.
    typedef std::function<void (size_t processed_)> batch_handler_t;

    asio_decoder_t (boost::asio::io_context &io_context_,
                    const options_t &options_,
                    i_decoder_events *sink_);
    ~asio_decoder_t () JTP_OVERRIDE;

    decoder_t &decoder () { return _decoder; }

    //  Accepts packets_ batch_size_ at a time, posting the remainder after
    //  each group. handler_ runs once every packet has been fed.
    void async_accept_batch (const packets_t &packets_,
                             size_t batch_size_,
                             batch_handler_t handler_);

    //  i_reassembly_scheduler implementation.
    void schedule_reassembly (decoder_t *decoder_,
                              uint8_t message_type_,
                              uint16_t message_id_) JTP_OVERRIDE;

  private:
    struct batch_t
    {
        packets_t packets;
        size_t next;
        size_t batch_size;
        size_t processed;
        batch_handler_t handler;
    };

    void accept_step (const std::shared_ptr<batch_t> &batch_);

    boost::asio::io_context &_io_context;
    decoder_t _decoder;

    JTP_NON_COPYABLE_NOR_MOVABLE (asio_decoder_t)
};
}

#endif
