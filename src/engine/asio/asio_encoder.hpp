/* SPDX-License-Identifier: MPL-2.0 */

#ifndef __JTP_ASIO_ENCODER_HPP_INCLUDED__
#define __JTP_ASIO_ENCODER_HPP_INCLUDED__

#include <functional>
#include <memory>
#include <vector>

#include <boost/asio.hpp>

#include "core/options.hpp"
#include "protocol/i_events.hpp"
#include "protocol/jtp_encoder.hpp"

namespace jtp
{
//  Produces the fragments of a message on a Boost.Asio io_context, a
//  group at a time, so that long messages do not starve other handlers.
//  The message id is taken when async_fragment is called, not when the
//  first fragment goes out.
//
//  All calls, and io_context::run, must happen on one thread. The object
//  must outlive every handler it posted.
class asio_encoder_t
{
  public:
    //  Called for every fragment; the data is valid only during the call.
    typedef std::function<void (const unsigned char *data_, size_t size_)>
      packet_handler_t;

    //  Called after the last fragment with the message summary.
    typedef std::function<void (const encode_summary_t &summary_)>
      completion_handler_t;

    asio_encoder_t (boost::asio::io_context &io_context_,
                    const options_t &options_,
                    i_encoder_events *sink_ = NULL);
    ~asio_encoder_t ();

    encoder_t &encoder () { return _encoder; }

    //  Copies the payload and schedules its fragmentation. Returns the
    //  fragment count, or -1 with errno set as encoder_t::fragment does, in
    //  which case no handler is ever called.
    int async_fragment (const unsigned char *data_,
                        size_t size_,
                        int message_type_,
                        packet_handler_t packet_handler_,
                        completion_handler_t completion_handler_);

  private:
    struct job_t
    {
        std::vector<unsigned char> payload;
        fragment_stream_t stream;
        size_t group_size;
        packet_handler_t packet_handler;
        completion_handler_t completion_handler;
    };

    void fragment_step (const std::shared_ptr<job_t> &job_);

    boost::asio::io_context &_io_context;
    encoder_t _encoder;

    JTP_NON_COPYABLE_NOR_MOVABLE (asio_encoder_t)
};
}

#endif
