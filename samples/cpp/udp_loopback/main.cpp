// Sends a handful of JTP messages over a UDP socket on 127.0.0.1 and
// reassembles them with several decoders listening to the same datagrams.
//
//   udp_loopback [--port N] [--max-payload N]

#include <jtp.h>
#include "engine/asio/asio_decoder.hpp"
#include "engine/asio/asio_encoder.hpp"

#include <boost/asio.hpp>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace sample {

// Prints what a decoder sees, tagged with the decoder's name.
class PrintingSink : public jtp::i_decoder_events {
public:
    PrintingSink(const std::string& name, bool verbose)
        : name_(name), verbose_(verbose), completed_(0) {}

    void message_start(uint8_t type, uint16_t id, uint16_t count) override {
        if (verbose_)
            std::printf("[%s] start type=%u id=%u fragments=%u\n", name_.c_str(),
                        type, id, count);
    }

    void fragment_received(const jtp::fragment_info_t& info,
                           uint16_t received) override {
        if (verbose_)
            std::printf("[%s]   fragment %u/%u (%u/%u received)\n",
                        name_.c_str(), info.fragment_index,
                        info.fragment_count - 1, received, info.fragment_count);
    }

    void message_complete(uint8_t type, std::vector<unsigned char>& payload,
                          const jtp::message_meta_t& meta) override {
        ++completed_;
        std::string text(payload.begin(), payload.end());
        if (text.size() > 50)
            text = text.substr(0, 50) + "...";
        std::printf("[%s] message type=%u id=%u %zu bytes: \"%s\"\n",
                    name_.c_str(), type, meta.message_id, meta.total_bytes,
                    text.c_str());
    }

    void message_incomplete(uint8_t type, uint16_t id, uint16_t received,
                            uint16_t count) override {
        std::printf("[%s] abandoned type=%u id=%u (%u/%u)\n", name_.c_str(),
                    type, id, received, count);
    }

    void error(int code, const char* reason) override {
        std::fprintf(stderr, "[%s] error %d: %s\n", name_.c_str(), code, reason);
    }

    int completed() const { return completed_; }

private:
    std::string name_;
    bool verbose_;
    int completed_;
};

struct Outgoing {
    std::string data;
    int type;
};

}  // namespace sample

int main(int argc, char* argv[]) {
    unsigned short port = 0;
    int max_payload = JTP_MAX_PAYLOAD_DFLT;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--port" && i + 1 < argc) {
            port = static_cast<unsigned short>(std::atoi(argv[++i]));
        } else if (arg == "--max-payload" && i + 1 < argc) {
            max_payload = std::atoi(argv[++i]);
        }
    }

    const uint32_t source = 0x12345678;
    jtp::options_t options;
    options.source_id = source;
    if (options.setopt(JTP_MAX_PAYLOAD, &max_payload, sizeof(max_payload)) == -1) {
        std::fprintf(stderr, "bad max payload %d: %s\n", max_payload,
                     jtp_strerror(jtp_errno()));
        return 1;
    }

    boost::asio::io_context io_ctx;
    boost::asio::ip::udp::endpoint local(
        boost::asio::ip::address_v4::loopback(), port);

    boost::asio::ip::udp::socket receiver(io_ctx);
    boost::asio::ip::udp::socket sender(io_ctx);
    try {
        receiver.open(boost::asio::ip::udp::v4());
        receiver.bind(local);
        sender.open(boost::asio::ip::udp::v4());
    } catch (const boost::system::system_error& e) {
        std::fprintf(stderr, "socket setup failed: %s\n", e.what());
        return 1;
    }
    const boost::asio::ip::udp::endpoint target = receiver.local_endpoint();

    // Every decoder sees every datagram; the type filters and the source id
    // decide which messages each one assembles.
    sample::PrintingSink main_sink("MAIN", true);
    sample::PrintingSink control_sink("CONTROL", false);
    sample::PrintingSink data_sink("DATA", false);
    sample::PrintingSink other_sink("OTHER", false);

    jtp::options_t control_options = options;
    control_options.filter_types = true;
    control_options.accepted_types = {1, 2, 3};
    jtp::options_t data_options = options;
    data_options.filter_types = true;
    data_options.accepted_types = {10, 11, 12};
    jtp::options_t other_options = options;
    other_options.source_id = 0x87654321;

    jtp::asio_decoder_t main_decoder(io_ctx, options, &main_sink);
    jtp::asio_decoder_t control_decoder(io_ctx, control_options, &control_sink);
    jtp::asio_decoder_t data_decoder(io_ctx, data_options, &data_sink);
    jtp::asio_decoder_t other_decoder(io_ctx, other_options, &other_sink);
    jtp::asio_decoder_t* decoders[] = {&main_decoder, &control_decoder,
                                       &data_decoder, &other_decoder};

    const std::vector<sample::Outgoing> outgoing = {
        {"SYSTEM_READY", 1},
        {std::string(2500, 'D'), 10},
        {"CONFIG_UPDATE", 2},
        {"{\"sensor\":\"temp\",\"value\":23.5}", 11},
        {std::string(120000, 'B'), 12},
        {"SHUTDOWN", 3},
    };

    jtp::asio_encoder_t encoder(io_ctx, options);
    size_t sent_messages = 0;
    for (const sample::Outgoing& msg : outgoing) {
        const int rc = encoder.async_fragment(
            reinterpret_cast<const unsigned char*>(msg.data.data()),
            msg.data.size(), msg.type,
            [&](const unsigned char* data, size_t size) {
                boost::system::error_code ec;
                sender.send_to(boost::asio::buffer(data, size), target, 0, ec);
                if (ec)
                    std::fprintf(stderr, "send failed: %s\n", ec.message().c_str());
            },
            [&](const jtp::encode_summary_t& summary) {
                ++sent_messages;
                std::printf("sent type=%u id=%u in %u fragments\n",
                            summary.message_type, summary.message_id,
                            summary.fragment_count);
            });
        if (rc == -1) {
            std::fprintf(stderr, "cannot send type %d: %s\n", msg.type,
                         jtp_error_reason(encoder.encoder().last_error()));
            return 1;
        }
    }

    std::vector<unsigned char> buf(65536);
    boost::asio::ip::udp::endpoint from;
    std::function<void()> receive = [&]() {
        receiver.async_receive_from(
            boost::asio::buffer(buf), from,
            [&](const boost::system::error_code& ec, size_t size) {
                if (ec)
                    return;
                for (jtp::asio_decoder_t* decoder : decoders)
                    decoder->decoder().accept(&buf[0], size);
                if (main_sink.completed() < static_cast<int>(outgoing.size()))
                    receive();
            });
    };
    receive();

    // Loopback UDP can still drop datagrams under pressure; give up after a
    // while instead of waiting forever.
    boost::asio::steady_timer deadline(io_ctx, std::chrono::seconds(5));
    deadline.async_wait([&](const boost::system::error_code& ec) {
        if (!ec)
            receiver.cancel();
    });
    while (main_sink.completed() < static_cast<int>(outgoing.size())
           && io_ctx.run_one() > 0) {
    }
    deadline.cancel();

    std::printf("\nsent %zu messages, MAIN=%d CONTROL=%d DATA=%d OTHER=%d\n",
                sent_messages, main_sink.completed(), control_sink.completed(),
                data_sink.completed(), other_sink.completed());
    return main_sink.completed() == static_cast<int>(outgoing.size()) ? 0 : 1;
}
