#pragma once
#include <asio.hpp>

#include <array>
#include <atomic>
#include <deque>
#include <memory>
#include <string>
#include <unordered_map>

#include "log.hpp"
#include "transport.hpp"

// IRC client connection with raw DCC receive streams, all driven by one
// asio::io_context. Every piece of state below is only touched on the thread
// running run().
class IrcTransport : public Transport {
public:
    explicit IrcTransport(std::shared_ptr<Logger> logger = nullptr);
    ~IrcTransport() override;

    IrcTransport(const IrcTransport&) = delete;
    IrcTransport& operator=(const IrcTransport&) = delete;

    void set_events(Events events) override;
    void connect(const std::string& host, uint16_t port, const std::string& nickname) override;
    void join(const std::string& channel) override;
    void send_ctcp(const std::string& target, const std::string& payload) override;
    BinaryId open_binary(const std::string& address, uint16_t port) override;
    void close_binary(BinaryId id) override;
    void disconnect() override;
    void run() override;
    void stop() override;

private:
    using tcp = asio::ip::tcp;

    struct BinaryStream {
        explicit BinaryStream(asio::io_context& io) : socket(io) {}
        tcp::socket socket;
        std::array<char, 16 * 1024> buffer{};
        uint64_t received = 0;
        bool closed = false;
    };

    void do_read();
    void handle_line(const std::string& line);
    void handle_ctcp(const std::string& command, const std::string& from, const std::string& body);
    void send_line(std::string line);
    void do_write();
    void fail(const std::string& reason);

    void read_binary(BinaryId id, std::shared_ptr<BinaryStream> stream);
    void finish_binary(BinaryId id);
    void acknowledge(BinaryStream& stream);

    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    tcp::resolver resolver_;
    tcp::socket socket_;
    asio::streambuf read_buf_;
    std::deque<std::string> write_queue_;
    std::unordered_map<BinaryId, std::shared_ptr<BinaryStream>> binaries_;
    std::atomic<BinaryId> next_binary_id_{1};
    Events events_;
    std::string nickname_;
    bool welcomed_ = false;
    bool quitting_ = false;
    bool disconnect_reported_ = false;
    std::shared_ptr<Logger> logger_;
};
