#include "irc_transport.hpp"

#include <istream>

#include "protocol.hpp"
#include "utils.hpp"

namespace {
constexpr const char* kVersionReply = "VERSION xdccdl";
}

IrcTransport::IrcTransport(std::shared_ptr<Logger> logger)
  : work_(asio::make_work_guard(io_)),
    resolver_(io_),
    socket_(io_),
    logger_(std::move(logger)) {}

IrcTransport::~IrcTransport() {
  work_.reset();
  io_.stop();
}

void IrcTransport::set_events(Events events) {
  events_ = std::move(events);
}

void IrcTransport::run() {
  io_.run();
}

// Queued behind anything already posted, so a preceding disconnect() still
// gets its QUIT out.
void IrcTransport::stop() {
  asio::post(io_, [this](){
    work_.reset();
    io_.stop();
  });
}

void IrcTransport::connect(const std::string& host, uint16_t port, const std::string& nickname) {
  asio::post(io_, [this, host, port, nickname](){
    nickname_ = nickname;
    resolver_.async_resolve(host, std::to_string(port),
      [this, host, port](std::error_code ec, tcp::resolver::results_type results){
        if(ec) {
          fail("resolve failed for " + host + ":" + std::to_string(port) + ": " + ec.message());
          return;
        }
        asio::async_connect(socket_, results,
          [this](std::error_code ec, const tcp::endpoint& ep){
            if(ec) {
              fail("connect failed: " + ec.message());
              return;
            }
            log_debug(logger_.get(), "connected to {}:{}", ep.address().to_string(), ep.port());
            send_line("NICK " + nickname_);
            send_line("USER " + nickname_ + " 0 * :" + nickname_);
            do_read();
          });
      });
  });
}

void IrcTransport::join(const std::string& channel) {
  asio::post(io_, [this, channel](){ send_line("JOIN " + channel); });
}

void IrcTransport::send_ctcp(const std::string& target, const std::string& payload) {
  std::string line = "PRIVMSG " + target + " :" + kCtcpDelimiter + payload + kCtcpDelimiter;
  asio::post(io_, [this, line = std::move(line)]() mutable { send_line(std::move(line)); });
}

void IrcTransport::disconnect() {
  asio::post(io_, [this](){
    quitting_ = true;
    std::error_code ec;
    if(socket_.is_open()) {
      asio::write(socket_, asio::buffer(std::string("QUIT :bye\r\n")), ec);
      if(ec) log_debug(logger_.get(), "QUIT not delivered: {}", ec.message());
      socket_.close(ec);
    }
    std::vector<BinaryId> open;
    for(const auto& kv : binaries_) open.push_back(kv.first);
    for(auto id : open) finish_binary(id);
  });
}

void IrcTransport::do_read() {
  asio::async_read_until(socket_, read_buf_, "\n",
    [this](std::error_code ec, std::size_t){
      if(ec) {
        fail("read error: " + ec.message());
        return;
      }
      std::istream is(&read_buf_);
      std::string line;
      std::getline(is, line);
      if(!line.empty()) {
        handle_line(line);
      }
      do_read();
    });
}

void IrcTransport::handle_line(const std::string& line) {
  auto parsed = parse_irc_line(line);
  if(!parsed) return;
  const auto& msg = *parsed;

  if(msg.command == "PING") {
    send_line("PONG :" + (msg.params.empty() ? std::string() : msg.params.back()));
  } else if(msg.command == "001") {
    if(!msg.params.empty()) nickname_ = msg.params.front();
    welcomed_ = true;
    log_debug(logger_.get(), "welcomed as {}", nickname_);
    if(events_.on_welcome) events_.on_welcome();
  } else if(msg.command == "433" && !welcomed_) {
    nickname_ += "_";
    log_debug(logger_.get(), "nickname in use, retrying as {}", nickname_);
    send_line("NICK " + nickname_);
  } else if(msg.command == "JOIN") {
    if(!msg.params.empty() && iequals(msg.source_nick(), nickname_)) {
      if(events_.on_joined) events_.on_joined(msg.params.front());
    }
  } else if(msg.command == "PRIVMSG" || msg.command == "NOTICE") {
    if(msg.params.empty()) return;
    if(auto ctcp = ctcp_unwrap(msg.params.back())) {
      handle_ctcp(msg.command, msg.source_nick(), *ctcp);
    } else if(msg.command == "NOTICE") {
      log_debug(logger_.get(), "notice from {}: {}", msg.source_nick(), msg.params.back());
    }
  } else if(msg.command == "ERROR") {
    fail(msg.params.empty() ? std::string("server error") : msg.params.back());
  } else if(msg.command == "471" || msg.command == "473" ||
            msg.command == "474" || msg.command == "475") {
    log_warn(logger_.get(), "cannot join: {}", msg.params.empty() ? msg.command : msg.params.back());
  }
}

void IrcTransport::handle_ctcp(const std::string& command, const std::string& from, const std::string& body) {
  if(command == "PRIVMSG" && body == "VERSION") {
    send_line("NOTICE " + from + " :" + kCtcpDelimiter + kVersionReply + kCtcpDelimiter);
    return;
  }
  if(events_.on_ctcp) events_.on_ctcp(from, body);
}

void IrcTransport::send_line(std::string line) {
  if(!socket_.is_open()) {
    log_debug(logger_.get(), "dropping line, not connected: {}", line);
    return;
  }
  line += "\r\n";
  bool start_write = write_queue_.empty();
  write_queue_.push_back(std::move(line));
  if(start_write) {
    do_write();
  }
}

void IrcTransport::do_write() {
  if(write_queue_.empty()) return;
  asio::async_write(socket_, asio::buffer(write_queue_.front()),
    [this](std::error_code ec, std::size_t){
      if(ec) {
        fail("write error: " + ec.message());
        return;
      }
      write_queue_.pop_front();
      if(!write_queue_.empty()) {
        do_write();
      }
    });
}

void IrcTransport::fail(const std::string& reason) {
  std::error_code ec;
  socket_.close(ec);
  write_queue_.clear();
  if(quitting_ || disconnect_reported_) return;
  disconnect_reported_ = true;
  log_info(logger_.get(), "disconnected: {}", reason);
  if(events_.on_disconnected) events_.on_disconnected(reason);
}

BinaryId IrcTransport::open_binary(const std::string& address, uint16_t port) {
  BinaryId id = next_binary_id_++;
  asio::post(io_, [this, id, address, port](){
    auto stream = std::make_shared<BinaryStream>(io_);
    binaries_[id] = stream;
    std::error_code ec;
    auto ip = asio::ip::make_address_v4(address, ec);
    if(ec) {
      log_warn(logger_.get(), "invalid DCC address {}: {}", address, ec.message());
      finish_binary(id);
      return;
    }
    stream->socket.async_connect(tcp::endpoint(ip, port),
      [this, id, stream, address, port](std::error_code ec){
        if(stream->closed) return;
        if(ec) {
          log_warn(logger_.get(), "DCC connect to {}:{} failed: {}", address, port, ec.message());
          finish_binary(id);
          return;
        }
        log_debug(logger_.get(), "DCC stream {} connected to {}:{}", id, address, port);
        read_binary(id, stream);
      });
  });
  return id;
}

void IrcTransport::close_binary(BinaryId id) {
  asio::post(io_, [this, id](){ finish_binary(id); });
}

void IrcTransport::read_binary(BinaryId id, std::shared_ptr<BinaryStream> stream) {
  stream->socket.async_read_some(asio::buffer(stream->buffer),
    [this, id, stream](std::error_code ec, std::size_t n){
      if(stream->closed) return;
      if(n > 0) {
        stream->received += n;
        acknowledge(*stream);
        if(events_.on_binary_data) events_.on_binary_data(id, stream->buffer.data(), n);
      }
      if(ec) {
        if(ec != asio::error::eof) {
          log_debug(logger_.get(), "DCC stream {} ended: {}", id, ec.message());
        }
        finish_binary(id);
        return;
      }
      read_binary(id, stream);
    });
}

void IrcTransport::acknowledge(BinaryStream& stream) {
  // Classic DCC: the receiver reports its running total as a 32-bit big-endian counter.
  const uint32_t total = static_cast<uint32_t>(stream.received & 0xFFFFFFFFull);
  const std::array<unsigned char, 4> ack{
    static_cast<unsigned char>(total >> 24),
    static_cast<unsigned char>(total >> 16),
    static_cast<unsigned char>(total >> 8),
    static_cast<unsigned char>(total)
  };
  std::error_code ec;
  asio::write(stream.socket, asio::buffer(ack), ec);
  if(ec) log_debug(logger_.get(), "DCC ack failed: {}", ec.message());
}

void IrcTransport::finish_binary(BinaryId id) {
  auto it = binaries_.find(id);
  if(it == binaries_.end()) return;
  auto stream = it->second;
  binaries_.erase(it);
  if(stream->closed) return;
  stream->closed = true;
  std::error_code ec;
  stream->socket.close(ec);
  if(events_.on_binary_closed) events_.on_binary_closed(id);
}
