#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

using BinaryId = uint64_t;

// Chat connection plus the binary (DCC) streams it negotiates.
//
// Request methods only queue work: implementations must never invoke an event
// callback synchronously from inside one of them. Callbacks are delivered
// from the thread running run().
class Transport {
public:
  struct Events {
    std::function<void()> on_welcome;
    std::function<void(const std::string& channel)> on_joined;
    std::function<void(const std::string& from, const std::string& payload)> on_ctcp;
    std::function<void(BinaryId id, const char* data, std::size_t size)> on_binary_data;
    // Fired exactly once per opened stream, whoever closed it.
    std::function<void(BinaryId id)> on_binary_closed;
    std::function<void(const std::string& reason)> on_disconnected;
  };

  virtual ~Transport() = default;

  // Must be called before connect().
  virtual void set_events(Events events) = 0;

  virtual void connect(const std::string& host, uint16_t port, const std::string& nickname) = 0;
  virtual void join(const std::string& channel) = 0;
  virtual void send_ctcp(const std::string& target, const std::string& payload) = 0;
  virtual BinaryId open_binary(const std::string& address, uint16_t port) = 0;
  virtual void close_binary(BinaryId id) = 0;
  virtual void disconnect() = 0;

  // Drives the event loop until stop().
  virtual void run() = 0;
  virtual void stop() = 0;
};
