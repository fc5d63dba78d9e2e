#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

class XdccError : public std::runtime_error {
public:
  explicit XdccError(const std::string& message) : std::runtime_error(message) {}
};

// The IRC server never welcomed us, dropped the connection, or the client is closed.
class ConnectionError : public XdccError {
public:
  explicit ConnectionError(const std::string& message) : XdccError(message) {}
};

// Recoverable; the client is Available again when this is thrown.
class RequestTimeout : public XdccError {
public:
  explicit RequestTimeout(const std::string& message) : XdccError(message) {}
};

// Malformed DCC SEND handshake.
class ProtocolError : public XdccError {
public:
  explicit ProtocolError(const std::string& message) : XdccError(message) {}
};

// Destination could not be opened or written.
class TransferError : public XdccError {
public:
  explicit TransferError(const std::string& message) : XdccError(message) {}
};

class TransferInterrupted : public XdccError {
public:
  TransferInterrupted(const std::string& filename, uint64_t received, uint64_t declared)
    : XdccError("Transfer of '" + filename + "' interrupted after " +
                std::to_string(received) + " of " + std::to_string(declared) + " bytes"),
      filename_(filename), bytes_received_(received), declared_size_(declared) {}

  const std::string& filename() const { return filename_; }
  uint64_t bytes_received() const { return bytes_received_; }
  uint64_t declared_size() const { return declared_size_; }

private:
  std::string filename_;
  uint64_t bytes_received_;
  uint64_t declared_size_;
};

// One listing line does not follow the directory grammar. Never escapes the parser.
class ListingParseError : public XdccError {
public:
  explicit ListingParseError(const std::string& message) : XdccError(message) {}
};
