#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// protocol.hpp
inline constexpr const char* kListingToken = "list";
inline constexpr char kCtcpDelimiter = '\x01';

// What to ask a bot for: its pack listing or one numbered pack.
class Pack {
public:
    // The listing.
    Pack() = default;

    static Pack listing() { return Pack(); }
    static Pack number(uint32_t id) { return Pack(id); }

    bool is_listing() const { return !id_.has_value(); }
    uint32_t id() const { return id_.value_or(0); }
    std::string token() const { return id_ ? std::to_string(*id_) : std::string(kListingToken); }

private:
    explicit Pack(uint32_t id) : id_(id) {}
    std::optional<uint32_t> id_;
};

// Body of the CTCP message asking a bot for a pack ("XDCC send 1234").
std::string make_xdcc_request(const Pack& pack);

// A bot's offer to stream a file to us.
struct DccOffer {
    std::string filename;
    std::string address;    // dotted quad
    uint16_t port = 0;
    uint64_t size = 0;
};

// nullopt when `payload` is not a DCC SEND; ProtocolError when it is one but
// cannot be honoured.
std::optional<DccOffer> parse_dcc_send(const std::string& payload);

// POSIX-shell style word splitting (quotes and backslash escapes).
// Throws ProtocolError on an unterminated quote or trailing escape.
std::vector<std::string> split_shell_words(const std::string& text);

// DCC encodes IPv4 addresses as one decimal integer: "3232235777" -> "192.168.1.1".
std::string ip_numstr_to_quad(const std::string& numstr);

// Nine characters drawn from "anonymous".
std::string random_nickname();

struct IrcMessage {
    std::string prefix;
    std::string command;
    std::vector<std::string> params;   // trailing parameter last, if any

    // Nickname part of the prefix ("nick!user@host" -> "nick").
    std::string source_nick() const;
};

std::optional<IrcMessage> parse_irc_line(const std::string& line);

// Strips the \x01 framing; nullopt when `text` is not a CTCP message.
std::optional<std::string> ctcp_unwrap(const std::string& text);
