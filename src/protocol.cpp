#include "protocol.hpp"

#include <random>
#include <sstream>

#include "utils.hpp"
#include "xdcc_errors.hpp"

std::string make_xdcc_request(const Pack& pack) {
    return "XDCC send " + pack.token();
}

namespace {

uint64_t parse_decimal(const std::string& text, const char* what, const std::string& payload) {
    if(text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        throw ProtocolError(std::string("DCC SEND has invalid ") + what + " '" + text + "': " + payload);
    }
    try {
        return std::stoull(text);
    } catch(const std::exception&) {
        throw ProtocolError(std::string("DCC SEND ") + what + " out of range: " + payload);
    }
}

} // namespace

std::optional<DccOffer> parse_dcc_send(const std::string& payload) {
    static const std::string kSendPrefix = "DCC SEND ";
    if(payload.size() < kSendPrefix.size() ||
       !iequals(payload.substr(0, kSendPrefix.size()), kSendPrefix)) {
        return std::nullopt;
    }
    auto words = split_shell_words(payload);
    // DCC SEND <file> <ip> <port> <size> [token]
    if(words.size() != 6 && words.size() != 7) {
        throw ProtocolError("DCC SEND has " + std::to_string(words.size() - 2) + " arguments: " + payload);
    }
    DccOffer offer;
    offer.filename = words[2];
    if(offer.filename.empty()) {
        throw ProtocolError("DCC SEND without filename: " + payload);
    }
    offer.address = ip_numstr_to_quad(words[3]);
    uint64_t port = parse_decimal(words[4], "port", payload);
    if(port == 0) {
        throw ProtocolError("Reverse DCC is not supported: " + payload);
    }
    if(port > 65535) {
        throw ProtocolError("DCC SEND port out of range: " + payload);
    }
    offer.port = static_cast<uint16_t>(port);
    offer.size = parse_decimal(words[5], "size", payload);
    return offer;
}

std::vector<std::string> split_shell_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = 0;
    for(std::size_t i = 0; i < text.size(); ++i) {
        char ch = text[i];
        if(quote == '\'') {
            if(ch == '\'') quote = 0;
            else current += ch;
            continue;
        }
        if(quote == '"') {
            if(ch == '"') {
                quote = 0;
            } else if(ch == '\\' && i + 1 < text.size() &&
                      (text[i + 1] == '"' || text[i + 1] == '\\')) {
                current += text[++i];
            } else {
                current += ch;
            }
            continue;
        }
        if(ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n') {
            if(in_word) {
                words.push_back(std::move(current));
                current.clear();
                in_word = false;
            }
            continue;
        }
        in_word = true;
        if(ch == '\'' || ch == '"') {
            quote = ch;
        } else if(ch == '\\') {
            if(i + 1 >= text.size()) throw ProtocolError("Trailing escape in: " + text);
            current += text[++i];
        } else {
            current += ch;
        }
    }
    if(quote) throw ProtocolError("Unterminated quote in: " + text);
    if(in_word) words.push_back(std::move(current));
    return words;
}

std::string ip_numstr_to_quad(const std::string& numstr) {
    if(numstr.empty() || numstr.size() > 10 ||
       numstr.find_first_not_of("0123456789") != std::string::npos) {
        throw ProtocolError("Invalid DCC address '" + numstr + "'");
    }
    uint64_t value = std::stoull(numstr);
    if(value > 0xFFFFFFFFull) {
        throw ProtocolError("Invalid DCC address '" + numstr + "'");
    }
    std::ostringstream out;
    out << ((value >> 24) & 0xFF) << '.' << ((value >> 16) & 0xFF) << '.'
        << ((value >> 8) & 0xFF) << '.' << (value & 0xFF);
    return out.str();
}

std::string random_nickname() {
    static const std::string alphabet = "anonymous";
    std::random_device rd;
    std::mt19937 rng(rd());
    std::uniform_int_distribution<std::size_t> pick(0, alphabet.size() - 1);
    std::string nick;
    for(int i = 0; i < 9; ++i) nick += alphabet[pick(rng)];
    return nick;
}

std::string IrcMessage::source_nick() const {
    auto bang = prefix.find('!');
    return bang == std::string::npos ? prefix : prefix.substr(0, bang);
}

std::optional<IrcMessage> parse_irc_line(const std::string& line) {
    std::string rest = line;
    while(!rest.empty() && (rest.back() == '\r' || rest.back() == '\n')) rest.pop_back();
    if(rest.empty()) return std::nullopt;

    IrcMessage msg;
    std::size_t pos = 0;
    if(rest[0] == ':') {
        auto space = rest.find(' ');
        if(space == std::string::npos) return std::nullopt;
        msg.prefix = rest.substr(1, space - 1);
        pos = space + 1;
    }
    while(pos < rest.size() && rest[pos] == ' ') ++pos;
    auto end = rest.find(' ', pos);
    msg.command = rest.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    if(msg.command.empty()) return std::nullopt;
    pos = end == std::string::npos ? rest.size() : end + 1;

    while(pos < rest.size()) {
        if(rest[pos] == ' ') {
            ++pos;
            continue;
        }
        if(rest[pos] == ':') {
            msg.params.push_back(rest.substr(pos + 1));
            break;
        }
        end = rest.find(' ', pos);
        msg.params.push_back(rest.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
        pos = end == std::string::npos ? rest.size() : end + 1;
    }
    return msg;
}

std::optional<std::string> ctcp_unwrap(const std::string& text) {
    if(text.size() < 2 || text.front() != kCtcpDelimiter) return std::nullopt;
    std::string inner = text.substr(1);
    if(!inner.empty() && inner.back() == kCtcpDelimiter) inner.pop_back();
    return inner;
}
