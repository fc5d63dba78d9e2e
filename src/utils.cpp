#include "utils.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <iomanip>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
        [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

std::string to_lower(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

bool iequals(const std::string& a, const std::string& b){
    if(a.size() != b.size()) return false;
    for(std::size_t i = 0; i < a.size(); ++i){
        if(std::tolower(static_cast<unsigned char>(a[i])) !=
           std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

std::vector<std::string> split(const std::string& text, char delimiter){
    std::vector<std::string> parts;
    std::string current;
    std::istringstream in(text);
    while(std::getline(in, current, delimiter)){
        parts.push_back(current);
    }
    if(!text.empty() && text.back() == delimiter) parts.emplace_back();
    return parts;
}
