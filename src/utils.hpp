#pragma once
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

std::string trim_copy(std::string value);
std::string to_lower(std::string value);
// IRC nicknames and channels compare case-insensitively.
bool iequals(const std::string& a, const std::string& b);
std::vector<std::string> split(const std::string& text, char delimiter);
