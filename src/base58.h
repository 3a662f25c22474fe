#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace qcb {

std::string base58_encode(const std::vector<uint8_t>& in);
// False on characters outside the alphabet or empty input.
bool base58_decode(const std::string& s, std::vector<uint8_t>& out);

// version byte || payload || first 4 bytes of dsha256(version || payload)
std::string base58check_encode(uint8_t version, const std::vector<uint8_t>& payload);
bool base58check_decode(const std::string& s, uint8_t& version, std::vector<uint8_t>& payload);

}
