#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace qcb {

// Strict decoder: odd length or any non-hex character fails. A leading
// "0x" is accepted.
bool from_hex(const std::string& hex, std::vector<uint8_t>& out);
std::string to_hex(const std::vector<uint8_t>& v);

// Byte-reversed hex, the order block explorers display hashes in.
std::string to_hex_rev(const std::vector<uint8_t>& v);
bool from_hex_rev(const std::string& hex, std::vector<uint8_t>& out);

}
