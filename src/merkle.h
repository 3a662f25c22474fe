#pragma once
#include <cstdint>
#include <vector>

namespace qcb {

// Bitcoin merkle root; an odd node at any level is paired with itself.
// Empty input yields 32 zero bytes.
std::vector<uint8_t> merkle_root(const std::vector<std::vector<uint8_t>>& txids);

// Sibling hashes from leaf `index` up to (excluding) the root, concatenated
// 32 bytes per level.
std::vector<uint8_t> merkle_branch(const std::vector<std::vector<uint8_t>>& txids, uint64_t index);

// Fold `leaf` through a concatenated branch. Bit k of `index` set means the
// running hash is the right child at level k. False if the branch length is
// not a multiple of 32.
bool merkle_root_from_branch(const std::vector<uint8_t>& leaf, const std::vector<uint8_t>& branch,
                             uint64_t index, std::vector<uint8_t>& root);

}  // namespace qcb
