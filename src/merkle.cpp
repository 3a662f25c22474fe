#include "merkle.h"
#include "hash.h"

namespace qcb {

static std::vector<std::vector<uint8_t>> next_level(const std::vector<std::vector<uint8_t>>& layer) {
    std::vector<std::vector<uint8_t>> next;
    next.reserve((layer.size() + 1) / 2);
    for (size_t i = 0; i < layer.size(); i += 2) {
        const auto& a = layer[i];
        const auto& b = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
        next.push_back(hash_pair(a, b));
    }
    return next;
}

std::vector<uint8_t> merkle_root(const std::vector<std::vector<uint8_t>>& txids) {
    if (txids.empty()) return std::vector<uint8_t>(32, 0);
    auto layer = txids;
    while (layer.size() > 1) layer = next_level(layer);
    return layer[0];
}

std::vector<uint8_t> merkle_branch(const std::vector<std::vector<uint8_t>>& txids, uint64_t index) {
    std::vector<uint8_t> branch;
    if (index >= txids.size()) return branch;
    auto layer = txids;
    while (layer.size() > 1) {
        const uint64_t sib = index ^ 1;
        const auto& s = sib < layer.size() ? layer[sib] : layer[index];
        branch.insert(branch.end(), s.begin(), s.end());
        layer = next_level(layer);
        index >>= 1;
    }
    return branch;
}

bool merkle_root_from_branch(const std::vector<uint8_t>& leaf, const std::vector<uint8_t>& branch,
                             uint64_t index, std::vector<uint8_t>& root) {
    if (leaf.size() != 32 || branch.size() % 32 != 0) return false;
    std::vector<uint8_t> cur = leaf;
    for (size_t off = 0; off < branch.size(); off += 32) {
        std::vector<uint8_t> sib(branch.begin() + off, branch.begin() + off + 32);
        cur = (index & 1) ? hash_pair(sib, cur) : hash_pair(cur, sib);
        index >>= 1;
    }
    root = std::move(cur);
    return true;
}

}  // namespace qcb
