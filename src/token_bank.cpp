#include "token_bank.h"
#include <limits>

namespace qcb {

bool InMemoryTokenBank::credit(const ActorId& to, uint64_t amount, std::string* err) {
    if (amount > std::numeric_limits<uint64_t>::max() - supply_) {
        if (err) *err = "supply overflow";
        return false;
    }
    balances_[to] += amount;
    supply_ += amount;
    return true;
}

bool InMemoryTokenBank::burn(const ActorId& from, uint64_t amount, std::string* err) {
    auto it = balances_.find(from);
    const uint64_t have = it == balances_.end() ? 0 : it->second;
    if (have < amount) {
        if (err) *err = "insufficient balance";
        return false;
    }
    if (amount == 0) return true;
    it->second -= amount;
    supply_ -= amount;
    if (it->second == 0) balances_.erase(it);
    return true;
}

uint64_t InMemoryTokenBank::balance_of(const ActorId& who) const {
    auto it = balances_.find(who);
    return it == balances_.end() ? 0 : it->second;
}

}  // namespace qcb
