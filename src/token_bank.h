#pragma once
// Balance accounting of the bridged token lives outside this core. The
// bridge only credits minted amounts and burns redeemed ones.
#include <cstdint>
#include <map>
#include <string>
#include "auth.h"

namespace qcb {

class TokenBank {
public:
    virtual ~TokenBank() = default;
    virtual bool credit(const ActorId& to, uint64_t amount, std::string* err) = 0;
    // Fails without side effects when `from` holds less than amount.
    virtual bool burn(const ActorId& from, uint64_t amount, std::string* err) = 0;
    virtual uint64_t balance_of(const ActorId& who) const = 0;
};

class InMemoryTokenBank : public TokenBank {
public:
    bool credit(const ActorId& to, uint64_t amount, std::string* err) override;
    bool burn(const ActorId& from, uint64_t amount, std::string* err) override;
    uint64_t balance_of(const ActorId& who) const override;
    uint64_t total_supply() const { return supply_; }

private:
    std::map<ActorId, uint64_t> balances_;
    uint64_t supply_{0};
};

}  // namespace qcb
