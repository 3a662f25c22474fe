#pragma once
// Role grants and the per-call authorization capability.
#include <cstdint>
#include <map>
#include <string>
#include <utility>

namespace qcb {

using ActorId = std::string;

enum class Role : uint32_t {
    ADMIN             = 0x0001,
    ATTESTER          = 0x0002,
    REGISTRAR         = 0x0004,
    BINDING_FINALIZER = 0x0008,
    MINTER            = 0x0010,
    REDEEMER          = 0x0020,
    ARBITER           = 0x0040,
    WATCHDOG          = 0x0080
};

const char* role_str(Role r);
bool parse_role(const std::string& s, Role& out);

class RoleTable {
public:
    void grant(const ActorId& who, Role r);
    // False when `who` did not hold `r`.
    bool revoke(const ActorId& who, Role r);
    bool has(const ActorId& who, Role r) const;
    uint32_t mask(const ActorId& who) const;

private:
    std::map<ActorId, uint32_t> grants_;
};

// Identity of the caller plus the role table in force for this call.
class AuthorizationContext {
public:
    AuthorizationContext(ActorId caller, const RoleTable& roles)
        : caller_(std::move(caller)), roles_(&roles) {}

    const ActorId& caller() const { return caller_; }
    bool has(Role r) const { return roles_->has(caller_, r); }

private:
    ActorId caller_;
    const RoleTable* roles_;
};

}  // namespace qcb
