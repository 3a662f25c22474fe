#include "auth.h"

namespace qcb {

const char* role_str(Role r) {
    switch (r) {
        case Role::ADMIN:             return "admin";
        case Role::ATTESTER:          return "attester";
        case Role::REGISTRAR:         return "registrar";
        case Role::BINDING_FINALIZER: return "binding_finalizer";
        case Role::MINTER:            return "minter";
        case Role::REDEEMER:          return "redeemer";
        case Role::ARBITER:           return "arbiter";
        case Role::WATCHDOG:          return "watchdog";
    }
    return "unknown";
}

bool parse_role(const std::string& s, Role& out) {
    static const Role all[] = {Role::ADMIN, Role::ATTESTER, Role::REGISTRAR, Role::BINDING_FINALIZER,
                               Role::MINTER, Role::REDEEMER, Role::ARBITER, Role::WATCHDOG};
    for (Role r : all) {
        if (s == role_str(r)) {
            out = r;
            return true;
        }
    }
    return false;
}

void RoleTable::grant(const ActorId& who, Role r) {
    grants_[who] |= static_cast<uint32_t>(r);
}

bool RoleTable::revoke(const ActorId& who, Role r) {
    auto it = grants_.find(who);
    if (it == grants_.end() || !(it->second & static_cast<uint32_t>(r))) return false;
    it->second &= ~static_cast<uint32_t>(r);
    if (it->second == 0) grants_.erase(it);
    return true;
}

bool RoleTable::has(const ActorId& who, Role r) const {
    return (mask(who) & static_cast<uint32_t>(r)) != 0;
}

uint32_t RoleTable::mask(const ActorId& who) const {
    auto it = grants_.find(who);
    return it == grants_.end() ? 0 : it->second;
}

}  // namespace qcb
