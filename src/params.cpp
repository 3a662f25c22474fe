#include "params.h"

namespace qcb {

bool validate_params(const SystemParams& p, std::string* err) {
    auto fail = [&](const char* m) {
        if (err) *err = m;
        return false;
    };
    if (p.min_mint_amount == 0) return fail("min_mint_amount must be > 0");
    if (p.max_mint_amount < p.min_mint_amount) return fail("max_mint_amount must be >= min_mint_amount");
    if (p.min_redemption_amount == 0) return fail("min_redemption_amount must be > 0");
    if (p.max_redemption_amount < p.min_redemption_amount)
        return fail("max_redemption_amount must be >= min_redemption_amount");
    if (p.redemption_timeout == 0) return fail("redemption_timeout must be > 0");
    if (p.fulfillment_grace > p.redemption_timeout) return fail("fulfillment_grace must be <= redemption_timeout");
    if (p.stale_threshold == 0) return fail("stale_threshold must be > 0");
    if (p.stale_threshold > 7 * SECONDS_PER_DAY) return fail("stale_threshold must be <= 7 days");
    if (p.max_attestation_age == 0) return fail("max_attestation_age must be > 0");
    if (p.fee_tolerance_bps > 10000) return fail("fee_tolerance_bps must be <= 10000");
    if (p.proof_difficulty_factor == 0) return fail("proof_difficulty_factor must be >= 1");
    if (p.wallet_binding_ttl == 0) return fail("wallet_binding_ttl must be > 0");
    if (p.wallet_binding_ttl > SECONDS_PER_DAY) return fail("wallet_binding_ttl must be <= 24h");
    if (p.voting_period == 0) return fail("voting_period must be > 0");
    if (p.reserve_consensus_threshold == 0 || p.reserve_consensus_threshold > MAX_RESERVE_CONSENSUS_THRESHOLD)
        return fail("reserve_consensus_threshold must be in [1, 16]");
    return true;
}

const char* param_key_str(ParamKey k) {
    switch (k) {
        case ParamKey::MIN_MINT_AMOUNT:         return "min_mint_amount";
        case ParamKey::MAX_MINT_AMOUNT:         return "max_mint_amount";
        case ParamKey::MIN_REDEMPTION_AMOUNT:   return "min_redemption_amount";
        case ParamKey::MAX_REDEMPTION_AMOUNT:   return "max_redemption_amount";
        case ParamKey::REDEMPTION_TIMEOUT:      return "redemption_timeout";
        case ParamKey::FULFILLMENT_GRACE:       return "fulfillment_grace";
        case ParamKey::STALE_THRESHOLD:         return "stale_threshold";
        case ParamKey::MAX_ATTESTATION_AGE:     return "max_attestation_age";
        case ParamKey::FEE_TOLERANCE_BPS:       return "fee_tolerance_bps";
        case ParamKey::PROOF_DIFFICULTY_FACTOR: return "proof_difficulty_factor";
        case ParamKey::WALLET_BINDING_TTL:      return "wallet_binding_ttl";
        case ParamKey::VOTING_PERIOD:           return "voting_period";
        case ParamKey::RESERVE_CONSENSUS_THRESHOLD: return "reserve_consensus_threshold";
    }
    return "unknown";
}

bool param_key_from_u8(uint8_t v, ParamKey& out) {
    if (v < static_cast<uint8_t>(ParamKey::MIN_MINT_AMOUNT) || v > static_cast<uint8_t>(ParamKey::RESERVE_CONSENSUS_THRESHOLD))
        return false;
    out = static_cast<ParamKey>(v);
    return true;
}

bool parse_param_key(const std::string& s, ParamKey& out) {
    for (uint8_t v = static_cast<uint8_t>(ParamKey::MIN_MINT_AMOUNT);
         v <= static_cast<uint8_t>(ParamKey::RESERVE_CONSENSUS_THRESHOLD); ++v) {
        const ParamKey k = static_cast<ParamKey>(v);
        if (s == param_key_str(k)) {
            out = k;
            return true;
        }
    }
    return false;
}

static uint64_t* field(SystemParams& p, ParamKey k) {
    switch (k) {
        case ParamKey::MIN_MINT_AMOUNT:         return &p.min_mint_amount;
        case ParamKey::MAX_MINT_AMOUNT:         return &p.max_mint_amount;
        case ParamKey::MIN_REDEMPTION_AMOUNT:   return &p.min_redemption_amount;
        case ParamKey::MAX_REDEMPTION_AMOUNT:   return &p.max_redemption_amount;
        case ParamKey::REDEMPTION_TIMEOUT:      return &p.redemption_timeout;
        case ParamKey::FULFILLMENT_GRACE:       return &p.fulfillment_grace;
        case ParamKey::STALE_THRESHOLD:         return &p.stale_threshold;
        case ParamKey::MAX_ATTESTATION_AGE:     return &p.max_attestation_age;
        case ParamKey::FEE_TOLERANCE_BPS:       return &p.fee_tolerance_bps;
        case ParamKey::PROOF_DIFFICULTY_FACTOR: return &p.proof_difficulty_factor;
        case ParamKey::WALLET_BINDING_TTL:      return &p.wallet_binding_ttl;
        case ParamKey::VOTING_PERIOD:           return &p.voting_period;
        case ParamKey::RESERVE_CONSENSUS_THRESHOLD: return &p.reserve_consensus_threshold;
    }
    return nullptr;
}

uint64_t get_param(const SystemParams& p, ParamKey k) {
    const uint64_t* f = field(const_cast<SystemParams&>(p), k);
    return f ? *f : 0;
}

bool set_param(SystemParams& p, ParamKey k, uint64_t value, std::string* err) {
    SystemParams next = p;
    uint64_t* f = field(next, k);
    if (!f) {
        if (err) *err = "unknown parameter";
        return false;
    }
    *f = value;
    if (!validate_params(next, err)) return false;
    p = next;
    return true;
}

const char* pause_flag_str(PauseFlag f) {
    switch (f) {
        case PauseFlag::MINTING:             return "minting";
        case PauseFlag::REDEMPTION:          return "redemption";
        case PauseFlag::REGISTRY:            return "registry";
        case PauseFlag::WALLET_REGISTRATION: return "wallet_registration";
    }
    return "unknown";
}

bool pause_flag_from_u8(uint8_t v, PauseFlag& out) {
    if (v > static_cast<uint8_t>(PauseFlag::WALLET_REGISTRATION)) return false;
    out = static_cast<PauseFlag>(v);
    return true;
}

bool PauseFlags::is_paused(PauseFlag f) const {
    switch (f) {
        case PauseFlag::MINTING:             return minting;
        case PauseFlag::REDEMPTION:          return redemption;
        case PauseFlag::REGISTRY:            return registry;
        case PauseFlag::WALLET_REGISTRATION: return wallet_registration;
    }
    return false;
}

bool& PauseFlags::flag(PauseFlag f) {
    switch (f) {
        case PauseFlag::MINTING:             return minting;
        case PauseFlag::REDEMPTION:          return redemption;
        case PauseFlag::REGISTRY:            return registry;
        case PauseFlag::WALLET_REGISTRATION: return wallet_registration;
    }
    return minting;
}

const char* admin_error_str(AdminError e) {
    switch (e) {
        case AdminError::OK:                  return "ok";
        case AdminError::UNAUTHORIZED:        return "unauthorized";
        case AdminError::ALREADY_PAUSED:      return "already_paused";
        case AdminError::NOT_PAUSED:          return "not_paused";
        case AdminError::INVALID_PARAMETER:   return "invalid_parameter";
        case AdminError::INVALID_ROLE_CHANGE: return "invalid_role_change";
    }
    return "unknown";
}

AdminError SystemState::pause(PauseFlag f) {
    bool& b = pauses.flag(f);
    if (b) return AdminError::ALREADY_PAUSED;
    b = true;
    return AdminError::OK;
}

AdminError SystemState::unpause(PauseFlag f) {
    bool& b = pauses.flag(f);
    if (!b) return AdminError::NOT_PAUSED;
    b = false;
    return AdminError::OK;
}

}  // namespace qcb
