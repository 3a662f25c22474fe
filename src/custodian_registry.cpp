#include "custodian_registry.h"
#include "crypto/message_verifier.h"
#include "hash.h"
#include "hex.h"
#include "log.h"
#include "script.h"

namespace qcb {

const char* custodian_status_str(CustodianStatus s) {
    switch (s) {
        case CustodianStatus::UNREGISTERED: return "unregistered";
        case CustodianStatus::ACTIVE:       return "active";
        case CustodianStatus::UNDER_REVIEW: return "under_review";
        case CustodianStatus::TERMINATED:   return "terminated";
    }
    return "unknown";
}

bool custodian_status_from_u8(uint8_t v, CustodianStatus& out) {
    if (v > static_cast<uint8_t>(CustodianStatus::TERMINATED)) return false;
    out = static_cast<CustodianStatus>(v);
    return true;
}

const char* registry_error_str(RegistryError e) {
    switch (e) {
        case RegistryError::OK:                   return "ok";
        case RegistryError::UNAUTHORIZED:         return "unauthorized";
        case RegistryError::PAUSED:               return "paused";
        case RegistryError::ALREADY_REGISTERED:   return "already_registered";
        case RegistryError::NOT_REGISTERED:       return "not_registered";
        case RegistryError::INVALID_CAP:          return "invalid_cap";
        case RegistryError::INVALID_TRANSITION:   return "invalid_transition";
        case RegistryError::CUSTODIAN_NOT_ACTIVE: return "custodian_not_active";
        case RegistryError::INVALID_ADDRESS:      return "invalid_address";
        case RegistryError::INVALID_CHALLENGE:    return "invalid_challenge";
        case RegistryError::WALLET_ALREADY_BOUND: return "wallet_already_bound";
        case RegistryError::WALLET_NOT_FOUND:     return "wallet_not_found";
        case RegistryError::UNKNOWN_BINDING:      return "unknown_binding";
        case RegistryError::BINDING_EXPIRED:      return "binding_expired";
        case RegistryError::BINDING_FINALIZED:    return "binding_finalized";
        case RegistryError::SAME_PARTY:           return "same_party";
        case RegistryError::PROOF_INVALID:        return "proof_invalid";
        case RegistryError::CHALLENGE_NOT_FOUND:  return "challenge_not_found";
        case RegistryError::SPEND_NOT_FOUND:      return "spend_not_found";
        case RegistryError::UNSUPPORTED_PROOF:    return "unsupported_proof";
        case RegistryError::BAD_SIGNATURE:        return "bad_signature";
    }
    return "unknown";
}

static RegistryError reject(const char* op, RegistryError e) {
    QCB_LOG_DEBUG(LogCategory::REGISTRY, std::string("registry: ") + op + " rejected: " + registry_error_str(e));
    return e;
}

RegistryError CustodianRegistry::register_custodian(const AuthorizationContext& auth, const std::string& id,
                                                    uint64_t max_cap, const SystemState& sys, uint64_t now,
                                                    EventLog& ev) {
    if (!auth.has(Role::REGISTRAR)) return reject("register", RegistryError::UNAUTHORIZED);
    if (sys.pauses.registry) return reject("register", RegistryError::PAUSED);
    if (id.empty()) return reject("register", RegistryError::NOT_REGISTERED);
    if (max_cap == 0) return reject("register", RegistryError::INVALID_CAP);
    if (custodians_.count(id)) return reject("register", RegistryError::ALREADY_REGISTERED);

    Custodian c;
    c.id = id;
    c.status = CustodianStatus::ACTIVE;
    c.max_minting_cap = max_cap;
    c.registered_at = now;
    custodians_.emplace(id, std::move(c));

    ev.emit(EventType::CUSTODIAN_REGISTERED, now, id, "cap=" + std::to_string(max_cap));
    log_info(LogCategory::REGISTRY, "registry: registered custodian " + id + " cap=" + std::to_string(max_cap));
    return RegistryError::OK;
}

RegistryError CustodianRegistry::set_status(const std::string& id, CustodianStatus to, const std::string& reason,
                                            StatusSource src, uint64_t now, EventLog& ev) {
    auto it = custodians_.find(id);
    if (it == custodians_.end()) return reject("set_status", RegistryError::NOT_REGISTERED);
    Custodian& c = it->second;

    if (c.status == CustodianStatus::TERMINATED) return reject("set_status", RegistryError::INVALID_TRANSITION);
    if (to == CustodianStatus::UNREGISTERED) return reject("set_status", RegistryError::INVALID_TRANSITION);
    if (to == c.status) return RegistryError::OK;

    switch (to) {
        case CustodianStatus::TERMINATED:
            if (src != StatusSource::CONSENSUS) return reject("set_status", RegistryError::UNAUTHORIZED);
            break;
        case CustodianStatus::ACTIVE:
            if (src == StatusSource::AUTOMATIC) return reject("set_status", RegistryError::UNAUTHORIZED);
            break;
        case CustodianStatus::UNDER_REVIEW:
            if (src == StatusSource::ARBITER) return reject("set_status", RegistryError::UNAUTHORIZED);
            break;
        case CustodianStatus::UNREGISTERED:
            break;
    }

    const CustodianStatus from = c.status;
    c.status = to;
    c.status_reason = reason;
    ev.emit(EventType::STATUS_CHANGED, now, id,
            std::string("from=") + custodian_status_str(from) + " to=" + custodian_status_str(to) + " reason=" + reason);
    log_info(LogCategory::REGISTRY, "registry: " + id + " " + custodian_status_str(from) + " -> "
             + custodian_status_str(to) + " (" + reason + ")");
    return RegistryError::OK;
}

RegistryError CustodianRegistry::request_wallet_binding(const AuthorizationContext& auth,
                                                        const std::string& custodian_id,
                                                        const std::string& btc_address, const Bytes& challenge,
                                                        const SystemState& sys, uint64_t now,
                                                        uint64_t& binding_id, EventLog& ev) {
    if (auth.caller() != custodian_id && !auth.has(Role::REGISTRAR))
        return reject("request_binding", RegistryError::UNAUTHORIZED);
    if (sys.pauses.wallet_registration) return reject("request_binding", RegistryError::PAUSED);

    auto it = custodians_.find(custodian_id);
    if (it == custodians_.end()) return reject("request_binding", RegistryError::NOT_REGISTERED);
    if (it->second.status != CustodianStatus::ACTIVE) return reject("request_binding", RegistryError::CUSTODIAN_NOT_ACTIVE);

    DecodedAddress d;
    if (!decode_btc_address(btc_address, d)) return reject("request_binding", RegistryError::INVALID_ADDRESS);
    if (challenge.empty() || challenge.size() > MAX_BINDING_CHALLENGE)
        return reject("request_binding", RegistryError::INVALID_CHALLENGE);
    if (!owner_of_wallet(btc_address).empty()) return reject("request_binding", RegistryError::WALLET_ALREADY_BOUND);

    WalletBinding b;
    b.id = next_binding_id_++;
    b.custodian_id = custodian_id;
    b.address = btc_address;
    b.decoded = std::move(d);
    b.challenge = challenge;
    b.requested_by = auth.caller();
    b.requested_at = now;
    b.expires_at = now + sys.params.wallet_binding_ttl;
    binding_id = b.id;

    ev.emit(EventType::WALLET_BINDING_REQUESTED, now, custodian_id,
            "binding=" + std::to_string(b.id) + " address=" + btc_address);
    log_info(LogCategory::REGISTRY, "registry: binding " + std::to_string(b.id) + " requested for "
             + custodian_id + " address " + btc_address);
    bindings_.emplace(b.id, std::move(b));
    return RegistryError::OK;
}

RegistryError CustodianRegistry::check_finalizer(const AuthorizationContext& auth, const WalletBinding& b,
                                                 const SystemState& sys, uint64_t now) const {
    if (!auth.has(Role::BINDING_FINALIZER)) return RegistryError::UNAUTHORIZED;
    if (auth.caller() == b.requested_by) return RegistryError::SAME_PARTY;
    if (sys.pauses.wallet_registration) return RegistryError::PAUSED;
    if (b.finalized) return RegistryError::BINDING_FINALIZED;
    if (now > b.expires_at) return RegistryError::BINDING_EXPIRED;

    const Custodian* c = find(b.custodian_id);
    if (!c) return RegistryError::NOT_REGISTERED;
    if (c->status != CustodianStatus::ACTIVE) return RegistryError::CUSTODIAN_NOT_ACTIVE;
    if (!owner_of_wallet(b.address).empty()) return RegistryError::WALLET_ALREADY_BOUND;
    return RegistryError::OK;
}

void CustodianRegistry::bind(WalletBinding& b, uint64_t now, EventLog& ev) {
    BoundWallet w;
    w.address = b.address;
    w.type = b.decoded.type;
    w.hash = b.decoded.hash;
    w.bound_at = now;
    custodians_[b.custodian_id].wallets.push_back(std::move(w));
    b.finalized = true;

    ev.emit(EventType::WALLET_BOUND, now, b.custodian_id,
            "binding=" + std::to_string(b.id) + " address=" + b.address);
    log_info(LogCategory::REGISTRY, "registry: wallet " + b.address + " bound to " + b.custodian_id);
}

RegistryError CustodianRegistry::finalize_wallet_binding(const AuthorizationContext& auth, uint64_t binding_id,
                                                         const Bytes& raw_tx, const SpvProof& proof,
                                                         const SpvVerifier& verifier, const SystemState& sys,
                                                         uint64_t now, EventLog& ev, VerifiedTx* verified,
                                                         SpvError* spv_err) {
    auto it = bindings_.find(binding_id);
    if (it == bindings_.end()) return reject("finalize_binding", RegistryError::UNKNOWN_BINDING);
    WalletBinding& b = it->second;

    RegistryError e = check_finalizer(auth, b, sys, now);
    if (e != RegistryError::OK) return reject("finalize_binding", e);

    VerifiedTx v;
    const SpvError se = verifier.verify(raw_tx, proof, v);
    if (se != SpvError::OK) {
        if (spv_err) *spv_err = se;
        return reject("finalize_binding", RegistryError::PROOF_INVALID);
    }

    bool has_challenge = false;
    for (const auto& o : v.tx.vout) {
        Bytes data;
        if (op_return_data(o.script_pubkey, data) && data == b.challenge) {
            has_challenge = true;
            break;
        }
    }
    if (!has_challenge) return reject("finalize_binding", RegistryError::CHALLENGE_NOT_FOUND);

    bool spends = false;
    for (const auto& in : v.tx.vin) {
        if (input_spends_from(in, b.decoded.type, b.decoded.hash)) {
            spends = true;
            break;
        }
    }
    if (!spends) return reject("finalize_binding", RegistryError::SPEND_NOT_FOUND);

    bind(b, now, ev);
    if (verified) *verified = std::move(v);
    return RegistryError::OK;
}

RegistryError CustodianRegistry::finalize_wallet_binding_signed(const AuthorizationContext& auth,
                                                                uint64_t binding_id, const Bytes& pubkey,
                                                                const std::array<uint8_t, 64>& sig64,
                                                                const crypto::MessageVerifier* verifier,
                                                                const SystemState& sys, uint64_t now,
                                                                EventLog& ev) {
    auto it = bindings_.find(binding_id);
    if (it == bindings_.end()) return reject("finalize_signed", RegistryError::UNKNOWN_BINDING);
    WalletBinding& b = it->second;

    RegistryError e = check_finalizer(auth, b, sys, now);
    if (e != RegistryError::OK) return reject("finalize_signed", e);

    if (!verifier) return reject("finalize_signed", RegistryError::UNSUPPORTED_PROOF);
    if (b.decoded.type != ScriptType::P2PKH && b.decoded.type != ScriptType::P2WPKH)
        return reject("finalize_signed", RegistryError::UNSUPPORTED_PROOF);
    if (hash160(pubkey) != b.decoded.hash) return reject("finalize_signed", RegistryError::BAD_SIGNATURE);

    const Bytes digest = crypto::bitcoin_message_hash(to_hex(b.challenge));
    if (!verifier->verify(digest, pubkey, sig64)) return reject("finalize_signed", RegistryError::BAD_SIGNATURE);

    bind(b, now, ev);
    return RegistryError::OK;
}

static bool same_wallet(const BoundWallet& w, const DecodedAddress& d) {
    return w.type == d.type && w.hash == d.hash;
}

RegistryError CustodianRegistry::deregister_wallet(const std::string& custodian_id, const std::string& btc_address,
                                                   uint64_t now, EventLog& ev) {
    auto it = custodians_.find(custodian_id);
    if (it == custodians_.end()) return reject("deregister_wallet", RegistryError::NOT_REGISTERED);
    DecodedAddress d;
    if (!decode_btc_address(btc_address, d)) return reject("deregister_wallet", RegistryError::INVALID_ADDRESS);

    auto& ws = it->second.wallets;
    for (auto w = ws.begin(); w != ws.end(); ++w) {
        if (same_wallet(*w, d)) {
            const std::string addr = w->address;
            ws.erase(w);
            ev.emit(EventType::WALLET_DEREGISTERED, now, custodian_id, "address=" + addr);
            log_info(LogCategory::REGISTRY, "registry: wallet " + addr + " removed from " + custodian_id);
            return RegistryError::OK;
        }
    }
    return reject("deregister_wallet", RegistryError::WALLET_NOT_FOUND);
}

Custodian* CustodianRegistry::find_mut(const std::string& id) {
    auto it = custodians_.find(id);
    return it == custodians_.end() ? nullptr : &it->second;
}

const Custodian* CustodianRegistry::find(const std::string& id) const {
    auto it = custodians_.find(id);
    return it == custodians_.end() ? nullptr : &it->second;
}

const WalletBinding* CustodianRegistry::binding(uint64_t id) const {
    auto it = bindings_.find(id);
    return it == bindings_.end() ? nullptr : &it->second;
}

CustodianStatus CustodianRegistry::status_of(const std::string& id) const {
    const Custodian* c = find(id);
    return c ? c->status : CustodianStatus::UNREGISTERED;
}

std::string CustodianRegistry::owner_of_wallet(const std::string& btc_address) const {
    DecodedAddress d;
    if (!decode_btc_address(btc_address, d)) return {};
    for (const auto& kv : custodians_) {
        for (const auto& w : kv.second.wallets) {
            if (same_wallet(w, d)) return kv.first;
        }
    }
    return {};
}

}  // namespace qcb
