#include "proposal_payload.h"

namespace qcb {

Bytes encode_payload(const StatusChangePayload& p) {
    Bytes b;
    put_string(b, p.custodian_id);
    b.push_back(static_cast<uint8_t>(p.status));
    put_string(b, p.reason);
    return b;
}

Bytes encode_payload(const RedemptionDefaultPayload& p) {
    Bytes b;
    put_varbytes(b, p.redemption_id);
    put_string(b, p.reason);
    return b;
}

Bytes encode_payload(const ForceInterventionPayload& p) {
    Bytes b;
    b.push_back(static_cast<uint8_t>(p.action));
    b.push_back(static_cast<uint8_t>(p.flag));
    put_string(b, p.custodian_id);
    return b;
}

Bytes encode_payload(const ParameterChangePayload& p) {
    Bytes b;
    b.push_back(static_cast<uint8_t>(p.key));
    put_u64_le(b, p.value);
    return b;
}

Bytes encode_payload(const WalletDeregistrationPayload& p) {
    Bytes b;
    put_string(b, p.custodian_id);
    put_string(b, p.btc_address);
    return b;
}

bool decode_payload(const Bytes& b, StatusChangePayload& out) {
    ByteCursor cur(b);
    StatusChangePayload p;
    uint8_t st = 0;
    if (cur.read_string(p.custodian_id) != ParseError::OK || p.custodian_id.empty()) return false;
    if (cur.read_u8(st) != ParseError::OK || !custodian_status_from_u8(st, p.status)) return false;
    if (p.status == CustodianStatus::UNREGISTERED) return false;
    if (cur.read_string(p.reason) != ParseError::OK) return false;
    if (!cur.at_end()) return false;
    out = std::move(p);
    return true;
}

bool decode_payload(const Bytes& b, RedemptionDefaultPayload& out) {
    ByteCursor cur(b);
    RedemptionDefaultPayload p;
    if (cur.read_varbytes(p.redemption_id) != ParseError::OK || p.redemption_id.size() != 32) return false;
    if (cur.read_string(p.reason) != ParseError::OK) return false;
    if (!cur.at_end()) return false;
    out = std::move(p);
    return true;
}

bool decode_payload(const Bytes& b, ForceInterventionPayload& out) {
    ByteCursor cur(b);
    ForceInterventionPayload p;
    uint8_t act = 0, flag = 0;
    if (cur.read_u8(act) != ParseError::OK || act > static_cast<uint8_t>(InterventionAction::FREEZE_CUSTODIAN))
        return false;
    p.action = static_cast<InterventionAction>(act);
    if (cur.read_u8(flag) != ParseError::OK || !pause_flag_from_u8(flag, p.flag)) return false;
    if (cur.read_string(p.custodian_id) != ParseError::OK) return false;
    if (p.action == InterventionAction::FREEZE_CUSTODIAN && p.custodian_id.empty()) return false;
    if (!cur.at_end()) return false;
    out = std::move(p);
    return true;
}

bool decode_payload(const Bytes& b, ParameterChangePayload& out) {
    ByteCursor cur(b);
    ParameterChangePayload p;
    uint8_t key = 0;
    if (cur.read_u8(key) != ParseError::OK || !param_key_from_u8(key, p.key)) return false;
    if (cur.read_u64_le(p.value) != ParseError::OK) return false;
    if (!cur.at_end()) return false;
    out = p;
    return true;
}

bool decode_payload(const Bytes& b, WalletDeregistrationPayload& out) {
    ByteCursor cur(b);
    WalletDeregistrationPayload p;
    if (cur.read_string(p.custodian_id) != ParseError::OK || p.custodian_id.empty()) return false;
    if (cur.read_string(p.btc_address) != ParseError::OK || p.btc_address.empty()) return false;
    if (!cur.at_end()) return false;
    out = std::move(p);
    return true;
}

}  // namespace qcb
