#pragma once
// Wire form of consensus proposal payloads. Each decoder consumes the
// whole buffer or fails.
#include <cstdint>
#include <string>
#include "custodian_registry.h"
#include "params.h"
#include "serialize.h"

namespace qcb {

struct StatusChangePayload {
    std::string     custodian_id;
    CustodianStatus status{CustodianStatus::UNDER_REVIEW};
    std::string     reason;
};

struct RedemptionDefaultPayload {
    Bytes       redemption_id;   // 32 bytes
    std::string reason;
};

enum class InterventionAction : uint8_t {
    PAUSE = 0,
    UNPAUSE = 1,
    FREEZE_CUSTODIAN = 2
};

struct ForceInterventionPayload {
    InterventionAction action{InterventionAction::PAUSE};
    PauseFlag          flag{PauseFlag::MINTING};   // PAUSE / UNPAUSE
    std::string        custodian_id;               // FREEZE_CUSTODIAN
};

struct ParameterChangePayload {
    ParamKey key{ParamKey::MIN_MINT_AMOUNT};
    uint64_t value{0};
};

struct WalletDeregistrationPayload {
    std::string custodian_id;
    std::string btc_address;
};

// str custodian | u8 status | str reason
Bytes encode_payload(const StatusChangePayload& p);
// varbytes id | str reason
Bytes encode_payload(const RedemptionDefaultPayload& p);
// u8 action | u8 flag | str custodian
Bytes encode_payload(const ForceInterventionPayload& p);
// u8 key | u64 value
Bytes encode_payload(const ParameterChangePayload& p);
// str custodian | str address
Bytes encode_payload(const WalletDeregistrationPayload& p);

bool decode_payload(const Bytes& b, StatusChangePayload& out);
bool decode_payload(const Bytes& b, RedemptionDefaultPayload& out);
bool decode_payload(const Bytes& b, ForceInterventionPayload& out);
bool decode_payload(const Bytes& b, ParameterChangePayload& out);
bool decode_payload(const Bytes& b, WalletDeregistrationPayload& out);

}  // namespace qcb
