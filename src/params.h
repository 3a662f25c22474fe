#pragma once
// =============================================================================
// System-wide parameters and pause flags. Times are unix seconds, amounts
// satoshis.
// =============================================================================
#include <cstdint>
#include <string>

namespace qcb {

constexpr uint64_t SECONDS_PER_HOUR = 3600;
constexpr uint64_t SECONDS_PER_DAY = 24 * SECONDS_PER_HOUR;
constexpr uint64_t MAX_RESERVE_CONSENSUS_THRESHOLD = 16;

struct SystemParams {
    uint64_t min_mint_amount{10000};
    uint64_t max_mint_amount{100000000000ULL};        // 1000 BTC
    uint64_t min_redemption_amount{10000};
    uint64_t max_redemption_amount{100000000000ULL};
    uint64_t redemption_timeout{7 * SECONDS_PER_DAY};
    uint64_t fulfillment_grace{SECONDS_PER_HOUR};     // extra time past the deadline for proofs
    uint64_t stale_threshold{SECONDS_PER_DAY};
    uint64_t max_attestation_age{6 * SECONDS_PER_HOUR};
    uint64_t fee_tolerance_bps{0};                    // 1 bps = 0.01%
    uint64_t proof_difficulty_factor{6};
    uint64_t wallet_binding_ttl{6 * SECONDS_PER_HOUR};
    uint64_t voting_period{2 * SECONDS_PER_HOUR};
    uint64_t reserve_consensus_threshold{1};          // attesters whose reports set a balance
};

// Every rule the parameters must satisfy together.
bool validate_params(const SystemParams& p, std::string* err);

// Keys shared by the config file and ParameterChange proposals.
enum class ParamKey : uint8_t {
    MIN_MINT_AMOUNT = 1,
    MAX_MINT_AMOUNT,
    MIN_REDEMPTION_AMOUNT,
    MAX_REDEMPTION_AMOUNT,
    REDEMPTION_TIMEOUT,
    FULFILLMENT_GRACE,
    STALE_THRESHOLD,
    MAX_ATTESTATION_AGE,
    FEE_TOLERANCE_BPS,
    PROOF_DIFFICULTY_FACTOR,
    WALLET_BINDING_TTL,
    VOTING_PERIOD,
    RESERVE_CONSENSUS_THRESHOLD
};

const char* param_key_str(ParamKey k);
bool parse_param_key(const std::string& s, ParamKey& out);
bool param_key_from_u8(uint8_t v, ParamKey& out);

uint64_t get_param(const SystemParams& p, ParamKey k);
// Applies the change only if the resulting set still validates.
bool set_param(SystemParams& p, ParamKey k, uint64_t value, std::string* err);

enum class PauseFlag : uint8_t {
    MINTING = 0,
    REDEMPTION = 1,
    REGISTRY = 2,
    WALLET_REGISTRATION = 3
};

const char* pause_flag_str(PauseFlag f);
bool pause_flag_from_u8(uint8_t v, PauseFlag& out);

struct PauseFlags {
    bool minting{false};
    bool redemption{false};
    bool registry{false};
    bool wallet_registration{false};

    bool is_paused(PauseFlag f) const;
    bool& flag(PauseFlag f);
};

enum class AdminError {
    OK = 0,
    UNAUTHORIZED,
    ALREADY_PAUSED,
    NOT_PAUSED,
    INVALID_PARAMETER,
    INVALID_ROLE_CHANGE
};

const char* admin_error_str(AdminError e);

struct SystemState {
    SystemParams params;
    PauseFlags   pauses;

    AdminError pause(PauseFlag f);
    AdminError unpause(PauseFlag f);
};

}  // namespace qcb
