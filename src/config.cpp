#include "config.h"
#include "log.h"
#include <algorithm>
#include <fstream>
#include <sstream>

using namespace qcb;

static inline std::string trim(const std::string& s){
    auto a = s.find_first_not_of(" \t\r\n");
    if(a==std::string::npos) return "";
    auto b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b-a+1);
}

static bool safe_parse_u64(const std::string& v, uint64_t& out, const std::string& key) {
    if (v.empty() || v[0] == '-') {
        log_error("Config: Invalid " + key + " value '" + v + "'");
        return false;
    }
    try {
        size_t used = 0;
        unsigned long long val = std::stoull(v, &used, 0);   // base 0: accepts 0x..
        if (used != v.size()) {
            log_error("Config: Invalid " + key + " value '" + v + "'");
            return false;
        }
        out = static_cast<uint64_t>(val);
        return true;
    } catch (const std::exception& e) {
        log_error("Config: Invalid " + key + " value '" + v + "': " + e.what());
        return false;
    }
}

static bool safe_parse_u32(const std::string& v, uint32_t& out, const std::string& key) {
    uint64_t x = 0;
    if (!safe_parse_u64(v, x, key)) return false;
    if (x > 0xffffffffULL) {
        log_error("Config: " + key + " value '" + v + "' is too large");
        return false;
    }
    out = static_cast<uint32_t>(x);
    return true;
}

bool qcb::load_config(const std::string& path, BridgeConfig& out){
    std::ifstream f(path);
    if(!f.is_open()) return false;

    std::string line;
    int line_num = 0;
    while(std::getline(f, line)){
        ++line_num;
        line = trim(line);
        if(line.empty()) continue;
        if(line[0]=='#') continue;
        if(line.rfind("//",0)==0) continue;

        auto kpos = line.find('=');
        if(kpos==std::string::npos) {
            log_error("Config line " + std::to_string(line_num) + ": missing '=' in '" + line + "'");
            continue;
        }
        std::string k = trim(line.substr(0,kpos));
        std::string v = trim(line.substr(kpos+1));
        std::transform(k.begin(), k.end(), k.begin(), ::tolower);

        ParamKey pk;
        ProposalType pt;
        if(k=="datadir") out.datadir = v;
        else if(k=="log_level") out.log_level = v;
        else if(k=="log_file") out.log_file = v;
        else if(k=="epoch_current_bits") safe_parse_u32(v, out.epoch_current_bits, k);
        else if(k=="epoch_previous_bits") safe_parse_u32(v, out.epoch_previous_bits, k);
        else if(k=="require_coinbase_proof") out.require_coinbase_proof = (v=="1"||v=="true");
        else if(parse_param_key(k, pk)) {
            uint64_t x = 0;
            if (safe_parse_u64(v, x, k)) {
                // Checked as a whole by validate_config.
                switch (pk) {
                    case ParamKey::MIN_MINT_AMOUNT:         out.params.min_mint_amount = x; break;
                    case ParamKey::MAX_MINT_AMOUNT:         out.params.max_mint_amount = x; break;
                    case ParamKey::MIN_REDEMPTION_AMOUNT:   out.params.min_redemption_amount = x; break;
                    case ParamKey::MAX_REDEMPTION_AMOUNT:   out.params.max_redemption_amount = x; break;
                    case ParamKey::REDEMPTION_TIMEOUT:      out.params.redemption_timeout = x; break;
                    case ParamKey::FULFILLMENT_GRACE:       out.params.fulfillment_grace = x; break;
                    case ParamKey::STALE_THRESHOLD:         out.params.stale_threshold = x; break;
                    case ParamKey::MAX_ATTESTATION_AGE:     out.params.max_attestation_age = x; break;
                    case ParamKey::FEE_TOLERANCE_BPS:       out.params.fee_tolerance_bps = x; break;
                    case ParamKey::PROOF_DIFFICULTY_FACTOR: out.params.proof_difficulty_factor = x; break;
                    case ParamKey::WALLET_BINDING_TTL:      out.params.wallet_binding_ttl = x; break;
                    case ParamKey::VOTING_PERIOD:           out.params.voting_period = x; break;
                    case ParamKey::RESERVE_CONSENSUS_THRESHOLD: out.params.reserve_consensus_threshold = x; break;
                }
            }
        }
        else if(k.rfind("threshold_",0)==0 && parse_proposal_type(k.substr(10), pt)) {
            safe_parse_u32(v, out.thresholds[static_cast<size_t>(pt)], k);
        }
    }
    return true;
}

bool qcb::validate_config(const BridgeConfig& cfg, std::string* err){
    if (!validate_params(cfg.params, err)) return false;
    for (size_t i = 0; i < PROPOSAL_TYPE_COUNT; ++i) {
        const uint32_t m = cfg.thresholds[i];
        if (m < MIN_THRESHOLD || m > MAX_THRESHOLD) {
            if (err) *err = std::string("threshold_") + proposal_type_str(static_cast<ProposalType>(i))
                            + " must be in [" + std::to_string(MIN_THRESHOLD) + ", "
                            + std::to_string(MAX_THRESHOLD) + "]";
            return false;
        }
    }
    LogLevel lvl;
    if (!parse_log_level(cfg.log_level, lvl)) {
        if (err) *err = "unknown log_level '" + cfg.log_level + "'";
        return false;
    }
    return true;
}
