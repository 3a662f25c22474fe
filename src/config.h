#pragma once
#include <string>
#include <cstdint>
#include "params.h"
#include "watchdog_consensus.h"

namespace qcb {

struct BridgeConfig {
    std::string  datadir;                        // audit journal; empty = in memory only
    std::string  log_level = "info";
    std::string  log_file;
    SystemParams params;
    uint32_t     thresholds[PROPOSAL_TYPE_COUNT] = {DEFAULT_THRESHOLD, DEFAULT_THRESHOLD, DEFAULT_THRESHOLD,
                                                    DEFAULT_THRESHOLD, DEFAULT_THRESHOLD};
    uint32_t     epoch_current_bits = 0;
    uint32_t     epoch_previous_bits = 0;
    bool         require_coinbase_proof = true;
};

// Simple key=value loader. Unknown keys are ignored, malformed values are
// logged and leave the default in place. Returns false if file not found.
bool load_config(const std::string& path, BridgeConfig& out);

// Parameter rules plus threshold bounds.
bool validate_config(const BridgeConfig& cfg, std::string* err);

}
