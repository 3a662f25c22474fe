// qcbridge-cli: offline inspection tool for the bridge core.
#include "address.h"
#include "block.h"
#include "config.h"
#include "difficulty.h"
#include "events.h"
#include "hex.h"
#include "journal.h"
#include "log.h"
#include "script.h"
#include "serialize.h"
#include "spv.h"
#include "tx.h"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace qcb;

#define QCB_VERSION_MAJOR 0
#define QCB_VERSION_MINOR 3
#define QCB_VERSION_PATCH 0

static void print_usage(){
    std::cout
      << "\n"
      << "qcbridge-cli v" << QCB_VERSION_MAJOR << "." << QCB_VERSION_MINOR << "." << QCB_VERSION_PATCH << "\n"
      << "\n"
      << "Usage: qcbridge-cli [options] <command>\n"
      << "\n"
      << "Options:\n"
      << "  --conf=<path>              Configuration file (key=value format)\n"
      << "  --datadir=<path>           Audit journal directory (overrides conf)\n"
      << "\n"
      << "Commands:\n"
      << "  --decode-tx=<hex>          Parse a raw Bitcoin transaction\n"
      << "  --decode-address=<addr>    Decode a Base58Check or Bech32 address\n"
      << "  --decode-header=<hex>      Parse an 80-byte block header\n"
      << "  --verify-proof=<path>      Verify an SPV proof file against the configured epochs\n"
      << "  --dump-journal             Print the audit journal in --datadir\n"
      << "  --help                     Show this help\n"
      << "\n"
      << "Proof file keys: tx, headers, merkle_proof, tx_index, coinbase_preimage, coinbase_proof (hex)\n"
      << "\n";
}

static bool is_recognized_arg(const std::string& s){
    if(s.rfind("--conf=",0)==0) return true;
    if(s.rfind("--datadir=",0)==0) return true;
    if(s.rfind("--decode-tx=",0)==0) return true;
    if(s.rfind("--decode-address=",0)==0) return true;
    if(s.rfind("--decode-header=",0)==0) return true;
    if(s.rfind("--verify-proof=",0)==0) return true;
    if(s=="--dump-journal") return true;
    if(s=="--help") return true;
    return false;
}

static const char* network_str(BtcNetwork n){
    switch(n){
        case BtcNetwork::MAINNET: return "mainnet";
        case BtcNetwork::TESTNET: return "testnet";
        case BtcNetwork::REGTEST: return "regtest";
    }
    return "unknown";
}

static int cmd_decode_tx(const std::string& hex){
    BtcTransaction tx;
    ParseError pe = parse_btc_tx_hex(hex, tx);
    if(pe != ParseError::OK){
        std::fprintf(stderr, "decode failed: %s\n", parse_error_str(pe));
        return 1;
    }
    std::cout << "txid=" << to_hex_rev(tx.txid()) << "\n"
              << "version=" << tx.version << "\n"
              << "segwit=" << (tx.segwit ? 1 : 0) << "\n"
              << "locktime=" << tx.locktime << "\n";
    for(size_t i=0;i<tx.vin.size();++i){
        const auto& in = tx.vin[i];
        std::cout << "vin[" << i << "] prev=" << to_hex_rev(in.prevout.hash) << ":" << in.prevout.index
                  << " script_len=" << in.script_sig.size() << " witness_items=" << in.witness.size() << "\n";
    }
    for(size_t i=0;i<tx.vout.size();++i){
        const auto& out = tx.vout[i];
        Bytes h;
        ScriptType st = classify_script(out.script_pubkey);
        std::cout << "vout[" << i << "] value=" << out.value << " type=" << script_type_str(st);
        if(extract_pay_to_hash(out.script_pubkey, h)) std::cout << " hash=" << to_hex(h);
        Bytes data;
        if(op_return_data(out.script_pubkey, data)) std::cout << " op_return=" << to_hex(data);
        std::cout << "\n";
    }
    return 0;
}

static int cmd_decode_address(const std::string& addr){
    DecodedAddress d;
    if(!decode_btc_address(addr, d)){
        std::fprintf(stderr, "invalid address: %s\n", addr.c_str());
        return 1;
    }
    std::cout << "type=" << script_type_str(d.type) << "\n"
              << "network=" << network_str(d.network) << "\n"
              << "hash=" << to_hex(d.hash) << "\n"
              << "script=" << to_hex(address_to_script(addr)) << "\n";
    return 0;
}

static int cmd_decode_header(const std::string& hex){
    Bytes raw;
    BtcHeader h;
    if(!from_hex(hex, raw) || raw.size() != BTC_HEADER_SIZE ||
       parse_btc_header(raw.data(), raw.size(), h) != ParseError::OK){
        std::fprintf(stderr, "invalid header\n");
        return 1;
    }
    BigNum target;
    const bool target_ok = target_from_bits(h.bits, target);
    std::cout << "hash=" << to_hex_rev(h.hash()) << "\n"
              << "prev=" << to_hex_rev(h.prev_hash) << "\n"
              << "merkle_root=" << to_hex_rev(h.merkle_root) << "\n"
              << "time=" << h.time << "\n"
              << "bits=" << h.bits << "\n"
              << "target=" << (target_ok ? target.to_hex() : std::string("invalid")) << "\n"
              << "work=" << work_from_bits(h.bits).to_dec() << "\n"
              << "pow_ok=" << (check_header_pow(h) ? 1 : 0) << "\n";
    return 0;
}

static bool load_proof_file(const std::string& path, Bytes& raw_tx, SpvProof& proof){
    std::ifstream f(path);
    if(!f.is_open()){ std::fprintf(stderr, "cannot open %s\n", path.c_str()); return false; }
    std::string line;
    bool have_tx=false, have_index=false;
    while(std::getline(f, line)){
        if(line.empty() || line[0]=='#') continue;
        auto eq = line.find('=');
        if(eq==std::string::npos) continue;
        std::string k = line.substr(0, eq), v = line.substr(eq+1);
        while(!v.empty() && (v.back()=='\r' || v.back()==' ')) v.pop_back();
        bool ok = true;
        if(k=="tx") { ok = from_hex(v, raw_tx); have_tx = ok; }
        else if(k=="headers") ok = from_hex(v, proof.bitcoin_headers);
        else if(k=="merkle_proof") ok = from_hex(v, proof.merkle_proof);
        else if(k=="coinbase_preimage") ok = from_hex(v, proof.coinbase_preimage);
        else if(k=="coinbase_proof") ok = from_hex(v, proof.coinbase_proof);
        else if(k=="tx_index"){
            try { proof.tx_index_in_block = std::stoull(v); have_index = true; }
            catch(const std::exception&){ ok = false; }
        }
        if(!ok){ std::fprintf(stderr, "bad value for %s\n", k.c_str()); return false; }
    }
    if(!have_tx || !have_index){ std::fprintf(stderr, "proof file needs tx and tx_index\n"); return false; }
    return true;
}

static int cmd_verify_proof(const BridgeConfig& cfg, const std::string& path){
    Bytes raw_tx;
    SpvProof proof;
    if(!load_proof_file(path, raw_tx, proof)) return 1;
    DifficultyOracle oracle(cfg.epoch_current_bits, cfg.epoch_previous_bits);
    SpvVerifier verifier(oracle, cfg.params.proof_difficulty_factor, cfg.require_coinbase_proof);
    VerifiedTx vt;
    ParseError pe = ParseError::OK;
    SpvError se = verifier.verify(raw_tx, proof, vt, &pe);
    if(se != SpvError::OK){
        std::fprintf(stderr, "proof rejected: %s", spv_error_str(se));
        if(se == SpvError::MALFORMED_TX) std::fprintf(stderr, " (%s)", parse_error_str(pe));
        std::fprintf(stderr, "\n");
        return 1;
    }
    std::cout << "txid=" << to_hex_rev(vt.txid) << "\n"
              << "block=" << to_hex_rev(vt.block_hash) << "\n"
              << "confirmations=" << vt.confirmations << "\n"
              << "work=" << vt.accumulated_work.to_dec() << "\n";
    return 0;
}

static int cmd_dump_journal(const std::string& datadir){
    if(datadir.empty()){ std::fprintf(stderr, "--dump-journal needs a datadir\n"); return 2; }
    AuditJournal j;
    std::string err;
    if(!j.open(datadir, &err)){ std::fprintf(stderr, "open journal: %s\n", err.c_str()); return 1; }
    std::vector<Event> events;
    std::vector<SpvAuditRecord> proofs;
    if(!j.load_events(events, &err) || !j.load_proofs(proofs, &err)){
        std::fprintf(stderr, "read journal: %s\n", err.c_str());
        return 1;
    }
    for(const auto& e : events)
        std::cout << e.time << " " << event_type_str(e.type) << " " << e.subject << " " << e.detail << "\n";
    for(const auto& p : proofs)
        std::cout << p.time << " proof " << p.purpose << " " << p.subject << " txid=" << to_hex_rev(p.txid)
                  << " confirmations=" << p.confirmations << "\n";
    return 0;
}

int main(int argc, char** argv){
    std::string conf, datadir_override;
    for(int i=1;i<argc;i++){
        std::string a(argv[i]);
        if(!is_recognized_arg(a)){
            std::fprintf(stderr, "Unknown option: %s\nUse --help to see supported options.\n", argv[i]);
            return 2;
        }
        if(a=="--help"){ print_usage(); return 0; }
        if(a.rfind("--conf=",0)==0) conf = a.substr(7);
        else if(a.rfind("--datadir=",0)==0) datadir_override = a.substr(10);
    }

    BridgeConfig cfg;
    if(!conf.empty() && !load_config(conf, cfg)){
        std::fprintf(stderr, "cannot read config %s\n", conf.c_str());
        return 1;
    }
    if(!datadir_override.empty()) cfg.datadir = datadir_override;
    std::string err;
    if(!validate_config(cfg, &err)){
        std::fprintf(stderr, "invalid config: %s\n", err.c_str());
        return 1;
    }
    LogLevel lvl = LogLevel::INFO;
    parse_log_level(cfg.log_level, lvl);   // checked by validate_config
    log_init(lvl, static_cast<uint32_t>(LogCategory::ALL), cfg.log_file);

    int rc = 2;
    bool ran = false;
    for(int i=1;i<argc && !ran;i++){
        std::string a(argv[i]);
        if(a.rfind("--decode-tx=",0)==0){ rc = cmd_decode_tx(a.substr(12)); ran = true; }
        else if(a.rfind("--decode-address=",0)==0){ rc = cmd_decode_address(a.substr(17)); ran = true; }
        else if(a.rfind("--decode-header=",0)==0){ rc = cmd_decode_header(a.substr(16)); ran = true; }
        else if(a.rfind("--verify-proof=",0)==0){ rc = cmd_verify_proof(cfg, a.substr(15)); ran = true; }
        else if(a=="--dump-journal"){ rc = cmd_dump_journal(cfg.datadir); ran = true; }
    }
    if(!ran) print_usage();
    log_shutdown();
    return rc;
}
