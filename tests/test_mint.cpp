// Minting against attested reserves.
#include "custodian_registry.h"
#include "minting.h"
#include "reserve_ledger.h"
#include "token_bank.h"
#include "test_util.h"
#include <cstdio>

using namespace qcb;

// Bank that refuses every credit.
class RefusingBank : public TokenBank {
public:
    bool credit(const ActorId&, uint64_t, std::string* err) override {
        if (err) *err = "recipient frozen";
        return false;
    }
    bool burn(const ActorId&, uint64_t, std::string* err) override {
        if (err) *err = "recipient frozen";
        return false;
    }
    uint64_t balance_of(const ActorId&) const override { return 0; }
};

int main(){
    RoleTable roles;
    roles.grant("registrar", Role::REGISTRAR);
    roles.grant("attester", Role::ATTESTER);
    roles.grant("minter", Role::MINTER);
    const AuthorizationContext registrar("registrar", roles);
    const AuthorizationContext attester("attester", roles);
    const AuthorizationContext minter("minter", roles);
    const AuthorizationContext nobody("nobody", roles);

    SystemState sys;
    CustodianRegistry reg;
    ReserveLedger ledger;
    InMemoryTokenBank bank;
    const uint64_t now = 1700000000;
    EventLog ev;
    TEST_CHECK(reg.register_custodian(registrar, "qc1", 1000000, sys, now, ev) == RegistryError::OK, "register");

    // Preconditions, in order.
    {
        EventLog e;
        TEST_CHECK(mint(nobody, "qc1", "alice", 50000, sys, reg, ledger, bank, now, e) == MintError::UNAUTHORIZED,
                   "minter role required");
        sys.pause(PauseFlag::MINTING);
        TEST_CHECK(mint(minter, "qc1", "alice", 50000, sys, reg, ledger, bank, now, e) == MintError::PAUSED,
                   "minting paused");
        sys.unpause(PauseFlag::MINTING);
        TEST_CHECK(mint(minter, "qcX", "alice", 50000, sys, reg, ledger, bank, now, e)
                   == MintError::UNKNOWN_CUSTODIAN, "unknown custodian");
        TEST_CHECK(mint(minter, "qc1", "alice", 50000, sys, reg, ledger, bank, now, e)
                   == MintError::STALE_ATTESTATION, "never attested");
        TEST_CHECK(ledger.submit_attestation(attester, "qc1", 600000, now - 10, sys.params, reg, now, e)
                   == LedgerError::OK, "attest");
        TEST_CHECK(mint(minter, "qc1", "alice", sys.params.min_mint_amount - 1, sys, reg, ledger, bank, now, e)
                   == MintError::AMOUNT_OUT_OF_RANGE, "below minimum");
        TEST_CHECK(mint(minter, "qc1", "alice", 600001, sys, reg, ledger, bank, now, e)
                   == MintError::INSUFFICIENT_CAPACITY, "above attested balance");
        TEST_CHECK(bank.total_supply() == 0 && reg.find("qc1")->minted_amount == 0, "nothing minted");
        std::printf("  [PASS] mint preconditions\n");
    }

    // Successful mints consume capacity.
    {
        EventLog e;
        TEST_CHECK(mint(minter, "qc1", "alice", 400000, sys, reg, ledger, bank, now, e) == MintError::OK, "mint");
        TEST_CHECK(bank.balance_of("alice") == 400000, "recipient credited");
        TEST_CHECK(reg.find("qc1")->minted_amount == 400000, "minted tracked");
        TEST_CHECK(ledger.available_capacity(*reg.find("qc1")) == 200000, "capacity reduced");
        TEST_CHECK(e.events().size() == 1 && e.events()[0].type == EventType::MINTED, "one MINTED event");
        TEST_CHECK(mint(minter, "qc1", "bob", 200001, sys, reg, ledger, bank, now, e)
                   == MintError::INSUFFICIENT_CAPACITY, "capacity exhausted");
        TEST_CHECK(mint(minter, "qc1", "bob", 200000, sys, reg, ledger, bank, now, e) == MintError::OK,
                   "exactly the remaining capacity");
        TEST_CHECK(ledger.available_capacity(*reg.find("qc1")) == 0, "no capacity left");
        std::printf("  [PASS] mint consumes capacity\n");
    }

    // Stale reserves and inactive custodians block minting.
    {
        EventLog e;
        TEST_CHECK(reg.register_custodian(registrar, "qc2", 1000000, sys, now, ev) == RegistryError::OK, "qc2");
        TEST_CHECK(ledger.submit_attestation(attester, "qc2", 500000, now, sys.params, reg, now, e)
                   == LedgerError::OK, "attest qc2");
        const uint64_t later = now + sys.params.stale_threshold + 1;
        TEST_CHECK(mint(minter, "qc2", "alice", 20000, sys, reg, ledger, bank, later, e)
                   == MintError::STALE_ATTESTATION, "stale attestation");
        TEST_CHECK(reg.set_status("qc2", CustodianStatus::UNDER_REVIEW, "audit", StatusSource::AUTOMATIC, now, e)
                   == RegistryError::OK, "review");
        TEST_CHECK(mint(minter, "qc2", "alice", 20000, sys, reg, ledger, bank, now, e)
                   == MintError::CUSTODIAN_NOT_ACTIVE, "custodian under review");
        std::printf("  [PASS] stale and inactive\n");
    }

    // A bank refusal leaves the custodian untouched.
    {
        EventLog e;
        TEST_CHECK(reg.set_status("qc2", CustodianStatus::ACTIVE, "cleared", StatusSource::ARBITER, now, e)
                   == RegistryError::OK, "reactivate");
        RefusingBank refusing;
        EventLog m;
        TEST_CHECK(mint(minter, "qc2", "alice", 20000, sys, reg, ledger, refusing, now, m)
                   == MintError::BANK_REJECTED, "bank refusal surfaced");
        TEST_CHECK(reg.find("qc2")->minted_amount == 0 && m.empty(), "no partial mint");
        std::printf("  [PASS] bank refusal\n");
    }

    std::printf("All mint tests passed\n");
    return 0;
}
