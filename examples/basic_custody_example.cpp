/**
 * @file basic_custody_example.cpp
 * @brief Registers an account, signs cold then warm, and survives a cooperator key rotation
 *
 * Every collaborator runs in-process: the cooperator is reached through a
 * loopback transport, the chain is a fixed block and the "authenticator"
 * returns constant secrets. None of that is fit for production.
 */

#include "custodian/custody/key_custodian.hpp"
#include "custodian/crypto/sodium_interop.hpp"
#include "custodian/storage/wrapped_secret_store.hpp"
#include "custodian/unlock/cooperator_client.hpp"
#include "custodian/unlock/cooperator_keyring.hpp"
#include "custodian/unlock/cooperator_service.hpp"
#include "custodian/core/constants.hpp"

#include <iomanip>
#include <iostream>

using namespace custodian;
using namespace custodian::interfaces;

namespace {

class LoopbackTransport : public ICooperatorTransport {
public:
    explicit LoopbackTransport(std::shared_ptr<unlock::CooperatorService> service)
        : service_(std::move(service)) {}

    Result<CooperatorResponse, CustodyFailure> Post(std::string_view route, const std::string& body,
                                                    std::chrono::milliseconds) override {
        return Result<CooperatorResponse, CustodyFailure>::Ok(
            service_->Handle(CooperatorConstants::METHOD_POST, route, body));
    }

    Result<CooperatorResponse, CustodyFailure> Get(std::string_view route,
                                                   std::chrono::milliseconds) override {
        return Result<CooperatorResponse, CustodyFailure>::Ok(
            service_->Handle(CooperatorConstants::METHOD_GET, route, std::string()));
    }

private:
    std::shared_ptr<unlock::CooperatorService> service_;
};

class FixedChain : public IFreshnessOracle {
public:
    Result<BlockReference, CustodyFailure> LatestBlock() override { return BlockAt(kHeight); }

    Result<BlockReference, CustodyFailure> BlockAt(uint64_t height) override {
        if (height != kHeight) {
            return Result<BlockReference, CustodyFailure>::Err(CustodyFailure::NotFound("Unknown block"));
        }
        return Result<BlockReference, CustodyFailure>::Ok(
            BlockReference{kHeight, std::vector<uint8_t>(32, 0x42)});
    }

private:
    static constexpr uint64_t kHeight = 840000;
};

class ConstantAuthenticator : public IAuthenticationCeremony {
public:
    Result<CeremonyResult, CustodyFailure> Perform(const CeremonyRequest& request, std::stop_token) override {
        std::cout << "   [authenticator] " << (request.kind == CeremonyKind::Registration ? "register" : "assert")
                  << " for " << request.account_id << " @ " << request.rp_id << std::endl;
        CeremonyResult result;
        result.presence_confirmed = true;
        result.primary_secret = std::vector<uint8_t>(32, 0x11);
        result.secondary_secret = std::vector<uint8_t>(32, 0x22);
        result.assertion = request.challenge;
        return Result<CeremonyResult, CustodyFailure>::Ok(std::move(result));
    }
};

class PrintingEvents : public ICustodyEventHandler {
public:
    void OnCustodyEvent(CustodyEvent event, const std::string& account_id) override {
        std::cout << "   [event] " << ToString(event) << " (" << account_id << ")" << std::endl;
    }
};

void print_hex(const std::string& label, const std::vector<uint8_t>& data) {
    std::cout << label << ": ";
    for (auto byte : data) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(byte);
    }
    std::cout << std::dec << std::endl;
}

int fail(const std::string& step, const CustodyFailure& failure) {
    std::cerr << step << " failed: " << failure.message << std::endl;
    return 1;
}

}

int main() {
    std::cout << "=== Custodian - Basic Custody Example ===" << std::endl << std::endl;

    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        std::cerr << "Failed to initialize: " << init.UnwrapErr().message << std::endl;
        return 1;
    }

    std::cout << "1. Starting the cooperator (RFC 3526 2048-bit group)..." << std::endl;
    auto group = unlock::ShamirThreePass::Rfc3526Default();
    if (group.IsErr()) {
        return fail("Group setup", group.UnwrapErr());
    }
    auto shared_group = std::make_shared<const unlock::ShamirThreePass>(std::move(group).Unwrap());
    auto keyring_result = unlock::CooperatorKeyring::Create(shared_group);
    if (keyring_result.IsErr()) {
        return fail("Keyring", keyring_result.UnwrapErr());
    }
    std::shared_ptr<unlock::CooperatorKeyring> keyring = std::move(keyring_result).Unwrap();
    auto transport = std::make_shared<LoopbackTransport>(std::make_shared<unlock::CooperatorService>(keyring));
    auto client = std::make_shared<unlock::CooperatorClient>(transport);
    std::cout << "   Current key id: " << keyring->CurrentKeyId() << std::endl << std::endl;

    custody::KeyCustodianDependencies dependencies;
    dependencies.cooperator = std::make_shared<unlock::UnlockCooperator>(client, shared_group);
    dependencies.store = std::make_shared<storage::InMemoryWrappedSecretStore>();
    dependencies.chain = std::make_shared<FixedChain>();
    dependencies.ceremony = std::make_shared<ConstantAuthenticator>();
    dependencies.events = std::make_shared<PrintingEvents>();
    custody::KeyCustodian custodian(std::move(dependencies));

    std::cout << "2. Registering account 'alice'..." << std::endl;
    auto registered = custodian.RegisterAccount("alice", "wallet.example");
    if (registered.IsErr()) {
        return fail("Registration", registered.UnwrapErr());
    }
    print_hex("   Signing public key", registered.Unwrap().signing_public_key);
    print_hex("   VRF public key", registered.Unwrap().vrf_public_key);
    std::cout << std::endl;

    const std::vector<uint8_t> payload{'p', 'a', 'y', ' ', '1', '0'};
    std::cout << "3. Signing (cold path)..." << std::endl;
    auto cold = custodian.Sign("alice", "tab-1", payload);
    if (cold.IsErr()) {
        return fail("Cold signing", cold.UnwrapErr());
    }
    print_hex("   Signature", cold.Unwrap().signature);
    std::cout << std::endl;

    std::cout << "4. Signing again (warm path)..." << std::endl;
    auto warm = custodian.Sign("alice", "tab-1", payload);
    if (warm.IsErr()) {
        return fail("Warm signing", warm.UnwrapErr());
    }
    const auto capability_key = custody::KeyCustodian::CapabilityKey("alice", "tab-1");
    std::cout << "   Remaining uses: " << custodian.Sessions().RemainingUses(capability_key).value_or(0)
              << std::endl << std::endl;

    std::cout << "5. Rotating the cooperator key and signing in a new session..." << std::endl;
    auto rotated = keyring->Rotate();
    if (rotated.IsErr()) {
        return fail("Rotation", rotated.UnwrapErr());
    }
    std::cout << "   New key id: " << rotated.Unwrap() << std::endl;
    auto migrated = custodian.Sign("alice", "tab-2", payload);
    if (migrated.IsErr()) {
        return fail("Signing after rotation", migrated.UnwrapErr());
    }
    std::cout << std::endl;

    custodian.Logout();
    std::cout << "6. Logged out, " << custodian.Sessions().Size() << " capabilities left" << std::endl;
    std::cout << std::endl << "=== Example completed successfully ===" << std::endl;
    return 0;
}
