// =============================================================================
// test_transaction_dispatcher.cpp: build/sign/broadcast state machine
// =============================================================================

#include <gtest/gtest.h>
#include "external_signer.hpp"
#include "fakes.hpp"
#include "transaction_dispatcher.hpp"
#include <memory>
#include <set>
#include <thread>

using namespace securewallet;
using namespace securewallet::testing;
using namespace std::chrono_literals;

namespace {

const std::string RECIPIENT = "0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed";

class DispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        rpc = std::make_shared<FakeChainRpc>();
        dispatcher = std::make_unique<TransactionDispatcher>(
            rpc, TransactionBuilder("1000"), 11155111, std::make_shared<SigningLockRegistry>());
        dispatcher->set_observer([this](DispatchState state, const std::string&) {
            std::lock_guard<std::mutex> lock(states_mu);
            states.push_back(state);
        });
        signer = std::make_unique<FakeSigner>(repeated_key(0x46));
        account = *signer->locate();
    }

    WalletError::ErrorType send_error(const std::string& to, const std::string& amount,
                                      const CancellationToken* cancel = nullptr) {
        try {
            dispatcher->send(*signer, account, to, amount, cancel);
        } catch (const WalletError& e) {
            return e.type();
        }
        ADD_FAILURE() << "send did not throw";
        return WalletError::ErrorType::ConfigError;
    }

    std::shared_ptr<FakeChainRpc> rpc;
    std::unique_ptr<TransactionDispatcher> dispatcher;
    std::unique_ptr<FakeSigner> signer;
    Account account;
    std::mutex states_mu;
    std::vector<DispatchState> states;
};

} // anonymous namespace

TEST_F(DispatcherTest, HappyPath) {
    rpc->nonce = 3;
    SendResult result = dispatcher->send(*signer, account, RECIPIENT, "0.5");

    EXPECT_EQ(result.attempts, 1);
    EXPECT_EQ(result.nonce, 3u);
    EXPECT_TRUE(result.broadcast_locally);
    ASSERT_EQ(rpc->broadcasts.size(), 1u);
    EXPECT_EQ(result.tx_hash, HexUtils::encode_prefixed(HashUtils::keccak256(rpc->broadcasts[0])));

    DecodedTransaction decoded = SignedTransaction::decode(rpc->broadcasts[0]);
    EXPECT_EQ(decoded.nonce, 3u);
    EXPECT_EQ(decoded.value.to_decimal(), "500000000000000000");
    EXPECT_EQ(decoded.gas_limit, DEFAULT_TRANSFER_GAS);
    EXPECT_EQ(decoded.recover_sender(), account.address);

    EXPECT_EQ(states, (std::vector<DispatchState>{
        DispatchState::Building, DispatchState::Signing, DispatchState::Broadcasting, DispatchState::Confirmed}));
}

TEST_F(DispatcherTest, NonceIsFetchedLast) {
    dispatcher->send(*signer, account, RECIPIENT, "1");
    EXPECT_EQ(rpc->calls, (std::vector<std::string>{"get_fee_data", "estimate_gas", "get_nonce", "broadcast"}));
}

TEST_F(DispatcherTest, NonceConflictRetriesOnceWithFreshNonce) {
    rpc->nonce = 5;
    rpc->nonce_conflicts = 1;
    SendResult result = dispatcher->send(*signer, account, RECIPIENT, "1");

    EXPECT_EQ(result.attempts, 2);
    EXPECT_EQ(result.nonce, 6u);
    EXPECT_EQ(signer->sign_calls.load(), 2);
    EXPECT_EQ(signer->signed_nonces, (std::vector<uint64_t>{5, 6}));
    ASSERT_EQ(rpc->broadcasts.size(), 2u);
    EXPECT_NE(rpc->broadcasts[0], rpc->broadcasts[1]);
}

TEST_F(DispatcherTest, RepeatedNonceConflictIsBroadcastRejected) {
    rpc->nonce_conflicts = 100;
    EXPECT_EQ(send_error(RECIPIENT, "1"), WalletError::ErrorType::BroadcastRejected);
    EXPECT_EQ(rpc->broadcasts.size(), 2u);
    EXPECT_EQ(signer->sign_calls.load(), 2);
    EXPECT_EQ(states.back(), DispatchState::Failed);
}

TEST_F(DispatcherTest, OtherBroadcastErrorsAreTerminalAndVerbatim) {
    rpc->broadcast_error = WalletError::ErrorType::BroadcastRejected;
    rpc->broadcast_message = "insufficient funds for gas * price + value";
    try {
        dispatcher->send(*signer, account, RECIPIENT, "1");
        FAIL() << "expected BroadcastRejected";
    } catch (const WalletError& e) {
        EXPECT_EQ(e.type(), WalletError::ErrorType::BroadcastRejected);
        EXPECT_STREQ(e.what(), "insufficient funds for gas * price + value");
    }
    EXPECT_EQ(rpc->broadcasts.size(), 1u);
}

TEST_F(DispatcherTest, ValidationHappensBeforeAnyIo) {
    EXPECT_EQ(send_error(RECIPIENT, "0"), WalletError::ErrorType::InvalidInput);
    EXPECT_EQ(send_error("0x1234", "1"), WalletError::ErrorType::InvalidInput);
    EXPECT_EQ(send_error(RECIPIENT, "1000.000000000000000001"), WalletError::ErrorType::InvalidInput);
    EXPECT_TRUE(rpc->calls.empty());
    EXPECT_EQ(signer->sign_calls.load(), 0);
    EXPECT_EQ(states.back(), DispatchState::Failed);
}

TEST_F(DispatcherTest, GasEstimationFailureIsTerminal) {
    rpc->fail_estimate = true;
    EXPECT_EQ(send_error(RECIPIENT, "1"), WalletError::ErrorType::GasEstimationFailed);
    EXPECT_EQ(signer->sign_calls.load(), 0);
    EXPECT_TRUE(rpc->broadcasts.empty());
}

TEST_F(DispatcherTest, FeeDataFailureIsTerminal) {
    rpc->fail_fee = true;
    EXPECT_EQ(send_error(RECIPIENT, "1"), WalletError::ErrorType::RpcError);
    EXPECT_EQ(signer->sign_calls.load(), 0);
}

TEST_F(DispatcherTest, CancelledBeforeStart) {
    CancellationToken token;
    token.cancel();
    EXPECT_EQ(send_error(RECIPIENT, "1", &token), WalletError::ErrorType::Cancelled);
    EXPECT_TRUE(rpc->calls.empty());
}

TEST_F(DispatcherTest, CancelledWhileSigningNeverBroadcasts) {
    CancellationToken token;
    dispatcher->set_observer([&token](DispatchState state, const std::string&) {
        if (state == DispatchState::Signing) {
            token.cancel();
        }
    });
    EXPECT_EQ(send_error(RECIPIENT, "1", &token), WalletError::ErrorType::Cancelled);
    EXPECT_EQ(signer->sign_calls.load(), 1);
    EXPECT_TRUE(rpc->broadcasts.empty());
}

TEST_F(DispatcherTest, CancellationAfterBroadcastIsIgnored) {
    CancellationToken token;
    dispatcher->set_observer([&token](DispatchState state, const std::string&) {
        if (state == DispatchState::Broadcasting) {
            token.cancel();
        }
    });
    EXPECT_NO_THROW(dispatcher->send(*signer, account, RECIPIENT, "1", &token));
    EXPECT_EQ(rpc->broadcasts.size(), 1u);
}

TEST_F(DispatcherTest, SignatureFromAnotherKeyIsNotBroadcast) {
    Account other{.address = address_of(repeated_key(0x47)), .kind = BackendKind::Software, .cached_balance = {}};
    try {
        dispatcher->send(*signer, other, RECIPIENT, "1");
        FAIL() << "expected SignatureVerificationFailed";
    } catch (const WalletError& e) {
        EXPECT_EQ(e.type(), WalletError::ErrorType::SignatureVerificationFailed);
    }
    EXPECT_TRUE(rpc->broadcasts.empty());
}

TEST_F(DispatcherTest, ExternalBackendSkipsLocalBroadcast) {
    auto session = std::make_shared<FakePairingSession>();
    session->accounts = nlohmann::json::array({RECIPIENT});
    ExternalSigner external;
    external.attach(session);
    Account remote = *external.locate();

    SendResult result = dispatcher->send(external, remote, "0xfB6916095ca1df60bB79Ce92cE3Ea74c37c5d359", "0.5");
    EXPECT_FALSE(result.broadcast_locally);
    EXPECT_EQ(result.tx_hash, session->send_result.get<std::string>());
    EXPECT_TRUE(rpc->broadcasts.empty());
    EXPECT_EQ(states.back(), DispatchState::Confirmed);
}

TEST_F(DispatcherTest, OneSigningAttemptPerAddress) {
    signer->sign_delay = 50ms;
    std::thread first([&] { dispatcher->send(*signer, account, RECIPIENT, "1"); });
    std::thread second([&] { dispatcher->send(*signer, account, RECIPIENT, "2"); });
    first.join();
    second.join();

    EXPECT_EQ(signer->max_concurrent.load(), 1);
    EXPECT_EQ(rpc->broadcast_count(), 2u);
    std::set<uint64_t> nonces(signer->signed_nonces.begin(), signer->signed_nonces.end());
    EXPECT_EQ(nonces, (std::set<uint64_t>{0, 1}));
}

TEST_F(DispatcherTest, EstimateFee) {
    FeeEstimate estimate = dispatcher->estimate_fee(account, RECIPIENT, "1");
    EXPECT_EQ(estimate.gas_limit, 21000u);
    EXPECT_EQ(estimate.total_wei.to_decimal(), "420000000000000");
    EXPECT_EQ(estimate.total(), "0.00042");
    EXPECT_THROW(dispatcher->estimate_fee(account, RECIPIENT, "0"), WalletError);
}

TEST_F(DispatcherTest, AwaitConfirmations) {
    rpc->mined["0xabc"] = 98;
    rpc->block_number = 100;
    EXPECT_TRUE(dispatcher->await_confirmations("0xabc", 3, 1ms, 2));
    EXPECT_FALSE(dispatcher->await_confirmations("0xabc", 4, 1ms, 2));
    EXPECT_FALSE(dispatcher->await_confirmations("0xunknown", 1, 1ms, 3));
}
