// tests/unit/continuation_bridge_test.cpp
#include <gtest/gtest.h>
#include "IntakeTestSupport.hpp"
#include "host/include/LocalHost.hpp"
#include "intake/include/ContinuationBridge.hpp"

using namespace chainsig;
using namespace chainsig::intake;
using chainsig::host::ContinuationToken;
using chainsig::protocol::sign::FailureReason;
using chainsig::protocol::sign::SignatureRequest;
using chainsig::protocol::sign::SignOutcome;

// ========== 테스트 Fixture ==========

class ContinuationBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        local_host.AttachParticipant(&registry);
        local_host.RegisterEntryPoint(ContinuationBridge::RESUME_ENTRY_POINT,
            [this](const ContinuationToken& token, const std::string& args, const std::optional<std::string>& payload) {
                return bridge.OnResume(token, args, payload);
            });
    }

    host::CallContext Context(const std::string& account) {
        host::CallContext context;
        context.predecessor = account;
        context.prepaid_gas = 300 * TGAS;
        return context;
    }

    ContinuationToken Create(const SignatureRequest& request) {
        return local_host.Call(Context("alice.near"), [&]() { return bridge.Create(request); });
    }

    std::optional<SignOutcome> Finalize(const ContinuationToken& token, const SignatureRequest& request, const SignOutcome& outcome) {
        return local_host.Call(Context("signer.local"), [&]() { return bridge.Finalize(token, request, outcome); });
    }

    host::LocalHost local_host;
    RequestRegistry registry;
    ContinuationBridge bridge{local_host, registry, 7 * TGAS};

    SignatureRequest request = SignatureRequest::Create(0, test::EddsaPayload(), "alice.near", "sol/0");
};

TEST_F(ContinuationBridgeTest, CreateSuspendsAndRegisters) {
    ContinuationToken token = Create(request);

    EXPECT_EQ(registry.Get(request.Fingerprint()), token);
    EXPECT_EQ(local_host.GetContinuationState(token), host::ContinuationState::SUSPENDED);
}

TEST_F(ContinuationBridgeTest, DuplicateRequestOverridesCallback) {
    test::LogCapture logs;

    ContinuationToken first = Create(request);
    ContinuationToken second = Create(request);

    EXPECT_NE(first, second);
    EXPECT_EQ(registry.Size(), 1u);
    EXPECT_EQ(registry.Get(request.Fingerprint()), second);
    EXPECT_EQ(logs.Count("request already present, overriding callback.", utils::LogLevel::WARN), 1u);

    // 덮어쓰인 continuation 도 호스트에는 남아 있음
    EXPECT_EQ(local_host.GetContinuationState(first), host::ContinuationState::SUSPENDED);
}

TEST_F(ContinuationBridgeTest, FinalizeCleansExactlyOnce) {
    ContinuationToken token = Create(request);
    SignOutcome outcome = SignOutcome::Success(test::Ed25519Signature());

    auto delivered = Finalize(token, request, outcome);
    ASSERT_TRUE(delivered.has_value());
    EXPECT_TRUE(delivered->IsSuccess());
    EXPECT_EQ(registry.Size(), 0u);

    // 두 번째 호출은 정리할 항목이 없음
    test::LogCapture logs;
    EXPECT_FALSE(Finalize(token, request, outcome).has_value());
    EXPECT_EQ(registry.Size(), 0u);
    EXPECT_EQ(logs.Count("nothing to clean", utils::LogLevel::WARN), 1u);
}

// 덮어쓰기로 항목이 사라진 토큰의 finalize 는 no-op
TEST_F(ContinuationBridgeTest, FinalizeOfSupersededTokenIsNoOp) {
    ContinuationToken first = Create(request);
    ContinuationToken second = Create(request);

    test::LogCapture logs;
    EXPECT_NO_THROW({
        EXPECT_FALSE(Finalize(first, request, SignOutcome::Success(test::Ed25519Signature())).has_value());
    });
    EXPECT_EQ(logs.Count("superseded", utils::LogLevel::WARN), 1u);

    // 최신 항목은 그대로
    EXPECT_EQ(registry.Get(request.Fingerprint()), second);
}

TEST_F(ContinuationBridgeTest, FailureOutcomeStillCleansUp) {
    ContinuationToken token = Create(request);

    auto delivered = Finalize(token, request, SignOutcome::Failure(FailureReason::TIMEOUT));
    ASSERT_TRUE(delivered.has_value());
    EXPECT_FALSE(delivered->IsSuccess());
    EXPECT_EQ(delivered->reason, FailureReason::TIMEOUT);
    EXPECT_EQ(registry.Size(), 0u);
}

TEST_F(ContinuationBridgeTest, ResumeThroughHost) {
    ContinuationToken token = Create(request);
    SignOutcome outcome = SignOutcome::Success(test::Ed25519Signature());

    RespondStatus status = local_host.Call(Context("mpc.near"), [&]() { return bridge.Resume(request, outcome); });
    EXPECT_EQ(status, RespondStatus::RESUMED);
    EXPECT_EQ(registry.Size(), 1u);

    EXPECT_EQ(local_host.ProcessResumptions(), 1u);
    EXPECT_EQ(registry.Size(), 0u);

    auto delivery = local_host.GetDelivery(token);
    ASSERT_TRUE(delivery.has_value());
    EXPECT_EQ(delivery->requester, "alice.near");
    EXPECT_EQ(delivery->value, outcome.Serialize());
}

TEST_F(ContinuationBridgeTest, ResumeUnknownRequest) {
    RespondStatus status = local_host.Call(Context("mpc.near"), [&]() {
        return bridge.Resume(request, SignOutcome::Success(test::Ed25519Signature()));
    });
    EXPECT_EQ(status, RespondStatus::REQUEST_NOT_FOUND);
}

TEST_F(ContinuationBridgeTest, OrphanedContinuationTimesOutWithoutTouchingNewEntry) {
    ContinuationToken first = Create(request);
    ContinuationToken second = Create(request);

    // 두 continuation 모두 만료
    EXPECT_EQ(local_host.AdvanceBlocks(DEFAULT_YIELD_TIMEOUT_BLOCKS), 2u);

    EXPECT_EQ(local_host.GetDelivery(first)->status, host::DeliveryStatus::EMPTY);
    EXPECT_EQ(local_host.GetDelivery(second)->status, host::DeliveryStatus::DELIVERED);
    EXPECT_EQ(local_host.GetDelivery(second)->value, SignOutcome::Failure(FailureReason::TIMEOUT).Serialize());
    EXPECT_EQ(registry.Size(), 0u);
}

TEST_F(ContinuationBridgeTest, UndecodableResumePayloadIsMalformedResult) {
    ContinuationToken token = Create(request);

    auto value = local_host.Call(Context("signer.local"), [&]() {
        return bridge.OnResume(token, request.Serialize(), std::string("{\"Ok\":42}"));
    });

    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, SignOutcome::Failure(FailureReason::MALFORMED_RESULT).Serialize());
    EXPECT_EQ(registry.Size(), 0u);
}

TEST_F(ContinuationBridgeTest, UndecodableArgumentsAbortTheCall) {
    ContinuationToken token = Create(request);

    EXPECT_THROW(local_host.Call(Context("signer.local"), [&]() {
        return bridge.OnResume(token, "not a request", std::nullopt);
    }), IntakeFault);

    EXPECT_EQ(registry.Get(request.Fingerprint()), token);
}
