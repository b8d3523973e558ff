// tests/unit/intake_command_handler_test.cpp
#include <gtest/gtest.h>
#include "IntakeTestSupport.hpp"
#include "common/utils/hex/HexUtils.hpp"
#include "service/IntakeCommandHandler.hpp"

using namespace chainsig;
using json = nlohmann::json;
using chainsig::protocol::sign::SignatureRequest;

class IntakeCommandHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        keys.PutPublicKey(0, test::Ed25519Key());
        service = std::make_unique<intake::SignService>(local_host, keys, intake::IntakeSettings::Defaults());
        handler = std::make_unique<service::IntakeCommandHandler>(local_host, *service);
    }

    json Run(const json& command) {
        return json::parse(handler->HandleLine(command.dump()));
    }

    json SignCommand(Balance deposit = 1) {
        return json{
            {"cmd", "sign"},
            {"caller", "alice.near"},
            {"deposit", deposit},
            {"gas", 300 * TGAS},
            {"args", {{"request", {{"domain_id", 0}, {"path", "p/0"}, {"payload_v2", payload.ToJson()}}}}}
        };
    }

    json RequestJson() {
        return SignatureRequest::Create(0, payload, "alice.near", "p/0").ToJson();
    }

    host::LocalHost local_host;
    test::InMemoryDomainKeyService keys;
    std::unique_ptr<intake::SignService> service;
    std::unique_ptr<service::IntakeCommandHandler> handler;
    protocol::sign::Payload payload = test::EddsaPayload();
};

TEST_F(IntakeCommandHandlerTest, SignThenRespondDeliversSignature) {
    json signed_reply = Run(SignCommand(3));
    ASSERT_TRUE(signed_reply["ok"].get<bool>()) << signed_reply.dump();
    EXPECT_EQ(signed_reply["refund"].get<Balance>(), 2u);

    json pending = Run({{"cmd", "pending"}, {"request", RequestJson()}});
    EXPECT_EQ(pending["token"], signed_reply["token"]);

    json respond = Run({
        {"cmd", "respond"},
        {"signer", "mpc.near"},
        {"request", RequestJson()},
        {"response", test::Ed25519Signature().ToJson()}
    });
    EXPECT_TRUE(respond["ok"].get<bool>());
    EXPECT_EQ(respond["status"], "Resumed");
    ASSERT_TRUE(respond.contains("delivery"));
    EXPECT_EQ(respond["delivery"]["requester"], "alice.near");
    EXPECT_EQ(respond["delivery"]["status"], "DELIVERED");

    json after = Run({{"cmd", "pending"}, {"request", RequestJson()}});
    EXPECT_TRUE(after["token"].is_null());
}

TEST_F(IntakeCommandHandlerTest, RejectedSignReportsError) {
    json reply = Run(SignCommand(0));
    EXPECT_FALSE(reply["ok"].get<bool>());
    EXPECT_EQ(reply["error"], "InsufficientDeposit");
}

TEST_F(IntakeCommandHandlerTest, AdvanceTimesOutPendingRequests) {
    json signed_reply = Run(SignCommand());
    ASSERT_TRUE(signed_reply["ok"].get<bool>());

    json advance = Run({{"cmd", "advance"}, {"blocks", DEFAULT_YIELD_TIMEOUT_BLOCKS}});
    EXPECT_EQ(advance["timed_out"].get<size_t>(), 1u);

    json delivery = Run({{"cmd", "delivery"}, {"token", signed_reply["token"]}});
    EXPECT_TRUE(delivery["delivered"].get<bool>());
    EXPECT_TRUE(delivery["timed_out"].get<bool>());
    EXPECT_EQ(delivery["value"], R"({"Err":"Timeout"})");
}

TEST_F(IntakeCommandHandlerTest, MalformedResponseIsReportedAsResumedMalformed) {
    Run(SignCommand());

    json respond = Run({
        {"cmd", "respond"},
        {"request", RequestJson()},
        {"response", {{"scheme", "Ed25519"}, {"signature", "not-bytes"}}}
    });
    EXPECT_EQ(respond["status"], "ResumedMalformed");
    EXPECT_EQ(respond["delivery"]["value"], R"({"Err":"MalformedResult"})");
}

TEST_F(IntakeCommandHandlerTest, RespondWithoutPendingRequest) {
    json respond = Run({
        {"cmd", "respond"},
        {"request", RequestJson()},
        {"response", test::Ed25519Signature().ToJson()}
    });
    EXPECT_FALSE(respond["ok"].get<bool>());
    EXPECT_EQ(respond["status"], "RequestNotFound");
}

TEST_F(IntakeCommandHandlerTest, BadInputLines) {
    EXPECT_EQ(json::parse(handler->HandleLine("not json"))["error"], "MalformedCommand");
    EXPECT_EQ(Run({{"cmd", "nope"}})["error"], "UnknownCommand");
    EXPECT_EQ(Run({{"cmd", "sign"}})["error"], "MalformedCommand");
    EXPECT_EQ(Run({{"cmd", "delivery"}, {"token", "zz"}})["error"], "MalformedCommand");
}

TEST_F(IntakeCommandHandlerTest, KeyQueries) {
    json key = Run({{"cmd", "public_key"}});
    EXPECT_TRUE(key["ok"].get<bool>());
    EXPECT_EQ(key["public_key"], test::Ed25519Key().ToString());

    EXPECT_EQ(Run({{"cmd", "public_key"}, {"domain_id", 9}})["error"], "DomainNotFound");
    EXPECT_EQ(Run({{"cmd", "latest_key_version"}})["latest_key_version"].get<DomainId>(), 0u);
}

TEST_F(IntakeCommandHandlerTest, KeyServiceFailuresBecomeReplies) {
    keys.fail_lookups = true;
    EXPECT_EQ(Run({{"cmd", "public_key"}})["error"], "KeyServiceError");

    // 예상 밖의 예외도 응답으로 돌려주고 다음 명령을 계속 처리
    keys.fail_listing = true;
    json reply;
    ASSERT_NO_THROW(reply = Run({{"cmd", "latest_key_version"}}));
    EXPECT_FALSE(reply["ok"].get<bool>());
    EXPECT_EQ(reply["error"], "InternalError");

    keys.fail_lookups = false;
    keys.fail_listing = false;
    EXPECT_TRUE(Run({{"cmd", "public_key"}})["ok"].get<bool>());
}
