// tests/unit/sign_protocol_test.cpp
#include <gtest/gtest.h>
#include "IntakeTestSupport.hpp"
#include "common/utils/crypto/CryptoUtils.hpp"
#include "common/utils/hex/HexUtils.hpp"
#include "proto/intake/sign_request.pb.h"
#include "protocols/sign/include/SignOutcome.hpp"
#include "protocols/sign/include/SignRequestArgs.hpp"
#include "protocols/sign/include/SignatureRequest.hpp"
#include "protocols/sign/include/SignatureResponse.hpp"
#include <stdexcept>

using namespace chainsig;
using namespace chainsig::protocol::sign;
using json = nlohmann::json;

// ========== Payload ==========

TEST(PayloadTest, LengthBounds) {
    EXPECT_TRUE(Payload::Ecdsa(std::vector<uint8_t>(32, 1)).has_value());
    EXPECT_FALSE(Payload::Ecdsa(std::vector<uint8_t>(31, 1)).has_value());
    EXPECT_FALSE(Payload::Ecdsa(std::vector<uint8_t>(33, 1)).has_value());

    EXPECT_TRUE(Payload::Eddsa(std::vector<uint8_t>(32, 1)).has_value());
    EXPECT_TRUE(Payload::Eddsa(std::vector<uint8_t>(1232, 1)).has_value());
    EXPECT_FALSE(Payload::Eddsa(std::vector<uint8_t>(31, 1)).has_value());
    EXPECT_FALSE(Payload::Eddsa(std::vector<uint8_t>(1233, 1)).has_value());
}

TEST(PayloadTest, JsonForm) {
    Payload payload = test::EcdsaPayload(0xab);
    json j = payload.ToJson();

    ASSERT_TRUE(j.contains("Ecdsa"));
    EXPECT_EQ(j["Ecdsa"].get<std::string>(), utils::BytesToHex(std::vector<uint8_t>(32, 0xab)));
    EXPECT_EQ(Payload::FromJson(j), payload);

    EXPECT_FALSE(Payload::FromJson(json{{"Ecdsa", "zz"}}).has_value());
    EXPECT_FALSE(Payload::FromJson(json{{"Schnorr", std::string(64, '0')}}).has_value());
    EXPECT_FALSE(Payload::FromJson(json{{"Ecdsa", std::string(64, '0')}, {"Eddsa", std::string(64, '0')}}).has_value());
    EXPECT_FALSE(Payload::FromJson(json::array()).has_value());
}

// ========== SignRequestArgs ==========

TEST(SignRequestArgsTest, ParsesWrappedAndBareForms) {
    std::string hex = std::string(64, '1');

    SignRequestArgs wrapped;
    ASSERT_EQ(wrapped.FromJson(R"({"request":{"domain_id":1,"path":"eth/0","payload_v2":{"Ecdsa":")" + hex + R"("}}})"),
              ArgsParseResult::OK);
    EXPECT_EQ(wrapped.domain_id, 1u);
    EXPECT_EQ(wrapped.path, "eth/0");
    EXPECT_TRUE(wrapped.payload.IsEcdsa());

    // domain_id 생략 시 0
    SignRequestArgs bare;
    ASSERT_EQ(bare.FromJson(R"({"path":"sol","payload_v2":{"Eddsa":")" + hex + R"("}})"), ArgsParseResult::OK);
    EXPECT_EQ(bare.domain_id, 0u);
    EXPECT_TRUE(bare.payload.IsEddsa());

    SignRequestArgs reparsed;
    ASSERT_EQ(reparsed.FromJson(wrapped.ToJson()), ArgsParseResult::OK);
    EXPECT_EQ(reparsed.payload, wrapped.payload);
}

TEST(SignRequestArgsTest, RejectsInvalidArguments) {
    std::string payload = R"("payload_v2":{"Ecdsa":")" + std::string(64, '1') + R"("})";
    SignRequestArgs args;

    EXPECT_EQ(args.FromJson("{not json"), ArgsParseResult::MALFORMED_JSON);
    EXPECT_EQ(args.FromJson("[1,2]"), ArgsParseResult::MALFORMED_JSON);
    EXPECT_EQ(args.FromJson(R"({"request":5})"), ArgsParseResult::MALFORMED_JSON);
    EXPECT_EQ(args.FromJson(R"({"domain_id":-1,"path":"p",)" + payload + "}"), ArgsParseResult::INVALID_DOMAIN_ID);
    EXPECT_EQ(args.FromJson(R"({"domain_id":"0","path":"p",)" + payload + "}"), ArgsParseResult::INVALID_DOMAIN_ID);
    EXPECT_EQ(args.FromJson("{" + payload + "}"), ArgsParseResult::INVALID_PATH);
    EXPECT_EQ(args.FromJson(R"({"path":"",)" + payload + "}"), ArgsParseResult::INVALID_PATH);
    EXPECT_EQ(args.FromJson(R"({"path":" \t ",)" + payload + "}"), ArgsParseResult::INVALID_PATH);
    EXPECT_EQ(args.FromJson(R"({"path":"p"})"), ArgsParseResult::INVALID_PAYLOAD);
    EXPECT_EQ(args.FromJson(R"({"path":"p","payload_v2":{"Ecdsa":"0102"}})"), ArgsParseResult::INVALID_PAYLOAD);
}

// ========== SignatureRequest ==========

TEST(SignatureRequestTest, TweakBindsRequesterAndPath) {
    CryptoHash tweak = DeriveTweak("alice.near", "eth/0");

    EXPECT_EQ(tweak, utils::Sha3_256(std::string("chainsig v1 epsilon derivation:alice.near,eth/0")));
    EXPECT_NE(tweak, DeriveTweak("bob.near", "eth/0"));
    EXPECT_NE(tweak, DeriveTweak("alice.near", "eth/1"));
}

TEST(SignatureRequestTest, AccountIdRules) {
    EXPECT_TRUE(IsValidAccountId("alice"));
    EXPECT_TRUE(IsValidAccountId("alice.near"));
    EXPECT_TRUE(IsValidAccountId("a-b_c.v1.signer"));
    EXPECT_TRUE(IsValidAccountId(std::string(64, 'a')));

    EXPECT_FALSE(IsValidAccountId(""));
    EXPECT_FALSE(IsValidAccountId("a"));
    EXPECT_FALSE(IsValidAccountId(std::string(65, 'a')));
    EXPECT_FALSE(IsValidAccountId("alice,x"));
    EXPECT_FALSE(IsValidAccountId("Alice.near"));
    EXPECT_FALSE(IsValidAccountId(".alice"));
    EXPECT_FALSE(IsValidAccountId("alice."));
    EXPECT_FALSE(IsValidAccountId("alice..near"));
    EXPECT_FALSE(IsValidAccountId("alice near"));
}

// 경로에 ','가 있어도 요청자 경계가 모호해지지 않음
TEST(SignatureRequestTest, TweakRejectsAmbiguousRequester) {
    EXPECT_NO_THROW(DeriveTweak("alice", "x,y"));
    EXPECT_THROW(DeriveTweak("alice,x", "y"), std::invalid_argument);
    EXPECT_THROW(SignatureRequest::Create(0, test::EcdsaPayload(), "alice,x", "y"), std::invalid_argument);
}

TEST(SignatureRequestTest, FingerprintIsDeterministic) {
    SignatureRequest a = SignatureRequest::Create(0, test::EcdsaPayload(), "alice.near", "eth/0");
    SignatureRequest b = SignatureRequest::Create(0, test::EcdsaPayload(), "alice.near", "eth/0");

    EXPECT_EQ(a, b);
    EXPECT_EQ(a.Fingerprint(), b.Fingerprint());

    EXPECT_NE(a.Fingerprint(), SignatureRequest::Create(1, test::EcdsaPayload(), "alice.near", "eth/0").Fingerprint());
    EXPECT_NE(a.Fingerprint(), SignatureRequest::Create(0, test::EcdsaPayload(0x02), "alice.near", "eth/0").Fingerprint());
    EXPECT_NE(a.Fingerprint(), SignatureRequest::Create(0, test::EcdsaPayload(), "bob.near", "eth/0").Fingerprint());

    // 같은 바이트라도 태그가 다르면 다른 요청
    SignatureRequest eddsa = SignatureRequest::Create(0, test::EddsaPayload(32, 0x01), "alice.near", "eth/0");
    EXPECT_NE(a.Fingerprint(), eddsa.Fingerprint());
}

TEST(SignatureRequestTest, ContinuationArgumentEncoding) {
    SignatureRequest request = SignatureRequest::Create(3, test::EddsaPayload(100), "alice.near", "sol/7");

    auto decoded = SignatureRequest::Deserialize(request.Serialize());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, request);

    auto from_json = SignatureRequest::FromJson(request.ToJson());
    ASSERT_TRUE(from_json.has_value());
    EXPECT_EQ(*from_json, request);
}

TEST(SignatureRequestTest, DeserializeRejectsInconsistentMessages) {
    std::string encoded;

    chainsig::proto::intake::PendingSignRequest short_tweak;
    short_tweak.set_tweak("short");
    short_tweak.set_payload(std::string(32, '\x01'));
    ASSERT_TRUE(short_tweak.SerializeToString(&encoded));
    EXPECT_FALSE(SignatureRequest::Deserialize(encoded).has_value());

    chainsig::proto::intake::PendingSignRequest short_hash;
    short_hash.set_tweak(std::string(32, '\x00'));
    short_hash.set_payload_kind(chainsig::proto::intake::PAYLOAD_ECDSA);
    short_hash.set_payload(std::string(10, '\x01'));
    ASSERT_TRUE(short_hash.SerializeToString(&encoded));
    EXPECT_FALSE(SignatureRequest::Deserialize(encoded).has_value());

    EXPECT_FALSE(SignatureRequest::FromJson(json{{"domain_id", 0}, {"tweak", "00"}, {"payload", test::EcdsaPayload().ToJson()}}).has_value());
    EXPECT_FALSE(SignatureRequest::FromJson(json{{"tweak", std::string(64, '0')}}).has_value());
}

// ========== SignatureResponse ==========

TEST(SignatureResponseTest, Secp256k1WellFormedness) {
    SignatureResponse valid = test::Secp256k1Signature();
    EXPECT_TRUE(valid.IsWellFormed());
    EXPECT_TRUE(valid.MatchesPayload(PayloadType::ECDSA));
    EXPECT_FALSE(valid.MatchesPayload(PayloadType::EDDSA));

    SignatureResponse bad_prefix = valid;
    bad_prefix.big_r[0] = 0x04;
    EXPECT_FALSE(bad_prefix.IsWellFormed());

    SignatureResponse bad_scalar = valid;
    bad_scalar.s.assign(32, 0xff);
    EXPECT_FALSE(bad_scalar.IsWellFormed());

    SignatureResponse bad_recovery = valid;
    bad_recovery.recovery_id = 4;
    EXPECT_FALSE(bad_recovery.IsWellFormed());
}

TEST(SignatureResponseTest, Ed25519WellFormedness) {
    EXPECT_TRUE(test::Ed25519Signature().IsWellFormed());
    EXPECT_TRUE(test::Ed25519Signature().MatchesPayload(PayloadType::EDDSA));
    EXPECT_FALSE(SignatureResponse::Ed25519(std::vector<uint8_t>(63, 1)).IsWellFormed());
}

TEST(SignatureResponseTest, ParsesMpcResponseFormat) {
    json secp = {
        {"scheme", "Secp256k1"},
        {"big_r", {{"affine_point", "02" + std::string(64, 'a')}}},
        {"s", {{"scalar", std::string(64, '1')}}},
        {"recovery_id", 1}
    };
    auto parsed = SignatureResponse::FromJson(secp);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->scheme, SignatureScheme::SECP256K1);
    EXPECT_EQ(parsed->big_r.size(), SECP256K1_BIG_R_SIZE);
    EXPECT_EQ(parsed->recovery_id, 1);
    EXPECT_TRUE(parsed->IsWellFormed());
    EXPECT_EQ(parsed->ToJson(), secp);

    json ed = {{"scheme", "Ed25519"}, {"signature", std::vector<int>(64, 7)}};
    auto ed_parsed = SignatureResponse::FromJson(ed);
    ASSERT_TRUE(ed_parsed.has_value());
    EXPECT_EQ(ed_parsed->signature, std::vector<uint8_t>(64, 7));

    json overflow = {{"scheme", "Ed25519"}, {"signature", std::vector<int>(64, 256)}};
    EXPECT_FALSE(SignatureResponse::FromJson(overflow).has_value());
    EXPECT_FALSE(SignatureResponse::FromJson(json{{"scheme", "Bls"}}).has_value());
    EXPECT_FALSE(SignatureResponse::FromJson(json{{"scheme", "Secp256k1"}}).has_value());
}

// ========== SignOutcome ==========

TEST(SignOutcomeTest, ResumePayloadFormat) {
    EXPECT_EQ(SignOutcome::Failure(FailureReason::TIMEOUT).Serialize(), R"({"Err":"Timeout"})");
    EXPECT_EQ(SignOutcome::Failure(FailureReason::MALFORMED_RESULT).Serialize(), R"({"Err":"MalformedResult"})");

    SignOutcome success = SignOutcome::Success(test::Ed25519Signature());
    auto decoded = SignOutcome::Deserialize(success.Serialize());
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(decoded->IsSuccess());
    EXPECT_EQ(*decoded->signature, test::Ed25519Signature());

    auto timeout = SignOutcome::Deserialize(R"({"Err":"Timeout"})");
    ASSERT_TRUE(timeout.has_value());
    EXPECT_FALSE(timeout->IsSuccess());
    EXPECT_EQ(timeout->reason, FailureReason::TIMEOUT);

    EXPECT_FALSE(SignOutcome::Deserialize(R"({"Err":"Cancelled"})").has_value());
    EXPECT_FALSE(SignOutcome::Deserialize(R"({"Ok":{"scheme":"Ed25519"}})").has_value());
    EXPECT_FALSE(SignOutcome::Deserialize("garbage").has_value());
}
