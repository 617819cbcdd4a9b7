/**
 * @file identity_test.cpp
 * @brief 会话 Cookie 身份解析测试
 */

#include "signaling_server/identity.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <chrono>

using namespace huddle::signaling;

namespace {

const std::string kSecret = "test-secret";

std::string encode(const std::string& text) {
    return base64url_encode(reinterpret_cast<const unsigned char*>(text.data()), text.size());
}

std::string make_token(const nlohmann::json& payload,
                       const std::string& secret = kSecret,
                       const std::string& alg = "HS256") {
    std::string signing_input = encode(nlohmann::json{{"alg", alg}, {"typ", "JWT"}}.dump()) + "." +
                                encode(payload.dump());
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.size()),
         reinterpret_cast<const unsigned char*>(signing_input.data()), signing_input.size(),
         digest, &len);
    return signing_input + "." + base64url_encode(digest, len);
}

int64_t now_sec() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

TEST(IdentityTest, Base64UrlRoundTripsBinary) {
    const unsigned char bytes[] = {0xfb, 0xff, 0x00, 0x10, 0x3e};
    auto encoded = base64url_encode(bytes, sizeof(bytes));
    EXPECT_EQ(encoded.find('='), std::string::npos);
    EXPECT_EQ(encoded.find('+'), std::string::npos);
    EXPECT_EQ(base64url_decode(encoded), std::string(reinterpret_cast<const char*>(bytes), sizeof(bytes)));
}

TEST(IdentityTest, ExtractCookie) {
    EXPECT_EQ(extract_cookie("theme=dark; session=abc.def; lang=en", "session"), "abc.def");
    EXPECT_EQ(extract_cookie("session=\"quoted\"", "session"), "quoted");
    EXPECT_FALSE(extract_cookie("mysession=abc", "session"));
    EXPECT_FALSE(extract_cookie("", "session"));
}

TEST(IdentityTest, ValidTokenYieldsSubject) {
    JwtCookieResolver resolver(kSecret, "session");
    auto token = make_token({{"sub", "alice"}, {"exp", now_sec() + 3600}});
    EXPECT_EQ(resolver.resolve("session=" + token), "alice");
}

TEST(IdentityTest, NumericUserIdClaim) {
    JwtCookieResolver resolver(kSecret, "session");
    auto token = make_token({{"user_id", 42}});
    EXPECT_EQ(resolver.validate(token), "42");
}

TEST(IdentityTest, BadTokensAreAnonymous) {
    JwtCookieResolver resolver(kSecret, "session");
    EXPECT_FALSE(resolver.resolve("session=" + make_token({{"sub", "bob"}}, "other-secret")));
    EXPECT_FALSE(resolver.resolve("session=" + make_token({{"sub", "bob"}, {"exp", now_sec() - 10}})));
    EXPECT_FALSE(resolver.resolve("session=" + make_token({{"sub", "bob"}}, kSecret, "none")));
    EXPECT_FALSE(resolver.resolve("session=" + make_token({{"role", "admin"}})));
    EXPECT_FALSE(resolver.resolve("session=garbage"));
    EXPECT_FALSE(resolver.resolve("other=" + make_token({{"sub", "bob"}})));
}

TEST(IdentityTest, EmptySecretResolvesNothing) {
    JwtCookieResolver resolver("", "session");
    EXPECT_FALSE(resolver.resolve("session=" + make_token({{"sub", "alice"}})));

    AnonymousResolver anonymous;
    EXPECT_FALSE(anonymous.resolve("session=" + make_token({{"sub", "alice"}})));
}
