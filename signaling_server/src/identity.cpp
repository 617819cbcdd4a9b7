/**
 * @file identity.cpp
 * @brief JWT 会话 Cookie 解析实现
 */

#include "signaling_server/identity.hpp"
#include "common/logger.hpp"

#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <vector>

namespace huddle::signaling {

namespace {

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

// sub / user_id 可能是字符串也可能是数字
std::optional<std::string> claim_as_string(const nlohmann::json& json, const char* key) {
    if (!json.contains(key)) {
        return std::nullopt;
    }
    const auto& value = json[key];
    if (value.is_string()) {
        auto s = value.get<std::string>();
        if (s.empty()) return std::nullopt;
        return s;
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<int64_t>());
    }
    return std::nullopt;
}

} // namespace

JwtCookieResolver::JwtCookieResolver(const std::string& secret, const std::string& cookie_name)
    : secret_(secret)
    , cookie_name_(cookie_name)
{
}

std::optional<std::string> JwtCookieResolver::resolve(const std::string& cookie_header) const {
    if (secret_.empty() || cookie_header.empty()) {
        return std::nullopt;
    }

    auto token = extract_cookie(cookie_header, cookie_name_);
    if (!token) {
        return std::nullopt;
    }

    auto user_id = validate(*token);
    if (!user_id) {
        LOG_DEBUG("Session cookie rejected, treating connection as anonymous");
    }
    return user_id;
}

std::optional<std::string> JwtCookieResolver::validate(const std::string& token) const {
    auto first_dot = token.find('.');
    if (first_dot == std::string::npos) {
        return std::nullopt;
    }
    auto second_dot = token.find('.', first_dot + 1);
    if (second_dot == std::string::npos) {
        return std::nullopt;
    }

    std::string header_b64 = token.substr(0, first_dot);
    std::string payload_b64 = token.substr(first_dot + 1, second_dot - first_dot - 1);
    std::string signature_b64 = token.substr(second_dot + 1);

    try {
        auto header = nlohmann::json::parse(base64url_decode(header_b64));
        if (!header.contains("alg") || header["alg"] != "HS256") {
            return std::nullopt;
        }
    } catch (const nlohmann::json::exception& e) {
        LOG_DEBUG("Failed to parse JWT header: " << e.what());
        return std::nullopt;
    }

    if (!verify_signature(header_b64 + "." + payload_b64, signature_b64)) {
        return std::nullopt;
    }
    return parse_payload(base64url_decode(payload_b64));
}

bool JwtCookieResolver::verify_signature(const std::string& header_payload,
                                         const std::string& signature) const {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (HMAC(EVP_sha256(),
             secret_.data(), static_cast<int>(secret_.size()),
             reinterpret_cast<const unsigned char*>(header_payload.data()),
             header_payload.size(),
             digest, &digest_len) == nullptr) {
        LOG_ERROR("HMAC computation failed");
        return false;
    }

    std::string computed = base64url_encode(digest, digest_len);
    if (computed.size() != signature.size()) {
        return false;
    }
    return CRYPTO_memcmp(computed.data(), signature.data(), computed.size()) == 0;
}

std::optional<std::string> JwtCookieResolver::parse_payload(const std::string& payload_json) const {
    try {
        auto json = nlohmann::json::parse(payload_json);

        if (json.contains("exp") && json["exp"].is_number()) {
            int64_t exp = json["exp"].get<int64_t>();
            auto now_sec = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
            if (now_sec > exp) {
                return std::nullopt;
            }
        }

        // 支持 "sub" 和 "user_id" 两种字段
        if (auto sub = claim_as_string(json, "sub")) {
            return sub;
        }
        return claim_as_string(json, "user_id");
    } catch (const nlohmann::json::exception& e) {
        LOG_DEBUG("Failed to parse JWT payload: " << e.what());
        return std::nullopt;
    }
}

std::optional<std::string> extract_cookie(const std::string& cookie_header,
                                          const std::string& name) {
    size_t pos = 0;
    while (pos <= cookie_header.size()) {
        auto end = cookie_header.find(';', pos);
        if (end == std::string::npos) {
            end = cookie_header.size();
        }

        std::string pair = cookie_header.substr(pos, end - pos);
        auto eq = pair.find('=');
        if (eq != std::string::npos && trim(pair.substr(0, eq)) == name) {
            std::string value = trim(pair.substr(eq + 1));
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
                value = value.substr(1, value.size() - 2);
            }
            return value;
        }
        pos = end + 1;
    }
    return std::nullopt;
}

std::string base64url_decode(const std::string& input) {
    std::string base64 = input;
    std::replace(base64.begin(), base64.end(), '-', '+');
    std::replace(base64.begin(), base64.end(), '_', '/');
    while (base64.size() % 4 != 0) {
        base64 += '=';
    }

    static const std::string chars =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::vector<int> table(256, -1);
    for (size_t i = 0; i < chars.size(); ++i) {
        table[static_cast<unsigned char>(chars[i])] = static_cast<int>(i);
    }

    std::string result;
    uint32_t val = 0;
    int valb = -8;
    for (unsigned char c : base64) {
        if (table[c] == -1) break;
        val = ((val << 6) | static_cast<uint32_t>(table[c])) & 0xFFFF;
        valb += 6;
        if (valb >= 0) {
            result.push_back(static_cast<char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return result;
}

std::string base64url_encode(const unsigned char* data, size_t len) {
    static const char* chars =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string result;
    uint32_t val = 0;
    int valb = -6;
    for (size_t i = 0; i < len; ++i) {
        val = ((val << 8) | data[i]) & 0xFFFF;
        valb += 8;
        while (valb >= 0) {
            result.push_back(chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) {
        result.push_back(chars[((val << 8) >> (valb + 8)) & 0x3F]);
    }
    return result;
}

} // namespace huddle::signaling
