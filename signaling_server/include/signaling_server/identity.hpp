/**
 * @file identity.hpp
 * @brief 连接身份解析
 *
 * 会话凭证由外部系统签发，升级前只校验一次。
 * 解析失败不拒绝连接，按匿名处理。
 */

#pragma once

#include <optional>
#include <string>

namespace huddle::signaling {

/**
 * @brief 身份解析接口
 */
class IdentityResolver {
public:
    virtual ~IdentityResolver() = default;

    /**
     * @brief 从升级请求的 Cookie 头解析用户 ID
     * @param cookie_header Cookie 请求头原文（可能为空）
     * @return 用户 ID，匿名返回 std::nullopt
     */
    virtual std::optional<std::string> resolve(const std::string& cookie_header) const = 0;
};

/**
 * @brief 匿名解析器（认证关闭时使用）
 */
class AnonymousResolver : public IdentityResolver {
public:
    std::optional<std::string> resolve(const std::string&) const override {
        return std::nullopt;
    }
};

/**
 * @brief 基于 HS256 JWT 会话 Cookie 的解析器
 */
class JwtCookieResolver : public IdentityResolver {
public:
    /**
     * @brief 构造函数
     * @param secret JWT 密钥（为空时全部按匿名处理）
     * @param cookie_name 会话 Cookie 名
     */
    JwtCookieResolver(const std::string& secret, const std::string& cookie_name);

    std::optional<std::string> resolve(const std::string& cookie_header) const override;

    /**
     * @brief 验证 JWT Token
     * @return 用户 ID，验证失败返回 std::nullopt
     */
    std::optional<std::string> validate(const std::string& token) const;

private:
    bool verify_signature(const std::string& header_payload,
                          const std::string& signature) const;
    std::optional<std::string> parse_payload(const std::string& payload_json) const;

private:
    std::string secret_;
    std::string cookie_name_;
};

/**
 * @brief 从 Cookie 头中取出指定名称的值
 */
std::optional<std::string> extract_cookie(const std::string& cookie_header,
                                          const std::string& name);

/**
 * @brief Base64URL 编解码
 */
std::string base64url_decode(const std::string& input);
std::string base64url_encode(const unsigned char* data, size_t len);

} // namespace huddle::signaling
