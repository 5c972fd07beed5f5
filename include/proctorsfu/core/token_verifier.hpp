// ProctorSFU - Exam Proctoring Media Server
// Token Verifier - Authenticates signaling connections
//
// Responsibilities:
// - Define the token verification contract used at connection time
// - Verify HS256 JSON Web Tokens against a shared secret
// - Extract the user id and optional role claim

#ifndef PROCTORSFU_CORE_TOKEN_VERIFIER_HPP
#define PROCTORSFU_CORE_TOKEN_VERIFIER_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "proctorsfu/core/error_codes.hpp"
#include "proctorsfu/core/result.hpp"
#include "proctorsfu/core/types.hpp"

namespace proctorsfu {
namespace core {

/**
 * @brief Who a verified token belongs to.
 */
struct Identity {
    UserId userId;
    std::optional<Role> role;   ///< Present when the token carries a role claim
};

/**
 * @brief Token verification contract.
 */
class ITokenVerifier {
public:
    virtual ~ITokenVerifier() = default;

    /**
     * @brief Verify a token and extract the identity.
     * @return Authentication error for missing, malformed, forged or expired tokens
     */
    virtual Result<Identity, Error> verifyToken(const std::string& token) const = 0;
};

/**
 * @brief HS256 JWT verifier using OpenSSL HMAC-SHA256.
 *
 * The user id is read from "user_id", falling back to "sub". Tokens with an
 * "exp" claim in the past are rejected.
 */
class JwtTokenVerifier : public ITokenVerifier {
public:
    /// Seconds since the Unix epoch
    using WallClock = std::function<int64_t()>;

    explicit JwtTokenVerifier(std::string secret, WallClock clock = WallClock());

    Result<Identity, Error> verifyToken(const std::string& token) const override;

    /**
     * @brief Sign a claims object. Used by tests and tooling.
     */
    static std::string sign(const std::string& claimsJson, const std::string& secret);

private:
    std::string secret_;
    WallClock clock_;
};

/**
 * @brief Unpadded base64url encoding (RFC 4648 section 5).
 */
std::string base64UrlEncode(const std::string& data);

/**
 * @brief Decode base64url with or without padding.
 * @return std::nullopt on characters outside the alphabet
 */
std::optional<std::string> base64UrlDecode(const std::string& data);

} // namespace core
} // namespace proctorsfu

#endif // PROCTORSFU_CORE_TOKEN_VERIFIER_HPP
