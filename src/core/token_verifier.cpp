// ProctorSFU - Exam Proctoring Media Server
// Token Verifier Implementation

#include "proctorsfu/core/token_verifier.hpp"

#include "proctorsfu/core/json_value.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <chrono>
#include <vector>

namespace proctorsfu {
namespace core {

namespace {

Error authError(const std::string& message, const std::string& context = "") {
    return Error(ErrorCode::Authentication, message, context);
}

std::string hmacSha256(const std::string& key, const std::string& data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;

    unsigned char* out = HMAC(
        EVP_sha256(),
        key.data(), static_cast<int>(key.size()),
        reinterpret_cast<const unsigned char*>(data.data()), data.size(),
        digest, &digestLength);
    if (out == nullptr) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(digest), digestLength);
}

int64_t systemNowSeconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // anonymous namespace

// =============================================================================
// Base64url
// =============================================================================

std::string base64UrlEncode(const std::string& data) {
    if (data.empty()) {
        return std::string();
    }

    std::vector<unsigned char> buffer(4 * ((data.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(
        buffer.data(),
        reinterpret_cast<const unsigned char*>(data.data()),
        static_cast<int>(data.size()));

    std::string encoded(reinterpret_cast<const char*>(buffer.data()),
                        static_cast<size_t>(written));
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    for (char& c : encoded) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return encoded;
}

std::optional<std::string> base64UrlDecode(const std::string& data) {
    std::string standard;
    standard.reserve(data.size() + 3);
    for (char c : data) {
        if (c == '-') {
            standard.push_back('+');
        } else if (c == '_') {
            standard.push_back('/');
        } else if (c == '=') {
            break;
        } else if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                   (c >= '0' && c <= '9')) {
            standard.push_back(c);
        } else {
            return std::nullopt;
        }
    }
    if (standard.size() % 4 == 1) {
        return std::nullopt;
    }

    size_t padding = 0;
    while (standard.size() % 4 != 0) {
        standard.push_back('=');
        ++padding;
    }
    if (standard.empty()) {
        return std::string();
    }

    std::vector<unsigned char> buffer(standard.size() / 4 * 3 + 1);
    int decoded = EVP_DecodeBlock(
        buffer.data(),
        reinterpret_cast<const unsigned char*>(standard.data()),
        static_cast<int>(standard.size()));
    if (decoded < 0 || static_cast<size_t>(decoded) < padding) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(buffer.data()),
                       static_cast<size_t>(decoded) - padding);
}

// =============================================================================
// JwtTokenVerifier
// =============================================================================

JwtTokenVerifier::JwtTokenVerifier(std::string secret, WallClock clock)
    : secret_(std::move(secret))
    , clock_(clock ? std::move(clock) : WallClock(systemNowSeconds)) {
}

Result<Identity, Error> JwtTokenVerifier::verifyToken(const std::string& token) const {
    if (token.empty()) {
        return Result<Identity, Error>::error(authError("Authentication error: token missing"));
    }

    size_t firstDot = token.find('.');
    size_t secondDot = firstDot == std::string::npos
        ? std::string::npos : token.find('.', firstDot + 1);
    if (secondDot == std::string::npos || token.find('.', secondDot + 1) != std::string::npos) {
        return Result<Identity, Error>::error(authError("Authentication error: malformed token"));
    }

    const std::string signingInput = token.substr(0, secondDot);
    auto header = base64UrlDecode(token.substr(0, firstDot));
    auto payload = base64UrlDecode(token.substr(firstDot + 1, secondDot - firstDot - 1));
    auto signature = base64UrlDecode(token.substr(secondDot + 1));
    if (!header || !payload || !signature) {
        return Result<Identity, Error>::error(authError("Authentication error: malformed token"));
    }

    auto headerJson = JsonValue::parse(*header);
    if (headerJson.isError() || headerJson.value()["alg"].getString() != "HS256") {
        return Result<Identity, Error>::error(
            authError("Authentication error: unsupported algorithm"));
    }

    const std::string expected = hmacSha256(secret_, signingInput);
    if (expected.empty() || expected.size() != signature->size() ||
        CRYPTO_memcmp(expected.data(), signature->data(), expected.size()) != 0) {
        return Result<Identity, Error>::error(authError("Authentication error: invalid signature"));
    }

    auto claimsResult = JsonValue::parse(*payload);
    if (claimsResult.isError() || !claimsResult.value().isObject()) {
        return Result<Identity, Error>::error(authError("Authentication error: malformed claims"));
    }
    const JsonValue& claims = claimsResult.value();

    if (claims.contains("exp") && claims["exp"].isNumber() &&
        claims["exp"].getInt() <= clock_()) {
        return Result<Identity, Error>::error(authError("Authentication error: token expired"));
    }

    Identity identity;
    const JsonValue& userClaim = claims.contains("user_id") ? claims["user_id"] : claims["sub"];
    if (userClaim.isString()) {
        identity.userId = userClaim.getString();
    } else if (userClaim.isNumber()) {
        identity.userId = std::to_string(userClaim.getInt());
    }
    if (identity.userId.empty()) {
        return Result<Identity, Error>::error(authError("Authentication error: user id missing"));
    }

    if (claims.contains("role")) {
        auto role = roleFromString(claims["role"].getString());
        if (!role) {
            return Result<Identity, Error>::error(authError(
                "Authentication error: unknown role", claims["role"].getString()));
        }
        identity.role = role;
    }

    return Result<Identity, Error>::success(std::move(identity));
}

std::string JwtTokenVerifier::sign(const std::string& claimsJson, const std::string& secret) {
    const std::string signingInput =
        base64UrlEncode("{\"alg\":\"HS256\",\"typ\":\"JWT\"}") + "." + base64UrlEncode(claimsJson);
    return signingInput + "." + base64UrlEncode(hmacSha256(secret, signingInput));
}

} // namespace core
} // namespace proctorsfu
