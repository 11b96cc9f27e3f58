#include "auth/claims_service.hpp"
#include "core/base64.hpp"
#include "core/utils.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <array>
#include <cmath>
#include <format>
#include <optional>

namespace tablegate {

namespace {

constexpr std::string_view kHeader = R"({"alg":"HS256","typ":"JWT"})";
constexpr std::string_view kBearerPrefix = "Bearer ";

using Millis = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;

// Largest whole second a TimePoint can hold
constexpr Seconds kMaxSeconds = std::chrono::floor<Seconds>(TimePoint::duration::max());

// NumericDate: whole seconds since epoch
int64_t to_numeric_date(TimePoint t) {
    return std::chrono::floor<Seconds>(t.time_since_epoch()).count();
}

// Accepts fractional seconds. Dates beyond the TimePoint range saturate to
// TimePoint::max() / TimePoint::min(); NaN is rejected.
std::optional<TimePoint> from_numeric_date(double seconds) {
    if (std::isnan(seconds)) return std::nullopt;
    const auto limit = static_cast<double>(kMaxSeconds.count());
    if (seconds >= limit) return TimePoint::max();
    if (seconds <= -limit) return TimePoint::min();
    const auto ms = static_cast<int64_t>(std::llround(seconds * 1000.0));
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(Millis(ms)));
}

// RFC 4122 version 4 UUID from the OpenSSL CSPRNG
std::string random_token_id() {
    std::array<unsigned char, 16> bytes{};
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        utils::log::warn("RAND_bytes failed; token id falls back to the non-cryptographic generator");
        return utils::generate_uuid();
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
        out += std::format("{:02x}", bytes[i]);
    }
    return out;
}

Result<Claims> malformed() {
    return Result<Claims>::error(ErrorCategory::SIGNATURE_INVALID, "Malformed token");
}

} // anonymous namespace

ClaimsService::ClaimsService(ClaimsConfig config, Clock clock)
    : config_(std::move(config)),
      clock_(clock ? std::move(clock) : Clock(&utils::now)) {}

// ============================================================================
// Issue / Sign
// ============================================================================

Claims ClaimsService::issue(const std::string& subject) const {
    return issue(subject, config_.issuer, config_.audience, config_.token_ttl);
}

Claims ClaimsService::issue(const std::string& subject,
                            const std::string& issuer,
                            const std::string& audience,
                            std::chrono::seconds ttl) const {
    const TimePoint now = clock_();
    const auto issued = std::chrono::floor<Seconds>(now);

    Claims claims;
    claims.subject = subject;
    claims.issuer = issuer;
    claims.audience = audience;
    claims.issued_at = issued;
    claims.not_before = std::chrono::floor<Seconds>(now - config_.clock_skew);
    // Expiration saturates at the last representable second
    claims.expiration = ttl > kMaxSeconds - issued.time_since_epoch()
        ? TimePoint(kMaxSeconds)
        : TimePoint(issued + ttl);
    claims.token_id = random_token_id();
    return claims;
}

std::string ClaimsService::sign(const Claims& claims) const {
    return sign(claims, config_.secret);
}

std::string ClaimsService::sign(const Claims& claims, std::string_view key) {
    const std::string signing_input = std::format("{}.{}",
        base64url::encode(kHeader), base64url::encode(to_json(claims)));
    return std::format("{}.{}", signing_input,
                       base64url::encode(hmac_sha256(key, signing_input)));
}

std::string ClaimsService::to_json(const Claims& claims) {
    // Dates are written as integers; JsonValue would hold them as doubles
    std::string payload = std::format(R"({{"sub":{},"iss":{},"aud":{},"iat":{})",
        JsonValue(claims.subject).dump(),
        JsonValue(claims.issuer).dump(),
        JsonValue(claims.audience).dump(),
        to_numeric_date(claims.issued_at));
    if (claims.not_before != TimePoint::min()) {
        payload += std::format(R"(,"nbf":{})", to_numeric_date(claims.not_before));
    }
    payload += std::format(R"(,"exp":{},"jti":{}}})",
        to_numeric_date(claims.expiration),
        JsonValue(claims.token_id).dump());
    return payload;
}

// ============================================================================
// Verify
// ============================================================================

Result<Claims> ClaimsService::verify(std::string_view token) const {
    return verify(token, config_.secret, config_.issuer, config_.audience);
}

Result<Claims> ClaimsService::verify_bearer(std::string_view authorization) const {
    const std::string header = utils::trim(authorization);
    if (header.size() <= kBearerPrefix.size() ||
        utils::to_lower(std::string_view(header).substr(0, kBearerPrefix.size())) != "bearer ") {
        return Result<Claims>::error(ErrorCategory::SIGNATURE_INVALID, "No Bearer token");
    }
    return verify(utils::trim(std::string_view(header).substr(kBearerPrefix.size())));
}

Result<Claims> ClaimsService::verify(std::string_view token,
                                     std::string_view key,
                                     std::string_view expected_issuer,
                                     std::string_view expected_audience) const {
    using R = Result<Claims>;

    // Split into header.payload.signature
    const auto dot1 = token.find('.');
    if (dot1 == std::string_view::npos) return malformed();
    const auto dot2 = token.find('.', dot1 + 1);
    if (dot2 == std::string_view::npos || token.find('.', dot2 + 1) != std::string_view::npos) {
        return malformed();
    }

    const std::string_view header_b64 = token.substr(0, dot1);
    const std::string_view payload_b64 = token.substr(dot1 + 1, dot2 - dot1 - 1);
    const std::string_view signature_b64 = token.substr(dot2 + 1);

    // 1. Signature (HMAC-SHA256, constant-time compare)
    if (key.empty()) {
        return R::error(ErrorCategory::SIGNATURE_INVALID, "No signing key configured");
    }
    const auto signature = base64url::decode(signature_b64);
    const std::string expected = hmac_sha256(key, token.substr(0, dot2));
    if (!signature || signature->size() != expected.size() ||
        CRYPTO_memcmp(signature->data(), expected.data(), expected.size()) != 0) {
        return R::error(ErrorCategory::SIGNATURE_INVALID, "Invalid token signature");
    }

    const auto header_json = base64url::decode(header_b64);
    const auto payload_json = base64url::decode(payload_b64);
    if (!header_json || !payload_json) return malformed();

    const auto header = JsonValue::try_parse(*header_json);
    if (!header || header->string_at("alg") != std::optional<std::string>("HS256")) {
        return malformed();
    }

    const auto payload = JsonValue::try_parse(*payload_json);
    if (!payload || !payload->is_object()) return malformed();

    const auto sub = payload->string_at("sub");
    const auto exp = payload->number_at("exp");
    if (!sub || !exp) return malformed();

    const auto expiration = from_numeric_date(*exp);
    const auto issued_at = from_numeric_date(payload->number_at("iat").value_or(0.0));
    // Absent nbf places no lower bound
    const auto nbf = payload->number_at("nbf");
    const auto not_before = nbf ? from_numeric_date(*nbf) : std::optional<TimePoint>(TimePoint::min());
    if (!expiration || !issued_at || !not_before) return malformed();

    Claims claims;
    claims.subject = *sub;
    claims.issuer = payload->string_at("iss").value_or("");
    claims.expiration = *expiration;
    claims.issued_at = *issued_at;
    claims.not_before = *not_before;
    claims.token_id = payload->string_at("jti").value_or("");

    const TimePoint now = clock_();

    // 2. Expiration: valid while now < exp
    if (now >= claims.expiration) {
        return R::error(ErrorCategory::EXPIRED, "Token expired");
    }

    // 3. Not before
    if (now < claims.not_before) {
        return R::error(ErrorCategory::NOT_YET_VALID, "Token not yet valid");
    }

    // 4. Audience: a string or an array of strings
    const JsonValue aud = (*payload)["aud"];
    bool audience_ok = false;
    if (aud.is_string()) {
        audience_ok = aud.get<std::string>() == expected_audience;
    } else if (aud.is_array()) {
        aud.for_each_element([&](const JsonValue& entry) {
            if (entry.is_string() && entry.get<std::string>() == expected_audience) {
                audience_ok = true;
            }
        });
    }
    if (!audience_ok) {
        return R::error(ErrorCategory::AUDIENCE_MISMATCH,
            std::format("Token audience does not include '{}'", expected_audience));
    }
    claims.audience = std::string(expected_audience);

    // 5. Issuer
    if (claims.issuer != expected_issuer) {
        return R::error(ErrorCategory::ISSUER_MISMATCH,
            std::format("Token issuer mismatch: expected={}, got={}", expected_issuer, claims.issuer));
    }

    return R::ok(std::move(claims));
}

std::string ClaimsService::hmac_sha256(std::string_view key, std::string_view input) {
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;

    HMAC(EVP_sha256(),
         key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(input.data()),
         input.size(),
         mac, &mac_len);

    return std::string(reinterpret_cast<const char*>(mac), mac_len);
}

} // namespace tablegate
