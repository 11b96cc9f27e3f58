#pragma once

#include "auth/claims.hpp"
#include "core/error.hpp"
#include "core/json.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <string_view>

namespace tablegate {

struct ClaimsConfig {
    std::string issuer;
    std::string audience;
    std::string secret;                                     // HMAC-SHA256 key (raw bytes)
    std::chrono::seconds token_ttl{3600};
    std::chrono::milliseconds clock_skew{250};              // not_before = now - skew
};

/**
 * @brief Issues and verifies HS256 JWT claims
 *
 * Token: base64url(header).base64url(payload).base64url(HMAC-SHA256), no
 * padding. Header {"alg":"HS256","typ":"JWT"}. Payload claims sub, iss, aud,
 * iat, nbf, exp (NumericDate, whole seconds) and jti. Issued tokens satisfy
 * nbf <= iat < exp. Verification also accepts fractional NumericDates, and
 * dates past the clock's range saturate instead of wrapping.
 *
 * Verification reports the first failing check in a fixed order:
 *   signature -> exp -> nbf -> aud -> iss
 * Malformed tokens fail as SIGNATURE_INVALID. Messages never carry the
 * token subject.
 *
 * Stateless; safe to share across threads. The clock is injectable for tests.
 */
class ClaimsService {
public:
    using Clock = std::function<TimePoint()>;

    // An empty clock means the system clock
    explicit ClaimsService(ClaimsConfig config, Clock clock = {});

    /**
     * @brief New claims for subject using the configured issuer, audience and TTL
     */
    [[nodiscard]] Claims issue(const std::string& subject) const;

    [[nodiscard]] Claims issue(const std::string& subject,
                               const std::string& issuer,
                               const std::string& audience,
                               std::chrono::seconds ttl) const;

    /**
     * @brief Sign claims with the configured secret
     */
    [[nodiscard]] std::string sign(const Claims& claims) const;

    [[nodiscard]] static std::string sign(const Claims& claims, std::string_view key);

    /**
     * @brief Verify against the configured secret, issuer and audience
     */
    [[nodiscard]] Result<Claims> verify(std::string_view token) const;

    [[nodiscard]] Result<Claims> verify(std::string_view token,
                                        std::string_view key,
                                        std::string_view expected_issuer,
                                        std::string_view expected_audience) const;

    /**
     * @brief Verify an "Authorization: Bearer <token>" header value
     */
    [[nodiscard]] Result<Claims> verify_bearer(std::string_view authorization) const;

    /**
     * @brief JWT payload text for claims (also handed to the database session)
     *
     * nbf is omitted when not_before is unbounded.
     */
    [[nodiscard]] static std::string to_json(const Claims& claims);

    [[nodiscard]] const ClaimsConfig& config() const { return config_; }

private:
    static std::string hmac_sha256(std::string_view key, std::string_view input);

    ClaimsConfig config_;
    Clock clock_;
};

} // namespace tablegate
