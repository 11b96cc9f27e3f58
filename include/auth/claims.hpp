#pragma once

#include <chrono>
#include <string>

namespace tablegate {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @brief Authenticated identity carried by a signed token
 *
 * not_before <= issued_at < expiration. Issued times are whole seconds;
 * verified tokens may carry millisecond fractions. token_id is a fresh UUID
 * per issuance.
 */
struct Claims {
    std::string subject;
    std::string issuer;
    std::string audience;
    TimePoint issued_at;
    TimePoint not_before;
    TimePoint expiration;
    std::string token_id;

    bool operator==(const Claims&) const = default;
};

} // namespace tablegate
