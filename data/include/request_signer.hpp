#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace data {

// HMAC-SHA256 signing of private MEXC futures requests.
// The signed payload is the canonical query: keys in ascending order, values
// URL-encoded, joined with '&'. The same string is sent on the wire, followed by
// "&signature=<hex>".
class RequestSigner {
public:
    // Throws core::AuthenticationException on empty credentials or a failed self-test
    RequestSigner(std::string api_key, std::string api_secret);

    // Adds `timestamp` and returns "<canonical query>&signature=<hex digest>"
    std::string signedQuery(std::map<std::string, std::string> params, std::int64_t timestamp_ms) const;

    const std::string& apiKey() const { return api_key_; }

    static std::string canonicalQuery(const std::map<std::string, std::string>& params);
    static std::string hmacSha256Hex(const std::string& key, const std::string& payload);

private:
    std::string api_key_;
    std::string api_secret_;
};

} // namespace data
