#include "request_signer.hpp"
#include "exceptions.hpp"
#include "logging.hpp"
#include <cpr/cpr.h>            // For cpr::util::urlEncode
#include <openssl/hmac.h>
#include <openssl/evp.h>

#include <iomanip>
#include <sstream>

namespace data {

namespace {

    // RFC 4231, test case 2
    bool hmacSelfTest() {
        return RequestSigner::hmacSha256Hex("Jefe", "what do ya want for nothing?") ==
               "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843";
    }

    // cpr's return type differs between releases; copy into a plain string
    std::string urlEncode(const std::string& text) {
        auto encoded = cpr::util::urlEncode(text);
        return std::string(encoded.begin(), encoded.end());
    }

} // end anonymous namespace

RequestSigner::RequestSigner(std::string api_key, std::string api_secret)
    : api_key_(std::move(api_key)), api_secret_(std::move(api_secret))
{
    if (api_key_.empty() || api_secret_.empty()) {
        throw core::AuthenticationException("MEXC API key/secret missing (MEXC_API_KEY, MEXC_API_SECRET).");
    }
    if (!hmacSelfTest()) {
        throw core::AuthenticationException("HMAC-SHA256 self-test failed; refusing to sign requests.");
    }
    core::logging::getLogger()->debug("RequestSigner ready (key ending ...{}).",
                                      api_key_.size() > 4 ? api_key_.substr(api_key_.size() - 4) : "****");
}

std::string RequestSigner::hmacSha256Hex(const std::string& key, const std::string& payload) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    unsigned char* ok = HMAC(EVP_sha256(),
                             key.data(), static_cast<int>(key.size()),
                             reinterpret_cast<const unsigned char*>(payload.data()),
                             payload.size(),
                             digest, &digest_len);
    if (ok == nullptr) {
        throw core::AuthenticationException("OpenSSL HMAC computation failed.");
    }

    std::ostringstream out;
    for (unsigned int i = 0; i < digest_len; ++i) {
        out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return out.str();
}

std::string RequestSigner::canonicalQuery(const std::map<std::string, std::string>& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        if (!query.empty()) {
            query += '&';
        }
        query += urlEncode(key);
        query += '=';
        query += urlEncode(value);
    }
    return query;
}

std::string RequestSigner::signedQuery(std::map<std::string, std::string> params, std::int64_t timestamp_ms) const {
    params["timestamp"] = std::to_string(timestamp_ms);
    std::string query = canonicalQuery(params);
    return query + "&signature=" + hmacSha256Hex(api_secret_, query);
}

} // namespace data
