#include "wbcpp/webull/auth/sign_request.hpp"

#include "wbcpp/webull/auth/canonicalize.hpp"
#include "wbcpp/webull/auth/signature_request.hpp"

#include <botan/base64.h>
#include <botan/mac.h>
#include <cstdint>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

// see https://developer.webull.com/apis/docs/authentication/signature
// for the signing scheme

namespace wbcpp::webull::auth {

std::vector<uint8_t> get_signing_key(std::string_view app_secret) {
    std::vector<uint8_t> key;
    key.reserve(app_secret.size() + 1);
    std::format_to(std::back_inserter(key), "{}&", app_secret);
    return key;
}

std::string sign_canonical(std::string_view encoded, std::string_view app_secret) {
    auto hmac = Botan::MessageAuthenticationCode::create_or_throw("HMAC(SHA-1)");

    hmac->set_key(get_signing_key(app_secret));
    hmac->update(encoded);

    return Botan::base64_encode(hmac->final());
}

std::string sign(const SignatureRequest &request, std::string_view app_secret) {
    const CanonicalRequest canonical = canonicalize_request(request);
    return sign_canonical(canonical.encoded, app_secret);
}

} // namespace wbcpp::webull::auth
