#pragma once

#include "wbcpp/meta.hpp"
#include "wbcpp/webull/auth/signature_request.hpp"

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace wbcpp::webull::auth {

struct CanonicalRequest {
    // sorted key=value pairs of the query and the canonical headers
    std::string parameters;
    // uppercase hex MD5 of the body
    std::string body_digest;
    // uri_path&parameters&body_digest
    std::string string_to_sign;
    // string_to_sign, percent-encoded as a whole
    std::string encoded;
};

// throws InvalidInputError
void validate(const SignatureRequest &request);

[[nodiscard]] std::string canonical_parameters(const SignatureRequest &request);

[[nodiscard]] std::string body_digest(std::span<const std::byte> body);

[[nodiscard]] inline std::string body_digest(std::string_view body) {
    return body_digest(std::span<const std::byte>{
        meta::safe_reinterpret_cast<const std::byte *>(body.data()), body.size()});
}

// validates, then builds every intermediate string of the signature
[[nodiscard]] CanonicalRequest canonicalize_request(const SignatureRequest &request);

} // namespace wbcpp::webull::auth
