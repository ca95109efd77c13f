#pragma once

#include "wbcpp/webull/auth/signature_request.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace wbcpp::webull::auth {

// the app secret with the trailing '&' the protocol appends
[[nodiscard]] std::vector<uint8_t> get_signing_key(std::string_view app_secret);

// base64(HMAC-SHA1(app_secret + "&", encoded))
[[nodiscard]] std::string sign_canonical(std::string_view encoded, std::string_view app_secret);

// throws InvalidInputError
[[nodiscard]] std::string sign(const SignatureRequest &request, std::string_view app_secret);

} // namespace wbcpp::webull::auth
