#pragma once

#include "wbcpp/webull/auth/signature_request.hpp"

#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <string_view>

namespace wbcpp::webull::auth {

// the canonical headers of request plus x-signature. throws InvalidInputError
[[nodiscard]] boost::beast::http::fields make_signature_headers(const SignatureRequest &request,
                                                                std::string_view signature);

// sign, then make_signature_headers. throws InvalidInputError
[[nodiscard]] boost::beast::http::fields signed_headers(const SignatureRequest &request,
                                                        std::string_view app_secret);

} // namespace wbcpp::webull::auth
