#include "wbcpp/webull/auth/headers.hpp"

#include "wbcpp/webull/auth/canonicalize.hpp"
#include "wbcpp/webull/auth/errors.hpp"
#include "wbcpp/webull/auth/sign_request.hpp"
#include "wbcpp/webull/auth/signature_request.hpp"

#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <string>
#include <string_view>

namespace wbcpp::webull::auth {

boost::beast::http::fields make_signature_headers(const SignatureRequest &request,
                                                  std::string_view signature) {
    validate(request);
    if (signature.empty()) {
        throw InvalidInputError{"empty signature"};
    }

    boost::beast::http::fields ret;
    // set by name so every header keeps its lowercase protocol spelling
    for (const std::string_view name : canonical_headers) {
        ret.set(name, request.header_value(name));
    }
    ret.set(header::signature, signature);
    return ret;
}

boost::beast::http::fields signed_headers(const SignatureRequest &request, std::string_view app_secret) {
    const std::string signature = sign(request, app_secret);
    return make_signature_headers(request, signature);
}

} // namespace wbcpp::webull::auth
