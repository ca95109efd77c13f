#include "wbcpp/webull/auth/session.hpp"

#include "wbcpp/meta.hpp"
#include "wbcpp/webull/auth/errors.hpp"
#include "wbcpp/webull/auth/headers.hpp"
#include "wbcpp/webull/auth/signature_request.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <boost/url/param.hpp>
#include <boost/url/parse.hpp>
#include <boost/url/url_view.hpp>
#include <botan/auto_rng.h>
#include <botan/hex.h>
#include <cstddef>
#include <format>
#include <span>
#include <string>
#include <string_view>

namespace wbcpp::webull::auth {

std::string generate_nonce() {
    Botan::AutoSeeded_RNG rng;
    return Botan::hex_encode(rng.random_vec(16), false);
}

namespace _internal {

// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
void prepare_request(std::string_view encoded_target_str, std::span<const std::byte> body,
                     boost::beast::http::fields &headers, const Session &session, std::string_view timestamp,
                     std::string_view nonce) {
    const auto parsed = boost::urls::parse_origin_form(encoded_target_str);
    if (!parsed) {
        throw EncodingError{
            std::format("request target {} is not in origin form: {}", encoded_target_str,
                        parsed.error().message())};
    }
    const boost::urls::url_view target = parsed.value();

    SignatureRequest request{
        .uri_path = std::string{target.encoded_path()},
        .query_parameters = {},
        .timestamp = std::string{timestamp},
        .nonce = std::string{nonce},
        .app_key = session.app_key,
        .host = boost::algorithm::to_lower_copy(std::string{session.endpoint.encoded_host_and_port()}),
        .body = std::string{meta::safe_reinterpret_cast<const char *>(body.data()), body.size()},
    };
    for (const boost::urls::param &param : target.params()) {
        request.query_parameters.emplace_back(param.key, param.has_value ? param.value : std::string{});
    }

    for (const auto &field : signed_headers(request, session.app_secret)) {
        headers.set(field.name_string(), field.value());
    }
}

} // namespace _internal

} // namespace wbcpp::webull::auth
