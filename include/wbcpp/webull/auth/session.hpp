#pragma once

#include "wbcpp/meta.hpp"

#include <boost/beast/http/fields.hpp> // IWYU pragma: keep
#include <boost/url/url.hpp>
#include <chrono>
#include <cstddef>
#include <format>
#include <span>
#include <string>
#include <string_view>

namespace wbcpp::webull::auth {

class Session {
public:
    std::string app_key;
    std::string app_secret;
    boost::urls::url endpoint;
};

template <typename T>
    requires meta::is_specialization_v<T, std::chrono::time_point>
[[nodiscard]] std::string format_timestamp(const T &time) {
    // whole seconds only, the gateway rejects fractions
    return std::format("{:%Y-%m-%dT%H:%M:%S}Z", std::chrono::floor<std::chrono::seconds>(time));
}

// 32 lowercase hex characters
[[nodiscard]] std::string generate_nonce();

namespace _internal {

void prepare_request(std::string_view encoded_target_str, std::span<const std::byte> body,
                     boost::beast::http::fields &headers, const Session &session, std::string_view timestamp,
                     std::string_view nonce);

} // namespace _internal

// sets host, the canonical headers and x-signature on request
// throws EncodingError for an unparseable target, InvalidInputError otherwise
template <typename Request>
void prepare_request(Request &request, const Session &session, std::string_view timestamp,
                     std::string_view nonce) {
    request.prepare_payload();
    _internal::prepare_request(
        request.target(),
        std::span<const std::byte>{meta::safe_reinterpret_cast<const std::byte *>(request.body().data()),
                                   request.body().size()},
        request.base(), session, timestamp, nonce);
}

template <typename Request> void prepare_request(Request &request, const Session &session) {
    prepare_request(request, session, format_timestamp(std::chrono::system_clock::now()), generate_nonce());
}

} // namespace wbcpp::webull::auth
