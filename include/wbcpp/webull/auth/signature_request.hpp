#pragma once

#include <array>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace wbcpp::webull::auth {

// name/value pairs in caller order, names must be unique
using QueryParameters = std::vector<std::pair<std::string, std::string>>;

namespace header {

constexpr inline std::string_view app_key = "x-app-key";
constexpr inline std::string_view signature_algorithm = "x-signature-algorithm";
constexpr inline std::string_view signature_version = "x-signature-version";
constexpr inline std::string_view signature_nonce = "x-signature-nonce";
constexpr inline std::string_view timestamp = "x-timestamp";
constexpr inline std::string_view host = "host";
constexpr inline std::string_view signature = "x-signature";

} // namespace header

// headers participating in the signature, in protocol order
constexpr inline std::array<std::string_view, 6> canonical_headers{
    header::app_key, header::signature_algorithm, header::signature_version,
    header::signature_nonce, header::timestamp, header::host};

constexpr inline std::string_view default_signature_algorithm = "HMAC-SHA1";
constexpr inline std::string_view default_signature_version = "1.0";

struct SignatureRequest {
    std::string uri_path;
    QueryParameters query_parameters;
    std::string timestamp;
    std::string nonce;
    std::string app_key;
    std::string signature_algorithm{default_signature_algorithm};
    std::string signature_version{default_signature_version};
    std::string host;
    std::string body;

    // value of one of canonical_headers, empty for any other name
    [[nodiscard]] std::string_view header_value(std::string_view name) const;
};

} // namespace wbcpp::webull::auth
