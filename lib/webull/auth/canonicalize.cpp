#include "wbcpp/webull/auth/canonicalize.hpp"

#include "wbcpp/meta.hpp"
#include "wbcpp/webull/auth/errors.hpp"
#include "wbcpp/webull/auth/signature_request.hpp"
#include "wbcpp/webull/auth/urlencode.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <botan/hash.h>
#include <botan/hex.h>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <map>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace wbcpp::webull::auth {

void validate(const SignatureRequest &request) {
    if (request.uri_path.empty()) {
        throw InvalidInputError{"uri path is empty"};
    }
    if (!request.uri_path.starts_with('/')) {
        throw InvalidInputError{std::format("uri path {} does not start with '/'", request.uri_path)};
    }
    if (request.uri_path.find_first_of("?#") != std::string::npos) {
        throw InvalidInputError{
            std::format("uri path {} carries a query or fragment, pass query parameters separately",
                        request.uri_path)};
    }

    for (const std::string_view name : canonical_headers) {
        if (request.header_value(name).empty()) {
            throw InvalidInputError{std::format("missing value for header {}", name)};
        }
    }
    if (boost::algorithm::to_lower_copy(request.host) != request.host) {
        throw InvalidInputError{std::format("host {} is not lowercase", request.host)};
    }

    std::set<std::string_view, std::less<>> names;
    for (const auto &[name, value] : request.query_parameters) {
        if (!names.emplace(name).second) {
            throw InvalidInputError{std::format("duplicate query parameter {}", name)};
        }
    }
}

std::string canonical_parameters(const SignatureRequest &request) {
    // use a map to get them in order
    std::map<std::string_view, std::string_view, std::less<>> params;
    for (const auto &[name, value] : request.query_parameters) {
        params.emplace(name, value);
    }
    // headers go in last and replace colliding query parameters
    for (const std::string_view name : canonical_headers) {
        params.insert_or_assign(name, request.header_value(name));
    }

    std::string ret;
    for (const auto &[key, value] : params) {
        ret.append(std::format("{}={}&", key, value));
    }
    if (!params.empty()) {
        ret.pop_back();
    }
    return ret;
}

std::string body_digest(std::span<const std::byte> body) {
    // protocol mandated, not the authentication primitive
    auto hash = Botan::HashFunction::create_or_throw("MD5");
    hash->update(meta::safe_reinterpret_cast<const uint8_t *>(body.data()), body.size());
    return Botan::hex_encode(hash->final(), true);
}

CanonicalRequest canonicalize_request(const SignatureRequest &request) {
    validate(request);

    CanonicalRequest ret;
    ret.parameters = canonical_parameters(request);
    ret.body_digest = body_digest(std::string_view{request.body});
    ret.string_to_sign = std::format("{}&{}&{}", request.uri_path, ret.parameters, ret.body_digest);
    ret.encoded = urlencode(ret.string_to_sign);
    return ret;
}

} // namespace wbcpp::webull::auth
