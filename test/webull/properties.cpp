#include "wbcpp/webull/auth/canonicalize.hpp"
#include "wbcpp/webull/auth/sign_request.hpp"
#include "wbcpp/webull/auth/signature_request.hpp"
#include "wbcpp/webull/auth/urlencode.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <string>
#include <string_view>

namespace {

constexpr std::string_view secret = "0f50a2e853334a9aae1a783bee120c1f";

[[nodiscard]] wbcpp::webull::auth::SignatureRequest fixture() {
    return {
        .uri_path = "/trade/place_order",
        .query_parameters = {{"a1", "webull"}, {"a2", "123"}, {"a3", "xxx"}, {"q1", "yyy"}},
        .timestamp = "2022-01-04T03:55:31Z",
        .nonce = "48ef5afed43d4d91ae514aaeafbc29ba",
        .app_key = "776da210ab4a452795d74e726ebd74b6",
        .host = "api.webull.com",
        .body = R"---({"k1":123,"k2":"this is the api request body","k3":true,"k4":{"foo":[1,2]}})---",
    };
}

} // namespace

// NOLINTNEXTLINE(bugprone-exception-escape,readability-function-cognitive-complexity)
int main() {
    using namespace wbcpp::webull::auth;

    const std::string reference = sign(fixture(), secret);

    // deterministic
    if (sign(fixture(), secret) != reference) {
        std::cerr << "signing the same request twice differs\n";
        return 1;
    }

    // query insertion order is irrelevant
    {
        SignatureRequest request = fixture();
        std::ranges::reverse(request.query_parameters);
        if (sign(request, secret) != reference) {
            std::cerr << "reversed query order changed the signature\n";
            return 1;
        }
        std::ranges::rotate(request.query_parameters, request.query_parameters.begin() + 1);
        if (sign(request, secret) != reference) {
            std::cerr << "rotated query order changed the signature\n";
            return 1;
        }
    }

    // canonical headers override colliding query parameters
    {
        SignatureRequest request = fixture();
        request.query_parameters.emplace_back("host", "evil.example.com");
        request.query_parameters.emplace_back("x-timestamp", "1970-01-01T00:00:00Z");
        const auto canonical = canonicalize_request(request);
        if (canonical.parameters != canonicalize_request(fixture()).parameters) {
            std::cerr << "query parameter overrode a canonical header, got \n" << canonical.parameters << "\n";
            return 1;
        }
        if (sign(request, secret) != reference) {
            std::cerr << "colliding query parameter changed the signature\n";
            return 1;
        }
    }

    // numeric looking values stay verbatim
    {
        SignatureRequest request = fixture();
        request.query_parameters[1].second = "0123";
        const auto canonical = canonicalize_request(request);
        if (canonical.parameters.find("a2=0123&") == std::string::npos) {
            std::cerr << "numeric value was reformatted, got \n" << canonical.parameters << "\n";
            return 1;
        }
    }

    // every body byte participates
    {
        const std::string reference_digest = canonicalize_request(fixture()).body_digest;
        for (std::size_t i = 0; i < fixture().body.size(); i++) {
            SignatureRequest request = fixture();
            request.body[i] ^= 0x01;
            const auto canonical = canonicalize_request(request);
            if (canonical.body_digest == reference_digest) {
                std::cerr << "flipping body byte " << i << " kept the digest\n";
                return 1;
            }
            if (sign_canonical(canonical.encoded, secret) == reference) {
                std::cerr << "flipping body byte " << i << " kept the signature\n";
                return 1;
            }
        }
    }

    // empty body digests the empty sequence
    {
        SignatureRequest request = fixture();
        request.body.clear();
        if (canonicalize_request(request).body_digest != "D41D8CD98F00B204E9800998ECF8427E") {
            std::cerr << "empty body digest failed, got \n"
                      << canonicalize_request(request).body_digest << "\n";
            return 1;
        }
        if (body_digest(std::string_view{}) != "D41D8CD98F00B204E9800998ECF8427E") {
            std::cerr << "empty span digest failed\n";
            return 1;
        }
    }

    // the secret only enters the HMAC
    {
        std::string other_secret{secret};
        other_secret.back() = 'e';
        const auto canonical = canonicalize_request(fixture());
        if (sign(fixture(), other_secret) == reference) {
            std::cerr << "changing the secret kept the signature\n";
            return 1;
        }
        if (sign_canonical(canonical.encoded, other_secret) != sign(fixture(), other_secret)) {
            std::cerr << "sign_canonical disagrees with sign\n";
            return 1;
        }
    }

    // strict escaping of the composed string
    {
        if (urlencode("/a&b=c:d+e") != "%2Fa%26b%3Dc%3Ad%2Be") {
            std::cerr << "urlencode failed, got \n" << urlencode("/a&b=c:d+e") << "\n";
            return 1;
        }
        if (urlencode("AZaz09-._~") != "AZaz09-._~") {
            std::cerr << "urlencode escaped an unreserved character\n";
            return 1;
        }
        if (urlencode("a b\xff") != "a%20b%FF") {
            std::cerr << "urlencode failed, got \n" << urlencode("a b\xff") << "\n";
            return 1;
        }
        if (urlencode_required("AZaz09-._~") || !urlencode_required("a/b")) {
            std::cerr << "urlencode_required failed\n";
            return 1;
        }
        const auto encoded = canonicalize_request(fixture()).encoded;
        if (encoded.find_first_of("&=:/+") != std::string::npos) {
            std::cerr << "reserved character left in \n" << encoded << "\n";
            return 1;
        }
    }
}
