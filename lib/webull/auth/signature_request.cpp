#include "wbcpp/webull/auth/signature_request.hpp"

#include <string_view>

namespace wbcpp::webull::auth {

std::string_view SignatureRequest::header_value(std::string_view name) const {
    if (name == header::app_key) {
        return app_key;
    }
    if (name == header::signature_algorithm) {
        return signature_algorithm;
    }
    if (name == header::signature_version) {
        return signature_version;
    }
    if (name == header::signature_nonce) {
        return nonce;
    }
    if (name == header::timestamp) {
        return timestamp;
    }
    if (name == header::host) {
        return host;
    }
    return {};
}

} // namespace wbcpp::webull::auth
