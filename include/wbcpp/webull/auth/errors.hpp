#pragma once

#include <stdexcept>

namespace wbcpp::webull::auth {

// malformed path, missing canonical header value, duplicate query parameter
class InvalidInputError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// input that cannot be represented as the bytes the signer hashes
class EncodingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace wbcpp::webull::auth
