#include "wbcpp/webull/auth/urlencode.hpp"

#include <boost/url/encode.hpp> // IWYU pragma: keep
#include <boost/url/encoding_opts.hpp>
#include <boost/url/grammar/charset.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <string>
#include <string_view>

namespace wbcpp::webull::auth {

namespace {

// RFC 3986 unreserved
constexpr boost::urls::grammar::lut_chars unreserved = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                                       "abcdefghijklmnopqrstuvwxyz"
                                                       "1234567890"
                                                       "-._~";

} // namespace

std::string urlencode(std::string_view input) {
    boost::urls::encoding_opts opts;
    opts.space_as_plus = false;
    opts.lower_case = false;
    return boost::urls::encode(input, unreserved, opts);
}

bool urlencode_required(std::string_view input) {
    return boost::urls::grammar::find_if_not(input.begin(), input.end(), unreserved) != input.end();
}

} // namespace wbcpp::webull::auth
