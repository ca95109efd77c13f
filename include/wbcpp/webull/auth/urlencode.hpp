#pragma once

#include <string>
#include <string_view>

namespace wbcpp::webull::auth {

// escapes everything outside [A-Za-z0-9._~-], including '/', '&', '=' and ':'
[[nodiscard]] std::string urlencode(std::string_view input);
[[nodiscard]] bool urlencode_required(std::string_view input);

} // namespace wbcpp::webull::auth
