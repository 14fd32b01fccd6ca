#pragma once

#include <string>
#include <string_view>

namespace wsp {

std::string json_escape(std::string_view s);

// json_escape wrapped in double quotes
std::string json_string(std::string_view s);

} // namespace wsp
