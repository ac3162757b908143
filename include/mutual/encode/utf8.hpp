#pragma once

#include <string_view>

namespace mutual::encode {

// True when every code point in the view is complete and legal.
bool valid_utf8( std::string_view sv ) noexcept;

} // namespace mutual::encode
