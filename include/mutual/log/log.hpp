#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <mutual/log/formatter.hpp>
#include <mutual/log/frontend.hpp>

namespace mutual::log {

void initialize( std::string_view level = "info" );
logger* instance() noexcept;

} // namespace mutual::log
