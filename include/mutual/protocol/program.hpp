#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace mutual::protocol {

struct program_output
{
  std::int32_t code = 0;
  std::vector< std::byte > stdout;
  std::vector< std::byte > stderr;
};

} // namespace mutual::protocol
