#include <mutual/host/error.hpp>

#include <string>
#include <utility>

namespace mutual::host {

struct _host_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "host";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< host_errc >( condition ) )
    {
      case host_errc::ok:
        return "ok"s;
      case host_errc::invalid_transaction:
        return "invalid transaction"s;
      case host_errc::invalid_signature:
        return "invalid signature"s;
      case host_errc::unknown_program:
        return "unknown program"s;
      case host_errc::unknown_account:
        return "unknown account"s;
      case host_errc::read_only_account:
        return "account is not writable by this program"s;
      case host_errc::stack_overflow:
        return "stack overflow"s;
      case host_errc::input_exhausted:
        return "input exhausted"s;
      case host_errc::bad_file_descriptor:
        return "bad file descriptor"s;
      case host_errc::duplicate_account:
        return "account already exists"s;
    }
    std::unreachable();
  }
};

const std::error_category& host_category() noexcept
{
  static _host_category category;
  return category;
}

std::error_code make_error_code( host_errc e )
{
  return std::error_code( static_cast< int >( e ), host_category() );
}

} // namespace mutual::host
