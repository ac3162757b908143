#include <mutual/encode/utf8.hpp>

#include <boost/locale/utf.hpp>

namespace mutual::encode {

bool valid_utf8( std::string_view sv ) noexcept
{
  auto it = sv.begin();
  while( it != sv.end() )
  {
    const boost::locale::utf::code_point cp = boost::locale::utf::utf_traits< char >::decode( it, sv.end() );
    if( cp == boost::locale::utf::illegal || cp == boost::locale::utf::incomplete )
      return false;
  }
  return true;
}

} // namespace mutual::encode
