#include <mutual/host/call_stack.hpp>

#include <stdexcept>
#include <utility>

namespace mutual::host {

call_stack::call_stack( std::size_t stack_limit ):
    _stack(),
    _limit( stack_limit )
{}

std::error_code call_stack::push_frame( stack_frame&& f ) noexcept
{
  if( _stack.size() >= _limit )
    return host_errc::stack_overflow;

  _stack.emplace_back( std::move( f ) );

  return host_errc::ok;
}

stack_frame& call_stack::peek_frame()
{
  if( _stack.empty() )
    throw std::runtime_error( "stack is empty" );

  return _stack.back();
}

const stack_frame* call_stack::caller_frame() const noexcept
{
  if( _stack.size() < 2 )
    return nullptr;

  return &_stack[ _stack.size() - 2 ];
}

stack_frame call_stack::pop_frame()
{
  if( _stack.empty() )
    throw std::runtime_error( "stack is empty" );

  stack_frame frame = std::move( _stack.back() );
  _stack.pop_back();

  return frame;
}

std::size_t call_stack::size() const noexcept
{
  return _stack.size();
}

} // namespace mutual::host
