#include <mutual/host/context.hpp>

#include <algorithm>
#include <utility>

#include <mutual/crypto.hpp>
#include <mutual/ledger/processor.hpp>
#include <mutual/log.hpp>

namespace mutual::host {

const program_registry_map context::program_registry = []()
{
  program_registry_map registry;
  registry.emplace( ledger::ledger_program_id(), std::make_unique< ledger::processor >() );
  registry.emplace( program::token_program_id(), std::make_unique< program::token >( ledger::ledger_program_id() ) );
  return registry;
}();

context::context( store& s, std::size_t stack_limit ):
    _store( s ),
    _stack( stack_limit )
{}

void context::set_time( std::int64_t time ) noexcept
{
  _time = time;
}

result< protocol::program_output > context::execute( const protocol::transaction& transaction )
{
  if( !transaction.validate() )
    return std::unexpected( host_errc::invalid_transaction );

  _verified_signatures.clear();

  for( const auto& authorization: transaction.authorizations )
  {
    crypto::public_key signer( crypto::public_key_span( authorization.signer ) );
    if( !signer.verify( authorization.signature, transaction.id ) )
      return std::unexpected( host_errc::invalid_signature );

    _verified_signatures.push_back( authorization.signer );
  }

  _transaction  = &transaction;
  auto snapshot = _store;

  auto output =
    run_program( transaction.instruction.program, transaction.instruction.accounts, transaction.instruction.data );

  _transaction = nullptr;
  _verified_signatures.clear();

  if( !output )
  {
    _store = std::move( snapshot );

    LOG_DEBUG( log::instance(),
               "Reverted transaction {}: {}",
               log::hex{ transaction.id.data(), transaction.id.size() },
               output.error().message() );
    return output;
  }

  LOG_DEBUG( log::instance(),
             "Applied transaction {} at time {}",
             log::hex{ transaction.id.data(), transaction.id.size() },
             _time );

  return output;
}

std::span< const std::byte > context::input()
{
  return _stack.peek_frame().stdin;
}

std::error_code context::write( program::file_descriptor fd, std::span< const std::byte > buffer )
{
  auto& frame = _stack.peek_frame();

  if( fd == program::file_descriptor::stdout )
  {
    frame.stdout.insert( frame.stdout.end(), buffer.begin(), buffer.end() );
    return host_errc::ok;
  }
  else if( fd == program::file_descriptor::stderr )
  {
    frame.stderr.insert( frame.stderr.end(), buffer.begin(), buffer.end() );
    return host_errc::ok;
  }

  return host_errc::bad_file_descriptor;
}

std::error_code context::read( program::file_descriptor fd, std::span< std::byte > buffer )
{
  if( fd != program::file_descriptor::stdin )
    return host_errc::bad_file_descriptor;

  auto& frame = _stack.peek_frame();

  if( frame.stdin.size() - frame.stdin_offset < buffer.size() )
    return host_errc::input_exhausted;

  std::ranges::copy( frame.stdin.subspan( frame.stdin_offset, buffer.size() ), buffer.begin() );
  frame.stdin_offset += buffer.size();

  return host_errc::ok;
}

std::span< const std::byte > context::get_object( std::uint32_t id, std::span< const std::byte > key )
{
  return _store.get_object( _stack.peek_frame().program_id, id, key );
}

std::error_code
context::put_object( std::uint32_t id, std::span< const std::byte > key, std::span< const std::byte > value )
{
  _store.put_object( _stack.peek_frame().program_id, id, key, value );
  return host_errc::ok;
}

std::error_code context::remove_object( std::uint32_t id, std::span< const std::byte > key )
{
  _store.remove_object( _stack.peek_frame().program_id, id, key );
  return host_errc::ok;
}

result< bool > context::check_authority( protocol::account_view account )
{
  if( _transaction == nullptr )
    return false;

  return std::ranges::any_of( _verified_signatures,
                              [ & ]( const protocol::account& signer )
                              {
                                return std::ranges::equal( signer, account );
                              } );
}

std::span< const std::byte > context::get_caller()
{
  if( auto frame = _stack.caller_frame(); frame )
    return frame->program_id;

  return std::span< const std::byte >{};
}

protocol::account_view context::get_program_id()
{
  return _stack.peek_frame().program_id;
}

std::span< const protocol::account > context::accounts()
{
  return _stack.peek_frame().accounts;
}

result< protocol::account_view > context::get_account_owner( protocol::account_view account )
{
  static const protocol::account unowned{};

  if( auto slot = _store.find_account( account ); slot )
    return protocol::account_view( slot->owner );

  return protocol::account_view( unowned );
}

result< std::span< const std::byte > > context::get_account_data( protocol::account_view account )
{
  if( auto slot = _store.find_account( account ); slot )
    return std::span< const std::byte >( slot->data );

  return std::span< const std::byte >{};
}

result< std::span< std::byte > > context::get_mutable_account_data( protocol::account_view account )
{
  auto slot = _store.find_account( account );
  if( !slot )
    return std::unexpected( host_errc::unknown_account );

  if( slot->owner != _stack.peek_frame().program_id )
    return std::unexpected( host_errc::read_only_account );

  return std::span< std::byte >( slot->data );
}

std::int64_t context::get_time()
{
  return _time;
}

result< protocol::program_output > context::call_program( protocol::account_view account,
                                                          std::span< const std::byte > stdin )
{
  return run_program( account, std::span< const protocol::account >{}, stdin );
}

result< protocol::program_output > context::run_program( protocol::account_view account,
                                                         std::span< const protocol::account > accounts,
                                                         std::span< const std::byte > stdin )
{
  auto registry_iterator = program_registry.find( protocol::account( account ) );
  if( registry_iterator == program_registry.end() )
    return std::unexpected( host_errc::unknown_program );

  if( auto error = _stack.push_frame(
        { .program_id = protocol::account( account ), .accounts = accounts, .stdin = stdin } );
      error )
    return std::unexpected( error );

  frame_guard guard( _stack );

  if( auto error = registry_iterator->second->run( this ); error )
    return std::unexpected( error );

  auto& frame = _stack.peek_frame();

  return protocol::program_output{ .code   = 0,
                                   .stdout = std::move( frame.stdout ),
                                   .stderr = std::move( frame.stderr ) };
}

} // namespace mutual::host
