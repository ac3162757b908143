#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <print>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>

#include <yaml-cpp/yaml.h>

#include <mutual/crypto.hpp>
#include <mutual/encode.hpp>
#include <mutual/host.hpp>
#include <mutual/ledger.hpp>
#include <mutual/log.hpp>
#include <mutual/util/options.hpp>

namespace constants {

using namespace std::string_literals;

constexpr auto service_name = "ledger"s;

constexpr auto help_option           = "help,h"s;
constexpr auto version_option        = "version,v"s;
constexpr auto basedir_option        = "basedir,d"s;
constexpr auto basedir_default       = ".mutual"s;
constexpr auto log_level_option      = "log-level,l"s;
constexpr auto log_level_default     = "info"s;
constexpr auto store_option          = "store,s"s;
constexpr auto store_default         = "ledger.store"s;
constexpr auto create_ledger_option  = "create-ledger"s;
constexpr auto capacity_option       = "capacity"s;
constexpr auto capacity_default      = 65'536ul;
constexpr auto key_option            = "key,k"s;
constexpr auto account_option        = "account,a"s;
constexpr auto signer_option         = "signer"s;
constexpr auto data_option           = "data"s;
constexpr auto time_option           = "time,t"s;
constexpr auto dump_option           = "dump"s;

constexpr auto program_prefix = "program:"s;

} // namespace constants

using namespace mutual;

namespace {

using key_ring = std::map< std::string, crypto::secret_key >;

// Accounts are given as 0x-prefixed hex, as "program:<name>" or as the name of a key on the ring.
protocol::account resolve_account( const std::string& name, const key_ring& keys )
{
  if( name.starts_with( "0x" ) )
  {
    auto bytes = encode::from_hex( name );
    if( !bytes )
      throw std::runtime_error( "invalid account '" + name + "': " + bytes.error().message() );

    if( bytes->size() != crypto::public_key_length )
      throw std::runtime_error( "invalid account '" + name + "': expected 32 bytes" );

    protocol::account account;
    std::ranges::copy( *bytes, account.begin() );
    return account;
  }

  if( name.starts_with( constants::program_prefix ) )
    return protocol::system_program( std::string_view( name ).substr( constants::program_prefix.size() ) );

  if( auto itr = keys.find( name ); itr != keys.end() )
    return protocol::user_account( itr->second.public_key() );

  throw std::runtime_error( "unknown account '" + name + "'" );
}

void print_record( const ledger::aggregate& state )
{
  std::println( "admin:            {}", encode::to_hex( state.admin ) );
  std::println( "treasury:         {}", encode::to_hex( state.treasury ) );
  std::println( "regulatory limit: {}", state.regulatory_limit );

  if( state.token_management )
    std::println( "total supply:     {}", state.token_management->total_supply );

  std::println( "members:          {}", state.members.size() );
  for( const auto& m: state.members )
    std::println( "  {} joined {}", encode::to_hex( m.address ), m.joined_at );

  std::println( "claims:           {}", state.claims.size() );
  for( const auto& c: state.claims )
    std::println( "  #{} {} amount {} verified {}", c.id, encode::to_hex( c.member ), c.amount, c.verified );

  std::println( "proposals:        {}", state.proposals.size() );
  for( const auto& p: state.proposals )
    std::println( "  #{} [{}, {}] yes {} no {} status {} \"{}\"",
                  p.id,
                  p.vote_start,
                  p.vote_end,
                  p.yes_votes,
                  p.no_votes,
                  std::to_underlying( p.status ),
                  p.description );

  std::println( "compliance:       {}", state.member_compliance.size() );
  for( const auto& c: state.member_compliance )
    std::println( "  {} kyc {} aml {}",
                  encode::to_hex( c.member ),
                  std::to_underlying( c.kyc_status ),
                  std::to_underlying( c.aml_status ) );

  std::println( "disputes:         {}", state.disputes.size() );
  for( const auto& d: state.disputes )
    std::println( "  #{} votes {} status {} \"{}\"",
                  d.id,
                  d.votes.size(),
                  std::to_underlying( d.status ),
                  d.description );

  std::println( "payouts:          {}", state.payouts.size() );
  for( const auto& p: state.payouts )
    std::println( "  claim #{} {} amount {} at {}", p.claim_id, encode::to_hex( p.recipient ), p.amount, p.paid_at );
}

} // namespace

auto main( int argc, char** argv ) -> int
{
  std::string log_level, create_ledger, data;
  std::filesystem::path store_path;
  std::uint64_t capacity = 0;
  std::int64_t time      = 0;
  bool dump              = false;
  std::vector< std::string > key_names, account_names, signer_names;

  try
  {
    boost::program_options::options_description options;

    // clang-format off
    options.add_options()
      ( constants::help_option.data()         , "Print this help message and exit" )
      ( constants::version_option.data()      , "Print version string and exit" )
      ( constants::basedir_option.data()      , boost::program_options::value< std::string >()->default_value( constants::basedir_default ), "Mutual base directory" )
      ( constants::log_level_option.data()    , boost::program_options::value< std::string >(), "The log filtering level" )
      ( constants::store_option.data()        , boost::program_options::value< std::string >(), "The store file (absolute path or relative to basedir)" )
      ( constants::create_ledger_option.data(), boost::program_options::value< std::string >(), "Create a ledger record slot at this account" )
      ( constants::capacity_option.data()     , boost::program_options::value< std::uint64_t >(), "Capacity in bytes of a created record slot" )
      ( constants::key_option.data()          , boost::program_options::value< std::vector< std::string > >()->composing(), "Named key, derived from the hash of its name" )
      ( constants::account_option.data()      , boost::program_options::value< std::vector< std::string > >()->composing(), "Instruction account, in order, starting with the record" )
      ( constants::signer_option.data()       , boost::program_options::value< std::vector< std::string > >()->composing(), "Named key that signs the transaction" )
      ( constants::data_option.data()         , boost::program_options::value< std::string >(), "Instruction data as hex" )
      ( constants::time_option.data()         , boost::program_options::value< std::int64_t >(), "Timestamp presented to the ledger, unix seconds" )
      ( constants::dump_option.data()         , boost::program_options::bool_switch(), "Print the record after the instruction" );
    // clang-format on

    boost::program_options::variables_map args;
    boost::program_options::store( boost::program_options::parse_command_line( argc, argv, options ), args );
    boost::program_options::notify( args );

    if( args.count( "help" ) )
    {
      options.print( std::cout );
      return EXIT_SUCCESS;
    }

    if( args.count( "version" ) )
    {
      std::println( "mutual-ledger v{}", MUTUAL_VERSION );
      return EXIT_SUCCESS;
    }

    auto basedir = std::filesystem::path( args[ "basedir" ].as< std::string >() );
    if( basedir.is_relative() )
      basedir = std::filesystem::current_path() / basedir;

    YAML::Node config;
    YAML::Node global_config;
    YAML::Node ledger_config;

    auto yaml_config = basedir / "config.yml";
    if( !std::filesystem::exists( yaml_config ) )
      yaml_config = basedir / "config.yaml";

    if( std::filesystem::exists( yaml_config ) )
    {
      config        = YAML::LoadFile( yaml_config.string() );
      global_config = config[ "global" ];
      ledger_config = config[ constants::service_name ];
    }

    auto now = std::chrono::duration_cast< std::chrono::seconds >(
                 std::chrono::system_clock::now().time_since_epoch() )
                 .count();

    // clang-format off
    log_level     = util::get_option< std::string >( constants::log_level_option, constants::log_level_default, args, ledger_config, global_config );
    store_path    = util::get_option< std::string >( constants::store_option, constants::store_default, args, ledger_config, global_config );
    capacity      = util::get_option< std::uint64_t >( constants::capacity_option, constants::capacity_default, args, ledger_config, global_config );
    create_ledger = util::get_option< std::string >( constants::create_ledger_option, "", args );
    data          = util::get_option< std::string >( constants::data_option, "", args );
    time          = util::get_option< std::int64_t >( constants::time_option, now, args );
    dump          = args[ "dump" ].as< bool >();
    key_names     = util::get_options< std::string >( constants::key_option, args, ledger_config, global_config );
    account_names = util::get_options< std::string >( constants::account_option, args );
    signer_names  = util::get_options< std::string >( constants::signer_option, args );
    // clang-format on

    if( store_path.is_relative() )
      store_path = basedir / store_path;

    log::initialize( log_level );

    if( config.IsNull() )
      LOG_WARNING( log::instance(),
                   "Could not find config (config.yml or config.yaml expected). Using default values" );
  }
  catch( const std::exception& e )
  {
    std::println( std::cerr, "Invalid argument: {}", e.what() );
    return EXIT_FAILURE;
  }

  try
  {
    key_ring keys;
    for( const auto& name: key_names )
      keys.insert_or_assign( name, crypto::secret_key::create( crypto::hash( name ) ) );

    host::store store;
    if( std::filesystem::exists( store_path ) )
    {
      store.load( store_path );
      LOG_INFO( log::instance(),
                "Loaded {} accounts and {} objects from {}",
                store.account_count(),
                store.object_count(),
                store_path.string() );
    }
    else
    {
      std::filesystem::create_directories( store_path.parent_path() );
    }

    std::optional< protocol::account > record;

    if( !create_ledger.empty() )
    {
      record = resolve_account( create_ledger, keys );

      if( auto error = store.create_account( *record, ledger::ledger_program_id(), capacity ); error )
        throw std::runtime_error( "unable to create ledger record: " + error.message() );

      LOG_INFO( log::instance(),
                "Created ledger record {} with capacity {}",
                log::hex{ record->data(), record->size() },
                capacity );
    }

    if( !data.empty() )
    {
      auto bytes = encode::from_hex( data );
      if( !bytes )
        throw std::runtime_error( "invalid instruction data: " + bytes.error().message() );

      protocol::transaction transaction;
      transaction.nonce               = static_cast< std::uint64_t >( time );
      transaction.instruction.program = ledger::ledger_program_id();
      transaction.instruction.data    = std::move( *bytes );

      for( const auto& name: account_names )
        transaction.instruction.accounts.push_back( resolve_account( name, keys ) );

      transaction.id = protocol::make_id( transaction );

      for( const auto& name: signer_names )
      {
        auto itr = keys.find( name );
        if( itr == keys.end() )
          throw std::runtime_error( "unknown signer '" + name + "'" );

        transaction.authorizations.push_back(
          protocol::authorization{ .signer    = protocol::user_account( itr->second.public_key() ),
                                   .signature = itr->second.sign( transaction.id ) } );
      }

      if( !transaction.instruction.accounts.empty() )
        record = transaction.instruction.accounts.front();

      host::context context( store );
      context.set_time( time );

      if( auto output = context.execute( transaction ); !output )
      {
        LOG_ERROR( log::instance(),
                   "Instruction failed: {} ({})",
                   output.error().message(),
                   output.error().category().name() );
        return EXIT_FAILURE;
      }
    }

    store.save( store_path );

    if( dump )
    {
      if( !record )
        throw std::runtime_error( "no record to dump" );

      auto slot = store.find_account( *record );
      if( !slot )
        throw std::runtime_error( "record does not exist" );

      auto state = ledger::codec::decode( slot->data );
      if( !state )
        throw std::runtime_error( "unable to decode record: " + state.error().message() );

      print_record( *state );
    }
  }
  catch( const std::exception& e )
  {
    LOG_CRITICAL( log::instance(), "An unexpected error has occurred: {}", e.what() );
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
