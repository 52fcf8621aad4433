#include <boost/program_options.hpp>

#include <nfa/auction/auction_state_machine.hpp>
#include <nfa/auction/config.hpp>
#include <nfa/auction/exceptions.hpp>
#include <nfa/auction/memory_asset_registry.hpp>
#include <nfa/auction/memory_payment_ledger.hpp>
#include <nfa/auction/time.hpp>

#include <fc/crypto/elliptic.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/file_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/reflect/variant.hpp>

#include <iostream>
#include <limits>

using namespace nfa::auction;

namespace nfa { namespace replay {

   struct config
   {
      fc::logging_config  logging = fc::logging_config::default_config();
      bool                print_events = true;
      bool                print_record = true;
   };

   struct account_entry
   {
      string              name;
      share_type          balance = 0;
      share_type          allowance = 0;
   };

   /** One step of a script: start, bid, withdraw, end, or advance the clock. */
   struct action_entry
   {
      string              type;
      string              account;
      share_type          amount = 0;
      int64_t             seconds = 0;
   };

   struct script
   {
      string                  start_time = NFA_REPLAY_DEFAULT_START_TIME;
      int32_t                 currency = NFA_DEFAULT_CURRENCY_ID;
      item_id_type            item = 0;
      string                  seller = "seller";
      string                  escrow = "escrow";
      share_type              starting_price = 0;
      vector<account_entry>   accounts;
      vector<action_entry>    actions;
   };

} } // nfa::replay

FC_REFLECT( nfa::replay::config, (logging)(print_events)(print_record) )
FC_REFLECT( nfa::replay::account_entry, (name)(balance)(allowance) )
FC_REFLECT( nfa::replay::action_entry, (type)(account)(amount)(seconds) )
FC_REFLECT( nfa::replay::script, (start_time)(currency)(item)(seller)(escrow)(starting_price)(accounts)(actions) )

using namespace nfa::replay;

boost::program_options::variables_map parse_option_variables( int argc, char** argv )
{
    boost::program_options::positional_options_description p_option_config;
    p_option_config.add("script", 1);

    boost::program_options::options_description option_config("Usage");
    option_config.add_options()
        ("help", "Display this help message and exit")
        ("script", boost::program_options::value<string>(), "JSON file describing the auction and the actions to replay")
        ("data-dir", boost::program_options::value<string>()->default_value("."), "Directory holding config.json and logs")
        ;

    boost::program_options::variables_map option_variables;
    try
    {
        boost::program_options::store(
                                      boost::program_options::command_line_parser(argc, argv)
                                     .options(option_config)
                                     .positional(p_option_config)
                                     .run(),
                                     option_variables
                                     );
        boost::program_options::notify(option_variables);
    }
    catch (boost::program_options::error& cmdline_error)
    {
        std::cerr << "Error: " << cmdline_error.what() << "\n";
        std::cerr << option_config << "\n";
        exit(1);
    }

    if (option_variables.count("help") || !option_variables.count("script"))
    {
        std::cout << option_config << "\n";
        exit(option_variables.count("help") ? 0 : 1);
    }

    return option_variables;
}

config load_config( const fc::path& datadir )
{ try {
    fc::path config_file = datadir / NFA_REPLAY_CONFIG_FILENAME;
    config cfg;
    if( fc::exists( config_file ) )
    {
       std::cout << "Loading config from file: " << config_file.preferred_string() << "\n";
       cfg = fc::json::from_file( config_file ).as<config>();
    }
    else
    {
       std::cerr << "Creating default config file at: " << config_file.preferred_string() << "\n";
       fc::create_directories( datadir );
       fc::json::save_to_file( cfg, config_file );
    }

    // file appenders may name paths relative to the data directory
    for( fc::appender_config& appender : cfg.logging.appenders )
    {
       if( appender.type == "file" )
       {
          fc::file_appender::config file_appender_config = appender.args.as<fc::file_appender::config>();
          if( file_appender_config.filename.is_relative() )
          {
             file_appender_config.filename = fc::absolute( datadir / file_appender_config.filename );
             appender.args = fc::variant( file_appender_config );
          }
       }
    }
    return cfg;
} FC_RETHROW_EXCEPTIONS( warn, "unable to load config from ${data_dir}", ("data_dir",datadir) ) }

address account_address( const string& name )
{
    return address( fc::ecc::private_key::regenerate( fc::sha256::hash( name ) ).get_public_key() );
}

void run_action( auction_state_machine& auction, const action_entry& action, asset_id_type currency )
{
    const address caller = account_address( action.account );
    if( action.type == "start" )
        auction.start( caller );
    else if( action.type == "bid" )
        auction.bid( caller, asset( action.amount, currency ) );
    else if( action.type == "withdraw" )
        std::cout << "  paid " << string( auction.withdraw( caller ) ) << "\n";
    else if( action.type == "end" )
        auction.end( caller );
    else if( action.type == "advance" )
    {
        FC_ASSERT( action.seconds >= 0 && action.seconds <= std::numeric_limits<int32_t>::max(),
                   "cannot advance the clock by ${s} seconds", ("s",action.seconds) );
        advance_time( int32_t( action.seconds ) );
    }
    else
        FC_THROW_EXCEPTION( fc::invalid_arg_exception, "unknown action ${t}", ("t",action.type) );
}

int run( const script& s, const config& cfg )
{
    start_simulated_time( fc::time_point::from_iso_string( s.start_time ) );

    const asset_id_type currency( s.currency );
    const address seller = account_address( s.seller );
    const address escrow = account_address( s.escrow );

    auto registry = std::make_shared<memory_asset_registry>( escrow );
    auto ledger   = std::make_shared<memory_payment_ledger>( escrow, currency );

    registry->register_item( s.item, seller );
    registry->approve( seller, s.item );
    for( const auto& account : s.accounts )
    {
        const address owner = account_address( account.name );
        if( account.balance > 0 )
            ledger->deposit( owner, asset( account.balance, currency ) );
        ledger->approve( owner, escrow, asset( account.allowance, currency ) );
        std::cout << account.name << ": " << owner.to_string() << "\n";
    }

    auction_state_machine auction( registry, ledger, seller, escrow, s.item, asset( s.starting_price, currency ) );

    if( cfg.print_events )
    {
        auction.auction_started.connect( [&]() {
            std::cout << "  event start\n";
        });
        auction.bid_placed.connect( [&]( const address& a, const asset& amt ) {
            std::cout << "  event bid " << a.to_string() << " " << string( amt ) << "\n";
        });
        auction.funds_withdrawn.connect( [&]( const address& a, const asset& amt ) {
            std::cout << "  event withdrawal " << a.to_string() << " " << string( amt ) << "\n";
        });
        auction.auction_ended.connect( [&]( const address& a, const asset& amt ) {
            std::cout << "  event end " << ( a.is_null() ? string( "none" ) : a.to_string() ) << " " << string( amt ) << "\n";
        });
    }

    uint32_t rejected = 0;
    for( const auto& action : s.actions )
    {
        std::cout << string( now() ) << " " << action.type << " " << action.account << "\n";
        try
        {
            run_action( auction, action, currency );
        }
        catch( const fc::exception& e )
        {
            ++rejected;
            wlog( "${e}", ("e",e.to_detail_string()) );
            std::cout << "  rejected: " << e.name() << ": " << e.to_string() << "\n";
        }
    }

    if( cfg.print_record )
    {
        std::cout << fc::json::to_pretty_string( auction.get_record() ) << "\n";
        const optional<address> owner = registry->get_owner( s.item );
        if( owner.valid() )
            std::cout << "item owner: " << owner->to_string() << "\n";
        std::cout << "seller balance: " << string( ledger->get_balance( seller ) ) << "\n";
        std::cout << "escrow balance: " << string( ledger->get_balance( escrow ) ) << "\n";
    }

    std::cout << s.actions.size() << " actions, " << rejected << " rejected\n";
    return 0;
}

int main( int argc, char** argv )
{
    boost::program_options::variables_map option_variables = parse_option_variables( argc, argv );

    try
    {
        const fc::path data_dir = fc::absolute( fc::path( option_variables["data-dir"].as<string>() ) );
        const config cfg = load_config( data_dir );
        fc::configure_logging( cfg.logging );

        const fc::path script_file( option_variables["script"].as<string>() );
        FC_ASSERT( fc::exists( script_file ), "no such script ${f}", ("f",script_file) );
        const script s = fc::json::from_file( script_file ).as<script>();

        return run( s, cfg );
    }
    catch( const fc::exception& e )
    {
        std::cerr << e.to_detail_string() << "\n";
        return 1;
    }
}
