#define BOOST_TEST_MODULE AuctionTests
#include <boost/test/unit_test.hpp>

#include "auction_fixture.hpp"

#include <vector>

BOOST_FIXTURE_TEST_SUITE( auction_lifecycle, auction_fixture )

BOOST_AUTO_TEST_CASE( created_auction_holds_nothing )
{
   BOOST_CHECK( auction->get_state() == auction_state::created );
   BOOST_CHECK( !auction->get_end_time().valid() );
   BOOST_CHECK( auction->get_highest_bidder().is_null() );
   BOOST_CHECK_EQUAL( auction->get_highest_bid().amount, NFA_TEST_STARTING_PRICE );
   BOOST_CHECK_EQUAL( auction->get_refundable_balance( alice ).amount, 0 );
   BOOST_CHECK( *registry->get_owner( NFA_TEST_ITEM ) == seller );
}

BOOST_AUTO_TEST_CASE( start_escrows_item_for_seven_days )
{
   const time_point_sec started_at = now();
   auction->start( seller );

   BOOST_CHECK( auction->get_state() == auction_state::active );
   BOOST_REQUIRE( auction->get_end_time().valid() );
   BOOST_CHECK_EQUAL( auction->get_end_time()->sec_since_epoch(),
                      started_at.sec_since_epoch() + 7*24*60*60 );
   BOOST_CHECK( *registry->get_owner( NFA_TEST_ITEM ) == escrow );
}

BOOST_AUTO_TEST_CASE( only_seller_can_start )
{
   BOOST_CHECK_THROW( auction->start( alice ), unauthorized );
   BOOST_CHECK( auction->get_state() == auction_state::created );
   BOOST_CHECK( !auction->get_record().started );
   BOOST_CHECK( !auction->get_end_time().valid() );
   BOOST_CHECK( *registry->get_owner( NFA_TEST_ITEM ) == seller );
}

BOOST_AUTO_TEST_CASE( start_twice_fails )
{
   auction->start( seller );
   const optional<time_point_sec> end_at = auction->get_end_time();
   advance_time( 60 );

   BOOST_CHECK_THROW( auction->start( seller ), auction_already_started );
   BOOST_CHECK( *auction->get_end_time() == *end_at );
}

BOOST_AUTO_TEST_CASE( start_without_item_approval_rolls_back )
{
   auto unapproved = std::make_shared<memory_asset_registry>( escrow );
   unapproved->register_item( NFA_TEST_ITEM, seller );
   auction_state_machine other( unapproved, ledger, seller, escrow, NFA_TEST_ITEM, asset( NFA_TEST_STARTING_PRICE ) );

   bool started_event = false;
   other.auction_started.connect( [&]() { started_event = true; } );

   BOOST_CHECK_THROW( other.start( seller ), external_call_failed );
   BOOST_CHECK( other.get_state() == auction_state::created );
   BOOST_CHECK( !other.get_end_time().valid() );
   BOOST_CHECK( !started_event );
   BOOST_CHECK( *unapproved->get_owner( NFA_TEST_ITEM ) == seller );
}

BOOST_AUTO_TEST_CASE( bid_before_start_fails )
{
   BOOST_CHECK_THROW( auction->bid( alice, asset( 15 ) ), auction_not_started );
   BOOST_CHECK( auction->get_highest_bidder().is_null() );
   BOOST_CHECK_EQUAL( balance_of( alice ), NFA_TEST_FUNDS );
}

BOOST_AUTO_TEST_CASE( bid_must_exceed_highest_bid )
{
   auction->start( seller );

   BOOST_CHECK_THROW( auction->bid( alice, asset( NFA_TEST_STARTING_PRICE ) ), bid_too_low );
   BOOST_CHECK_THROW( auction->bid( alice, asset( 5 ) ), bid_too_low );

   auction->bid( alice, asset( 15 ) );
   BOOST_CHECK_THROW( auction->bid( bob, asset( 15 ) ), bid_too_low );

   BOOST_CHECK( auction->get_highest_bidder() == alice );
   BOOST_CHECK_EQUAL( auction->get_highest_bid().amount, 15 );
   BOOST_CHECK_EQUAL( balance_of( bob ), NFA_TEST_FUNDS );
}

BOOST_AUTO_TEST_CASE( bid_in_other_currency_fails )
{
   auction->start( seller );
   BOOST_CHECK_THROW( auction->bid( alice, asset( 50, 7 ) ), asset_type_mismatch );
   BOOST_CHECK( auction->get_highest_bidder().is_null() );
}

BOOST_AUTO_TEST_CASE( bid_without_authorized_funds_fails )
{
   auction->start( seller );
   ledger->approve( alice, escrow, asset( 10 ) );

   BOOST_CHECK_THROW( auction->bid( alice, asset( 15 ) ), external_call_failed );
   BOOST_CHECK( auction->get_highest_bidder().is_null() );
   BOOST_CHECK_EQUAL( auction->get_highest_bid().amount, NFA_TEST_STARTING_PRICE );

   const address broke = key_address( "broke" );
   ledger->approve( broke, escrow, asset( 100 ) );
   BOOST_CHECK_THROW( auction->bid( broke, asset( 15 ) ), external_call_failed );
   BOOST_CHECK( auction->get_highest_bidder().is_null() );
}

BOOST_AUTO_TEST_CASE( bid_at_deadline_fails )
{
   auction->start( seller );
   advance_time( NFA_AUCTION_DURATION_SEC - 1 );
   auction->bid( alice, asset( 15 ) );

   advance_time( 1 );
   BOOST_CHECK_THROW( auction->bid( bob, asset( 20 ) ), auction_expired );
   BOOST_CHECK( auction->get_highest_bidder() == alice );
}

BOOST_AUTO_TEST_CASE( highest_bid_only_increases )
{
   auction->start( seller );

   const std::vector<share_type> amounts = { 11, 9, 30, 30, 12, 31, 100, 99, 101 };
   const std::vector<address> bidders = { alice, bob, carol };

   share_type previous = auction->get_highest_bid().amount;
   address last_accepted;
   for( size_t i = 0; i < amounts.size(); ++i )
   {
      const address& bidder = bidders[ i % bidders.size() ];
      try
      {
         auction->bid( bidder, asset( amounts[i] ) );
         last_accepted = bidder;
      }
      catch( const bid_too_low& )
      {
         BOOST_CHECK( amounts[i] <= previous );
      }
      BOOST_CHECK( auction->get_highest_bid().amount >= previous );
      BOOST_CHECK( auction->get_highest_bidder() == last_accepted );
      previous = auction->get_highest_bid().amount;
   }
   BOOST_CHECK_EQUAL( previous, 101 );
}

BOOST_AUTO_TEST_CASE( outbid_leader_becomes_refundable )
{
   auction->start( seller );

   auction->bid( alice, asset( 15 ) );
   BOOST_CHECK_EQUAL( auction->get_refundable_balance( alice ).amount, 0 );

   auction->bid( bob, asset( 20 ) );
   BOOST_CHECK_EQUAL( auction->get_refundable_balance( alice ).amount, 15 );
   BOOST_CHECK_EQUAL( auction->get_refundable_balance( bob ).amount, 0 );

   auction->bid( alice, asset( 25 ) );
   auction->bid( bob, asset( 30 ) );
   BOOST_CHECK_EQUAL( auction->get_refundable_balance( alice ).amount, 40 );
   BOOST_CHECK_EQUAL( auction->get_refundable_balance( bob ).amount, 20 );

   BOOST_CHECK_EQUAL( auction->get_escrowed_total().amount, 90 );
   BOOST_CHECK_EQUAL( balance_of( escrow ), 90 );
}

BOOST_AUTO_TEST_CASE( leader_keeps_earlier_refunds )
{
   auction->start( seller );
   auction->bid( alice, asset( 15 ) );
   auction->bid( bob, asset( 20 ) );
   auction->bid( alice, asset( 25 ) );

   BOOST_CHECK( auction->get_highest_bidder() == alice );
   BOOST_CHECK_EQUAL( auction->get_refundable_balance( alice ).amount, 15 );

   BOOST_CHECK_EQUAL( auction->withdraw( alice ).amount, 15 );
   BOOST_CHECK( auction->get_highest_bidder() == alice );
   BOOST_CHECK_EQUAL( auction->get_highest_bid().amount, 25 );
   BOOST_CHECK_EQUAL( balance_of( escrow ), 45 );
}

BOOST_AUTO_TEST_CASE( withdraw_pays_once )
{
   auction->start( seller );
   auction->bid( alice, asset( 15 ) );
   auction->bid( bob, asset( 20 ) );

   BOOST_CHECK_EQUAL( auction->withdraw( alice ).amount, 15 );
   BOOST_CHECK_EQUAL( balance_of( alice ), NFA_TEST_FUNDS );
   BOOST_CHECK_EQUAL( auction->withdraw( alice ).amount, 0 );
   BOOST_CHECK_EQUAL( balance_of( alice ), NFA_TEST_FUNDS );
   BOOST_CHECK_EQUAL( auction->get_refundable_balance( alice ).amount, 0 );
}

BOOST_AUTO_TEST_CASE( withdraw_with_nothing_owed_is_allowed_in_any_state )
{
   BOOST_CHECK_EQUAL( auction->withdraw( carol ).amount, 0 );
   auction->start( seller );
   BOOST_CHECK_EQUAL( auction->withdraw( carol ).amount, 0 );
   close_bidding();
   auction->end( carol );
   BOOST_CHECK_EQUAL( auction->withdraw( carol ).amount, 0 );
   BOOST_CHECK_EQUAL( balance_of( carol ), NFA_TEST_FUNDS );
}

BOOST_AUTO_TEST_CASE( end_before_start_fails )
{
   BOOST_CHECK_THROW( auction->end( alice ), auction_not_started );
   BOOST_CHECK( auction->get_state() == auction_state::created );
}

BOOST_AUTO_TEST_CASE( end_before_deadline_fails )
{
   auction->start( seller );
   auction->bid( alice, asset( 15 ) );

   BOOST_CHECK_THROW( auction->end( alice ), invalid_state );
   advance_time( NFA_AUCTION_DURATION_SEC - 1 );
   BOOST_CHECK_THROW( auction->end( alice ), auction_too_early );

   BOOST_CHECK( auction->get_state() == auction_state::active );
   BOOST_CHECK( *registry->get_owner( NFA_TEST_ITEM ) == escrow );
   BOOST_CHECK_EQUAL( balance_of( seller ), 0 );
}

BOOST_AUTO_TEST_CASE( end_twice_fails )
{
   auction->start( seller );
   auction->bid( alice, asset( 15 ) );
   close_bidding();

   auction->end( bob );
   BOOST_CHECK_THROW( auction->end( bob ), auction_already_ended );
   BOOST_CHECK_THROW( auction->end( seller ), invalid_state );
   BOOST_CHECK_EQUAL( balance_of( seller ), 15 );
}

BOOST_AUTO_TEST_CASE( nothing_mutates_after_end )
{
   auction->start( seller );
   auction->bid( alice, asset( 15 ) );
   close_bidding();
   auction->end( alice );

   BOOST_CHECK_THROW( auction->bid( bob, asset( 100 ) ), auction_expired );
   BOOST_CHECK_THROW( auction->start( seller ), auction_already_started );
   BOOST_CHECK( auction->get_state() == auction_state::ended );
   BOOST_CHECK( auction->get_highest_bidder() == alice );
}

BOOST_AUTO_TEST_CASE( full_auction_scenario )
{
   std::vector<string> events;
   auction->auction_started.connect( [&]() { events.push_back( "start" ); } );
   auction->bid_placed.connect( [&]( const address& a, const asset& amt ) {
      events.push_back( "bid " + fc::to_string( amt.amount ) );
   });
   auction->funds_withdrawn.connect( [&]( const address& a, const asset& amt ) {
      events.push_back( "withdrawal " + fc::to_string( amt.amount ) );
   });
   auction->auction_ended.connect( [&]( const address& a, const asset& amt ) {
      events.push_back( string( a == bob ? "end bob " : "end ? " ) + fc::to_string( amt.amount ) );
   });

   auction->start( seller );
   BOOST_CHECK( *registry->get_owner( NFA_TEST_ITEM ) == escrow );

   auction->bid( alice, asset( 15 ) );
   BOOST_CHECK( auction->get_highest_bidder() == alice );

   BOOST_CHECK_THROW( auction->bid( bob, asset( 12 ) ), bid_too_low );

   auction->bid( bob, asset( 20 ) );
   BOOST_CHECK( auction->get_highest_bidder() == bob );
   BOOST_CHECK_EQUAL( auction->get_refundable_balance( alice ).amount, 15 );

   BOOST_CHECK_EQUAL( auction->withdraw( alice ).amount, 15 );
   BOOST_CHECK_EQUAL( auction->get_refundable_balance( alice ).amount, 0 );
   BOOST_CHECK_EQUAL( balance_of( alice ), NFA_TEST_FUNDS );

   close_bidding();
   auction->end( carol );

   BOOST_CHECK( auction->get_state() == auction_state::ended );
   BOOST_CHECK( *registry->get_owner( NFA_TEST_ITEM ) == bob );
   BOOST_CHECK_EQUAL( balance_of( seller ), 20 );
   BOOST_CHECK_EQUAL( balance_of( bob ), NFA_TEST_FUNDS - 20 );
   BOOST_CHECK_EQUAL( balance_of( escrow ), 0 );
   BOOST_CHECK_EQUAL( auction->get_escrowed_total().amount, 0 );

   const std::vector<string> expected = { "start", "bid 15", "bid 20", "withdrawal 15", "end bob 20" };
   BOOST_CHECK_EQUAL_COLLECTIONS( events.begin(), events.end(), expected.begin(), expected.end() );
}

BOOST_AUTO_TEST_CASE( auction_without_bids_returns_item )
{
   address ended_with;
   asset ended_at_price;
   uint32_t end_events = 0;
   auction->auction_ended.connect( [&]( const address& a, const asset& amt ) {
      ended_with = a;
      ended_at_price = amt;
      ++end_events;
   });

   auction->start( seller );
   close_bidding();
   auction->end( alice );

   BOOST_CHECK( auction->get_state() == auction_state::ended );
   BOOST_CHECK( *registry->get_owner( NFA_TEST_ITEM ) == seller );
   BOOST_CHECK( auction->get_highest_bidder().is_null() );
   BOOST_CHECK_EQUAL( balance_of( seller ), 0 );
   BOOST_CHECK_EQUAL( ledger->get_total_supply().amount, 3 * NFA_TEST_FUNDS );

   BOOST_CHECK_EQUAL( end_events, 1u );
   BOOST_CHECK( ended_with.is_null() );
   BOOST_CHECK_EQUAL( ended_at_price.amount, NFA_TEST_STARTING_PRICE );
}

BOOST_AUTO_TEST_CASE( losers_withdraw_after_end )
{
   auction->start( seller );
   auction->bid( alice, asset( 15 ) );
   auction->bid( carol, asset( 18 ) );
   auction->bid( bob, asset( 20 ) );
   close_bidding();
   auction->end( seller );

   BOOST_CHECK_EQUAL( balance_of( escrow ), 33 );
   BOOST_CHECK_EQUAL( auction->withdraw( alice ).amount, 15 );
   BOOST_CHECK_EQUAL( auction->withdraw( carol ).amount, 18 );
   BOOST_CHECK_EQUAL( auction->withdraw( bob ).amount, 0 );
   BOOST_CHECK_EQUAL( balance_of( escrow ), 0 );
   BOOST_CHECK_EQUAL( ledger->get_total_supply().amount, 3 * NFA_TEST_FUNDS );
}

BOOST_AUTO_TEST_SUITE_END()
