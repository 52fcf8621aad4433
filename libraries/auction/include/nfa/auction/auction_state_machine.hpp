#pragma once

#include <nfa/auction/asset_registry.hpp>
#include <nfa/auction/auction_record.hpp>
#include <nfa/auction/payment_ledger.hpp>

#include <fc/signals.hpp>

namespace nfa { namespace auction {

   namespace detail { class auction_state_machine_impl; }

   enum auction_event_type
   {
      start_event       = 0,
      bid_event         = 1,
      withdrawal_event  = 2,
      end_event         = 3
   };

   struct auction_event
   {
      auction_event():type(start_event){}
      auction_event( auction_event_type t, const address& a, const asset& amt, const time_point_sec& ts )
      :type(t),account(a),amount(amt),timestamp(ts){}

      auction_event_type  type;
      address             account;
      asset               amount;
      time_point_sec      timestamp;
   };

   /**
    *  @class auction_state_machine
    *  @brief Escrows one item and runs an ascending auction for it.
    *
    *  created --start--> active --end--> ended
    *
    *  start(), bid(), withdraw() and end() are the only mutators.  Each one runs
    *  under the auction's lock and either commits completely or throws and leaves
    *  the record exactly as it found it.
    *
    *  Local state is always updated before asset_registry or payment_ledger are
    *  called, so a capability that reads this auction from inside transfer(),
    *  credit() or escrow() sees the outcome of the operation in progress.  A
    *  mutator called from inside another operation on the same auction fails
    *  with operation_in_progress and changes nothing.
    *
    *  Notifications are delivered after the operation commits and the lock is
    *  released, so observers may query or mutate the auction.  They are never
    *  delivered for an operation that rolled back.
    */
   class auction_state_machine
   {
      public:
         auction_state_machine( const asset_registry_ptr& registry,
                                const payment_ledger_ptr& ledger,
                                const address& seller,
                                const address& escrow_account,
                                item_id_type item,
                                const asset& starting_price );

         /** Resumes an auction from a record previously returned by get_record(). */
         auction_state_machine( const asset_registry_ptr& registry,
                                const payment_ledger_ptr& ledger,
                                const auction_record& saved );

         ~auction_state_machine();

         /**
          *  Opens the bidding window for NFA_AUCTION_DURATION_SEC and moves the
          *  item from the seller into escrow.  Only the seller may start.
          */
         void start( const address& caller );

         /**
          *  Places a bid strictly greater than the current highest bid.  The bid
          *  is pulled into escrow through the payment ledger before any state
          *  changes; the previous leader's bid becomes refundable.
          */
         void bid( const address& caller, const asset& amount );

         /**
          *  Pays out everything refundable to @p caller.  Allowed in any state.
          *  @return the amount paid, zero when nothing was owed
          */
         asset withdraw( const address& caller );

         /**
          *  Settles the auction once the window has closed: the item goes to the
          *  winner and the winning bid to the seller, or the item goes back to
          *  the seller when nobody bid.  Anyone may call it.
          */
         void end( const address& caller );

         auction_state            get_state()const;
         auction_record           get_record()const;
         address                  get_highest_bidder()const;
         asset                    get_highest_bid()const;
         asset                    get_refundable_balance( const address& owner )const;
         optional<time_point_sec> get_end_time()const;
         asset                    get_escrowed_total()const;

         fc::signal<void()>                                    auction_started;
         fc::signal<void( const address&, const asset& )>      bid_placed;
         fc::signal<void( const address&, const asset& )>      funds_withdrawn;
         fc::signal<void( const address&, const asset& )>      auction_ended;

      private:
         std::unique_ptr<detail::auction_state_machine_impl> my;
   };
   typedef std::shared_ptr<auction_state_machine> auction_state_machine_ptr;

} } // nfa::auction

FC_REFLECT_ENUM( nfa::auction::auction_event_type, (start_event)(bid_event)(withdrawal_event)(end_event) )
FC_REFLECT( nfa::auction::auction_event, (type)(account)(amount)(timestamp) )
