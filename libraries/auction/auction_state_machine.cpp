#include <nfa/auction/auction_state_machine.hpp>
#include <nfa/auction/config.hpp>
#include <nfa/auction/exceptions.hpp>
#include <nfa/auction/time.hpp>

#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>

#include <boost/thread/recursive_mutex.hpp>

#include <utility>

namespace nfa { namespace auction {

   namespace detail
   {
      class auction_state_machine_impl
      {
         public:
            auction_state_machine_impl( auction_state_machine* self,
                                        const asset_registry_ptr& registry,
                                        const payment_ledger_ptr& ledger,
                                        const auction_record& record )
            :_self(self),_registry(registry),_ledger(ledger),_record(record),_item_id(record.item_id),_in_operation(false)
            {
               FC_ASSERT( _registry != nullptr, "an auction needs an asset registry" );
               FC_ASSERT( _ledger != nullptr, "an auction needs a payment ledger" );
               _record.sanity_check();
            }

            /**
             *  Runs one mutating operation under the lock and returns the
             *  notifications it queued.  The caller delivers them once the lock
             *  has been released.
             */
            template<typename Operation>
            vector<auction_event> run( const char* name, Operation&& operation );

            void transfer_item( const address& from, const address& to );
            void credit( const address& to, const asset& amount );
            void pull_escrow( const address& from, const asset& amount );

            void queue_event( auction_event_type type, const address& account, const asset& amount );
            void deliver_events( const vector<auction_event>& events );

            void check_bid( const address& caller, const asset& amount )const;

            auction_state_machine*           _self;
            asset_registry_ptr               _registry;
            payment_ledger_ptr               _ledger;
            auction_record                   _record;
            const item_id_type               _item_id;

            // capabilities may read the auction from inside transfer(), credit() or escrow()
            mutable boost::recursive_mutex   _mutex;
            bool                             _in_operation;
            vector<auction_event>            _pending_events;
      };

      /**
       *  Brackets one mutating operation.  Unless commit() is reached the record and
       *  the notification queue are put back exactly as they were on entry.
       */
      class operation_scope
      {
         public:
            explicit operation_scope( auction_state_machine_impl& impl )
            :_impl(impl),_undo_record(impl._record),_committed(false)
            {
               _impl._in_operation = true;
            }

            ~operation_scope()
            {
               if( !_committed )
               {
                  // moves only, restoring cannot allocate
                  std::swap( _impl._record, _undo_record );
                  _impl._pending_events.clear();
               }
               _impl._in_operation = false;
            }

            vector<auction_event> commit()
            {
               _impl._record.sanity_check();
               _committed = true;

               vector<auction_event> events;
               std::swap( events, _impl._pending_events );
               return events;
            }

         private:
            auction_state_machine_impl&      _impl;
            auction_record                   _undo_record;
            bool                             _committed;
      };

      template<typename Operation>
      vector<auction_event> auction_state_machine_impl::run( const char* name, Operation&& operation )
      {
         boost::recursive_mutex::scoped_lock lock( _mutex );
         if( _in_operation )
            FC_THROW_EXCEPTION( operation_in_progress, "cannot ${op} item ${i} from inside another operation on it",
                                ("op",name)("i",_record.item_id) );

         operation_scope scope( *this );
         try
         {
            operation( _record );
            return scope.commit();
         }
         catch( const fc::exception& e )
         {
            wlog( "auction ${op} for item ${i} rolled back: ${e}", ("op",name)("i",_record.item_id)("e",e.to_string()) );
            throw;
         }
      }

      void auction_state_machine_impl::transfer_item( const address& from, const address& to )
      {
         try
         {
            _registry->transfer( from, to, _record.item_id );
         }
         catch( const fc::exception& e )
         {
            FC_THROW_EXCEPTION( external_call_failed, "transfer of item ${i} from ${f} to ${t} was rejected: ${e}",
                                ("i",_record.item_id)("f",from)("t",to)("e",e.to_string()) );
         }
         catch( const std::exception& e )
         {
            FC_THROW_EXCEPTION( external_call_failed, "transfer of item ${i} from ${f} to ${t} was rejected: ${e}",
                                ("i",_record.item_id)("f",from)("t",to)("e",e.what()) );
         }
      }

      void auction_state_machine_impl::credit( const address& to, const asset& amount )
      {
         try
         {
            _ledger->credit( to, amount );
         }
         catch( const fc::exception& e )
         {
            FC_THROW_EXCEPTION( external_call_failed, "credit of ${a} to ${t} was rejected: ${e}",
                                ("a",amount)("t",to)("e",e.to_string()) );
         }
         catch( const std::exception& e )
         {
            FC_THROW_EXCEPTION( external_call_failed, "credit of ${a} to ${t} was rejected: ${e}",
                                ("a",amount)("t",to)("e",e.what()) );
         }
      }

      void auction_state_machine_impl::pull_escrow( const address& from, const asset& amount )
      {
         try
         {
            _ledger->escrow( from, _record.escrow_account, amount );
         }
         catch( const fc::exception& e )
         {
            FC_THROW_EXCEPTION( external_call_failed, "escrow of ${a} from ${f} was rejected: ${e}",
                                ("a",amount)("f",from)("e",e.to_string()) );
         }
         catch( const std::exception& e )
         {
            FC_THROW_EXCEPTION( external_call_failed, "escrow of ${a} from ${f} was rejected: ${e}",
                                ("a",amount)("f",from)("e",e.what()) );
         }
      }

      void auction_state_machine_impl::queue_event( auction_event_type type, const address& account, const asset& amount )
      {
         _pending_events.push_back( auction_event( type, account, amount, now() ) );
      }

      void auction_state_machine_impl::deliver_events( const vector<auction_event>& events )
      {
         for( const auto& event : events )
         {
            // the operation has already committed, a failing observer cannot undo it
            try
            {
               switch( event.type )
               {
                  case start_event:
                     _self->auction_started();
                     break;
                  case bid_event:
                     _self->bid_placed( event.account, event.amount );
                     break;
                  case withdrawal_event:
                     _self->funds_withdrawn( event.account, event.amount );
                     break;
                  case end_event:
                     _self->auction_ended( event.account, event.amount );
                     break;
               }
            }
            catch( const fc::exception& e )
            {
               elog( "auction observer failed on ${event}: ${e}", ("event",event)("e",e.to_detail_string()) );
            }
            catch( const std::exception& e )
            {
               elog( "auction observer failed on ${event}: ${e}", ("event",event)("e",e.what()) );
            }
         }
      }

      void auction_state_machine_impl::check_bid( const address& caller, const asset& amount )const
      {
         if( !_record.started )
            FC_THROW_EXCEPTION( auction_not_started, "bidding on item ${i} has not opened", ("i",_record.item_id) );
         if( _record.ended )
            FC_THROW_EXCEPTION( auction_expired, "the auction for item ${i} has been settled", ("i",_record.item_id) );

         const time_point_sec current_time = now();
         if( current_time >= *_record.end_at )
            FC_THROW_EXCEPTION( auction_expired, "bidding closed at ${end}, it is now ${now}",
                                ("end",*_record.end_at)("now",current_time) );

         if( caller.is_null() || caller == _record.escrow_account )
            FC_THROW_EXCEPTION( unauthorized, "${c} cannot bid", ("c",caller) );

         check_same_currency( amount, _record.highest_bid );
         if( amount <= _record.highest_bid )
            FC_THROW_EXCEPTION( bid_too_low, "bid of ${a} does not exceed the highest bid of ${h}",
                                ("a",amount)("h",_record.highest_bid) );
      }

   } // detail

   auction_state_machine::auction_state_machine( const asset_registry_ptr& registry,
                                                 const payment_ledger_ptr& ledger,
                                                 const address& seller,
                                                 const address& escrow_account,
                                                 item_id_type item,
                                                 const asset& starting_price )
   { try {
      if( starting_price.amount < 0 )
         FC_THROW_EXCEPTION( invalid_amount, "starting price cannot be negative" );
      my.reset( new detail::auction_state_machine_impl( this, registry, ledger,
                                                        auction_record( seller, escrow_account, item, starting_price ) ) );
      ilog( "created auction for item ${i} by ${s}, starting at ${p}", ("i",item)("s",seller)("p",starting_price) );
   } FC_CAPTURE_AND_RETHROW( (seller)(escrow_account)(item)(starting_price) ) }

   auction_state_machine::auction_state_machine( const asset_registry_ptr& registry,
                                                 const payment_ledger_ptr& ledger,
                                                 const auction_record& saved )
   { try {
      my.reset( new detail::auction_state_machine_impl( this, registry, ledger, saved ) );
   } FC_CAPTURE_AND_RETHROW( (saved) ) }

   auction_state_machine::~auction_state_machine()
   {
   }

   void auction_state_machine::start( const address& caller )
   { try {
      time_point_sec closes_at;
      const vector<auction_event> events = my->run( "start", [&]( auction_record& record )
      {
         if( caller != record.seller )
            FC_THROW_EXCEPTION( unauthorized, "only the seller ${s} may start the auction", ("s",record.seller) );
         if( record.started )
            FC_THROW_EXCEPTION( auction_already_started, "the auction for item ${i} was already started", ("i",record.item_id) );

         closes_at = time_point_sec( now().sec_since_epoch() + NFA_AUCTION_DURATION_SEC );
         record.started = true;
         record.end_at = closes_at;
         my->queue_event( start_event, caller, asset( 0, record.highest_bid.asset_id ) );

         my->transfer_item( record.seller, record.escrow_account );
      });

      ilog( "auction for item ${i} started, bidding closes at ${end}", ("i",my->_item_id)("end",closes_at) );
      my->deliver_events( events );
   } FC_CAPTURE_AND_RETHROW( (caller) ) }

   void auction_state_machine::bid( const address& caller, const asset& amount )
   { try {
      const vector<auction_event> events = my->run( "bid", [&]( auction_record& record )
      {
         my->check_bid( caller, amount );
         my->pull_escrow( caller, amount );

         if( record.has_bidder() )
            record.add_refundable_balance( record.highest_bidder, record.highest_bid );
         record.highest_bidder = caller;
         record.highest_bid = amount;
         my->queue_event( bid_event, caller, amount );
      });

      ilog( "${c} leads the auction for item ${i} with ${a}", ("c",caller)("i",my->_item_id)("a",amount) );
      my->deliver_events( events );
   } FC_CAPTURE_AND_RETHROW( (caller)(amount) ) }

   asset auction_state_machine::withdraw( const address& caller )
   { try {
      asset balance;
      const vector<auction_event> events = my->run( "withdraw", [&]( auction_record& record )
      {
         balance = record.get_refundable_balance( caller );
         record.refundable.erase( caller );
         my->queue_event( withdrawal_event, caller, balance );

         if( balance.amount > 0 )
            my->credit( caller, balance );
      });

      if( balance.amount > 0 )
         ilog( "${c} withdrew ${a} from the auction for item ${i}", ("c",caller)("a",balance)("i",my->_item_id) );
      my->deliver_events( events );
      return balance;
   } FC_CAPTURE_AND_RETHROW( (caller) ) }

   void auction_state_machine::end( const address& caller )
   { try {
      address winner;
      asset   winning_bid;
      const vector<auction_event> events = my->run( "end", [&]( auction_record& record )
      {
         if( !record.started )
            FC_THROW_EXCEPTION( auction_not_started, "the auction for item ${i} has not started", ("i",record.item_id) );
         if( record.ended )
            FC_THROW_EXCEPTION( auction_already_ended, "the auction for item ${i} has already ended", ("i",record.item_id) );

         const time_point_sec current_time = now();
         if( current_time < *record.end_at )
            FC_THROW_EXCEPTION( auction_too_early, "bidding is open until ${end}, it is now ${now}",
                                ("end",*record.end_at)("now",current_time) );

         record.ended = true;
         winner = record.highest_bidder;
         winning_bid = record.highest_bid;
         my->queue_event( end_event, winner, winning_bid );

         if( winner.is_null() )
         {
            my->transfer_item( record.escrow_account, record.seller );
         }
         else
         {
            my->transfer_item( record.escrow_account, winner );
            my->credit( record.seller, winning_bid );
         }
      });

      if( winner.is_null() )
         ilog( "auction for item ${i} ended without bids", ("i",my->_item_id) );
      else
         ilog( "auction for item ${i} won by ${w} for ${a}", ("i",my->_item_id)("w",winner)("a",winning_bid) );
      my->deliver_events( events );
   } FC_CAPTURE_AND_RETHROW( (caller) ) }

   auction_state auction_state_machine::get_state()const
   {
      boost::recursive_mutex::scoped_lock lock( my->_mutex );
      return my->_record.state();
   }

   auction_record auction_state_machine::get_record()const
   {
      boost::recursive_mutex::scoped_lock lock( my->_mutex );
      return my->_record;
   }

   address auction_state_machine::get_highest_bidder()const
   {
      boost::recursive_mutex::scoped_lock lock( my->_mutex );
      return my->_record.highest_bidder;
   }

   asset auction_state_machine::get_highest_bid()const
   {
      boost::recursive_mutex::scoped_lock lock( my->_mutex );
      return my->_record.highest_bid;
   }

   asset auction_state_machine::get_refundable_balance( const address& owner )const
   {
      boost::recursive_mutex::scoped_lock lock( my->_mutex );
      return my->_record.get_refundable_balance( owner );
   }

   optional<time_point_sec> auction_state_machine::get_end_time()const
   {
      boost::recursive_mutex::scoped_lock lock( my->_mutex );
      return my->_record.end_at;
   }

   asset auction_state_machine::get_escrowed_total()const
   {
      boost::recursive_mutex::scoped_lock lock( my->_mutex );
      return my->_record.escrowed_total();
   }

} } // nfa::auction
