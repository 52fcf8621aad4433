#pragma once
#include <nfa/auction/address.hpp>
#include <nfa/auction/asset.hpp>

namespace nfa { namespace auction {

   /**
    *  Funds held on behalf of an auction.  Every call fully succeeds or throws
    *  (insufficient_funds, transfer_rejected) without moving anything.
    */
   class payment_ledger
   {
      public:
         virtual ~payment_ledger(){}

         /** Release @p amount held by the auction's escrow account to @p to. */
         virtual void credit( const address& to, const asset& amount ) = 0;

         /**
          *  Pull @p amount from @p from into @p escrow_account.  The owner of
          *  @p from must have authorized the pull beforehand; the auction calls
          *  this while accepting a bid, before it touches its own state.
          */
         virtual void escrow( const address& from, const address& escrow_account, const asset& amount ) = 0;
   };
   typedef std::shared_ptr<payment_ledger> payment_ledger_ptr;

} } // nfa::auction
