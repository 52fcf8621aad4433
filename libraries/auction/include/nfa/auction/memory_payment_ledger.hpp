#pragma once
#include <nfa/auction/payment_ledger.hpp>

namespace nfa { namespace auction {

   /**
    *  A payment_ledger kept in process memory for a single currency.
    *
    *  credit() pays out of the escrow account the ledger was created for.
    *  escrow() spends an allowance the payer granted with approve().
    */
   class memory_payment_ledger : public payment_ledger
   {
      public:
         memory_payment_ledger( const address& escrow_account, asset_id_type currency = NFA_DEFAULT_CURRENCY_ID );

         void            deposit( const address& owner, const asset& amount );
         void            approve( const address& owner, const address& spender, const asset& amount );

         asset           get_balance( const address& owner )const;
         asset           get_allowance( const address& owner, const address& spender )const;
         asset           get_total_supply()const;

         virtual void    credit( const address& to, const asset& amount ) override;
         virtual void    escrow( const address& from, const address& escrow_account, const asset& amount ) override;

      private:
         void            move( const address& from, const address& to, const asset& amount );

         address                                        _escrow_account;
         asset_id_type                                  _currency;
         map<address, asset>                            _balances;
         map<pair<address, address>, asset>            _allowances;
   };
   typedef std::shared_ptr<memory_payment_ledger> memory_payment_ledger_ptr;

} } // nfa::auction
