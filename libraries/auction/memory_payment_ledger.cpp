#include <nfa/auction/exceptions.hpp>
#include <nfa/auction/memory_payment_ledger.hpp>

#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>

namespace nfa { namespace auction {

   memory_payment_ledger::memory_payment_ledger( const address& escrow_account, asset_id_type currency )
   :_escrow_account(escrow_account),_currency(currency)
   {
      FC_ASSERT( !_escrow_account.is_null(), "the ledger needs an escrow account" );
   }

   void memory_payment_ledger::deposit( const address& owner, const asset& amount )
   { try {
      if( amount.asset_id.value != _currency.value )
         FC_THROW_EXCEPTION( asset_type_mismatch, "this ledger only holds asset ${c}", ("c",_currency) );
      if( amount.amount <= 0 )
         FC_THROW_EXCEPTION( invalid_amount, "deposits must be positive" );
      _balances[ owner ] = get_balance( owner ) + amount;
   } FC_CAPTURE_AND_RETHROW( (owner)(amount) ) }

   void memory_payment_ledger::approve( const address& owner, const address& spender, const asset& amount )
   { try {
      if( amount.asset_id.value != _currency.value )
         FC_THROW_EXCEPTION( asset_type_mismatch, "this ledger only holds asset ${c}", ("c",_currency) );
      if( amount.amount < 0 )
         FC_THROW_EXCEPTION( invalid_amount, "allowances cannot be negative" );
      _allowances[ std::make_pair( owner, spender ) ] = amount;
   } FC_CAPTURE_AND_RETHROW( (owner)(spender)(amount) ) }

   asset memory_payment_ledger::get_balance( const address& owner )const
   {
      const auto itr = _balances.find( owner );
      if( itr == _balances.end() )
         return asset( 0, _currency );
      return itr->second;
   }

   asset memory_payment_ledger::get_allowance( const address& owner, const address& spender )const
   {
      const auto itr = _allowances.find( std::make_pair( owner, spender ) );
      if( itr == _allowances.end() )
         return asset( 0, _currency );
      return itr->second;
   }

   asset memory_payment_ledger::get_total_supply()const
   {
      asset total( 0, _currency );
      for( const auto& item : _balances )
         total += item.second;
      return total;
   }

   void memory_payment_ledger::move( const address& from, const address& to, const asset& amount )
   {
      if( amount.asset_id.value != _currency.value )
         FC_THROW_EXCEPTION( transfer_rejected, "this ledger only holds asset ${c}", ("c",_currency) );
      if( amount.amount <= 0 )
         FC_THROW_EXCEPTION( transfer_rejected, "transfers must be positive" );
      if( to.is_null() )
         FC_THROW_EXCEPTION( transfer_rejected, "cannot pay the null address" );

      const asset from_balance = get_balance( from );
      if( from_balance < amount )
         FC_THROW_EXCEPTION( insufficient_funds, "${f} holds ${b}, needs ${a}", ("f",from)("b",from_balance)("a",amount) );

      _balances[ from ] = from_balance - amount;
      _balances[ to ] = get_balance( to ) + amount;
      dlog( "${a}: ${f} -> ${t}", ("a",amount)("f",from)("t",to) );
   }

   void memory_payment_ledger::credit( const address& to, const asset& amount )
   { try {
      move( _escrow_account, to, amount );
   } FC_CAPTURE_AND_RETHROW( (to)(amount) ) }

   void memory_payment_ledger::escrow( const address& from, const address& escrow_account, const asset& amount )
   { try {
      if( escrow_account != _escrow_account )
         FC_THROW_EXCEPTION( transfer_rejected, "this ledger does not hold funds for ${e}", ("e",escrow_account) );

      const asset allowance = get_allowance( from, escrow_account );
      if( allowance.amount < amount.amount )
         FC_THROW_EXCEPTION( transfer_rejected, "${f} authorized ${l}, bid needs ${a}", ("f",from)("l",allowance)("a",amount) );

      move( from, escrow_account, amount );
      _allowances[ std::make_pair( from, escrow_account ) ] = allowance - amount;
   } FC_CAPTURE_AND_RETHROW( (from)(escrow_account)(amount) ) }

} } // nfa::auction
