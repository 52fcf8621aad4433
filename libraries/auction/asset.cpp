#include <nfa/auction/asset.hpp>
#include <nfa/auction/config.hpp>
#include <nfa/auction/exceptions.hpp>

#include <fc/reflect/variant.hpp>
#include <fc/string.hpp>

#include <stdint.h>

namespace nfa { namespace auction {

  void check_same_currency( const asset& l, const asset& r )
  {
     if( l.asset_id.value != r.asset_id.value )
        FC_THROW_EXCEPTION( asset_type_mismatch, "cannot compare ${l} with ${r}", ("l",l)("r",r) );
  }

  asset::operator std::string()const
  {
     return fc::to_string(amount);
  }

  asset& asset::operator += ( const asset& o )
  { try {
     check_same_currency( *this, o );

     if (((o.amount > 0) && (amount > (INT64_MAX - o.amount))) ||
         ((o.amount < 0) && (amount < (INT64_MIN - o.amount))))
     {
       FC_THROW_EXCEPTION( addition_overflow, "asset addition overflow  ${a} + ${b}",
                            ("a", *this)("b",o) );
     }

     amount += o.amount;
     return *this;
  } FC_CAPTURE_AND_RETHROW( (*this)(o) ) }

  asset& asset::operator -= ( const asset& o )
  { try {
     check_same_currency( *this, o );

     if ((o.amount > 0 && amount < INT64_MIN + o.amount) ||
         (o.amount < 0 && amount > INT64_MAX + o.amount))
     {
        FC_THROW_EXCEPTION( subtraction_overflow, "asset subtraction underflow  ${a} - ${b}",
                            ("a", *this)("b",o) );
     }

     amount -= o.amount;
     return *this;
  } FC_CAPTURE_AND_RETHROW( (*this)(o) ) }

} } // nfa::auction
