#pragma once

#include <nfa/auction/config.hpp>
#include <nfa/auction/types.hpp>

#include <tuple>

namespace nfa { namespace auction {

  /**
   *  An asset is a 64-bit amount of shares, and an
   *  asset_id specifying the currency of the shares.
   *
   *  Bids, refundable balances and payouts are all assets; the
   *  auctioned item itself is not, it lives in the asset_registry.
   */
  struct asset
  {
      asset():amount(0),asset_id(NFA_DEFAULT_CURRENCY_ID){}
      explicit asset( share_type a, asset_id_type u = NFA_DEFAULT_CURRENCY_ID )
      :amount(a),asset_id(u){}

      asset& operator += ( const asset& o );
      asset& operator -= ( const asset& o );

      operator std::string()const;

      share_type     amount;
      asset_id_type  asset_id;
  };

  /** Throws asset_type_mismatch unless both assets share a currency. */
  void check_same_currency( const asset& l, const asset& r );

  inline bool operator == ( const asset& l, const asset& r )
  {
      return std::tie( l.amount, l.asset_id.value ) == std::tie( r.amount, r.asset_id.value );
  }
  inline bool operator != ( const asset& l, const asset& r )
  {
      return !( l == r );
  }
  inline bool operator < ( const asset& l, const asset& r )
  {
      check_same_currency( l, r );
      return l.amount < r.amount;
  }
  inline bool operator > ( const asset& l, const asset& r )
  {
      check_same_currency( l, r );
      return l.amount > r.amount;
  }
  inline bool operator <= ( const asset& l, const asset& r )
  {
      return l < r || l == r;
  }
  inline bool operator >= ( const asset& l, const asset& r )
  {
      return l > r || l == r;
  }
  inline asset operator + ( const asset& l, const asset& r )
  {
      return asset( l ) += r;
  }
  inline asset operator - ( const asset& l, const asset& r )
  {
      return asset( l ) -= r;
  }

} } // nfa::auction

#include <fc/reflect/reflect.hpp>
FC_REFLECT( nfa::auction::asset, (amount)(asset_id) )
