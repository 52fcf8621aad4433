#pragma once
#include <fc/crypto/ripemd160.hpp>
#include <string>

namespace fc {
   class variant;
   namespace ecc { class public_key; }
} // fc

namespace nfa { namespace auction {

   /**
    *  @brief identifies a seller, a bidder or the escrow account of an auction
    *
    *  The identifier is ripemd160( sha256( compressed public key ) ).  Its text
    *  form is NFA_ADDRESS_PREFIX followed by base58( key_hash + check ), where
    *  check is the first 4 bytes of sha256( key_hash ).
    *
    *  The default constructed address is null.  It never belongs to an account
    *  and marks an auction that has no bidder yet.
    */
   class address
   {
      public:
         address(){}
         explicit address( const fc::ripemd160& hash ):key_hash(hash){}
         explicit address( const fc::ecc::public_key& owner_key );
         explicit address( const std::string& text ); ///< throws unless is_valid( text )

         bool                  is_null()const { return key_hash == fc::ripemd160(); }
         std::string           to_string()const;

         static bool           is_valid( const std::string& text );

         fc::ripemd160         key_hash;
   };

   inline bool operator == ( const address& a, const address& b ) { return a.key_hash == b.key_hash; }
   inline bool operator != ( const address& a, const address& b ) { return a.key_hash != b.key_hash; }
   inline bool operator <  ( const address& a, const address& b ) { return a.key_hash <  b.key_hash; }

} } // nfa::auction

namespace fc
{
   void to_variant( const nfa::auction::address& a, fc::variant& v );
   void from_variant( const fc::variant& v, nfa::auction::address& a );
}
