#include <nfa/auction/address.hpp>
#include <nfa/auction/config.hpp>

#include <fc/crypto/base58.hpp>
#include <fc/crypto/elliptic.hpp>
#include <fc/crypto/sha256.hpp>
#include <fc/exception/exception.hpp>
#include <fc/variant.hpp>

#include <string.h>
#include <vector>

namespace nfa { namespace auction {

   namespace detail
   {
      const size_t check_size = 4;

      void write_check( const fc::ripemd160& key_hash, char* out )
      {
         const fc::sha256 digest = fc::sha256::hash( key_hash.data(), key_hash.data_size() );
         memcpy( out, digest.data(), check_size );
      }

      /** Strips the prefix and base58 decodes; empty when @p text is not an address. */
      std::vector<char> decode( const std::string& text )
      {
         const std::string prefix( NFA_ADDRESS_PREFIX );
         if( text.size() <= prefix.size() || text.compare( 0, prefix.size(), prefix ) != 0 )
            return std::vector<char>();

         std::vector<char> bin;
         try
         {
            bin = fc::from_base58( text.substr( prefix.size() ) );
         }
         catch( const fc::parse_error_exception& )
         {
            return std::vector<char>();
         }
         if( bin.size() != sizeof( fc::ripemd160 ) + check_size )
            return std::vector<char>();

         fc::ripemd160 key_hash;
         memcpy( key_hash.data(), bin.data(), sizeof( fc::ripemd160 ) );
         char check[check_size];
         write_check( key_hash, check );
         if( memcmp( bin.data() + sizeof( fc::ripemd160 ), check, check_size ) != 0 )
            return std::vector<char>();
         return bin;
      }
   }

   address::address( const fc::ecc::public_key& owner_key )
   {
      const fc::ecc::public_key_data compressed = owner_key.serialize();
      const fc::sha256 digest = fc::sha256::hash( compressed.data, sizeof( compressed ) );
      key_hash = fc::ripemd160::hash( digest.data(), digest.data_size() );
   }

   address::address( const std::string& text )
   {
      const std::vector<char> bin = detail::decode( text );
      if( bin.empty() )
         FC_THROW_EXCEPTION( fc::parse_error_exception, "invalid address ${a}", ("a",text) );
      memcpy( key_hash.data(), bin.data(), sizeof( fc::ripemd160 ) );
   }

   bool address::is_valid( const std::string& text )
   {
      return !detail::decode( text ).empty();
   }

   std::string address::to_string()const
   {
      char bin[ sizeof( fc::ripemd160 ) + detail::check_size ];
      memcpy( bin, key_hash.data(), sizeof( fc::ripemd160 ) );
      detail::write_check( key_hash, bin + sizeof( fc::ripemd160 ) );
      return NFA_ADDRESS_PREFIX + fc::to_base58( bin, sizeof( bin ) );
   }

} } // nfa::auction

namespace fc
{
   void to_variant( const nfa::auction::address& a, fc::variant& v )
   {
      v = a.to_string();
   }

   void from_variant( const fc::variant& v, nfa::auction::address& a )
   {
      a = nfa::auction::address( v.as_string() );
   }
}
