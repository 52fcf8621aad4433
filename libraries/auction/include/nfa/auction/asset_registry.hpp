#pragma once
#include <nfa/auction/address.hpp>
#include <nfa/auction/types.hpp>

namespace nfa { namespace auction {

   /**
    *  Custody of the unique items that can be auctioned.
    *
    *  transfer() either moves the item or throws; implementations report
    *  unauthorized_transfer when the caller may not move the item and
    *  item_not_owned when @p from does not hold it.
    */
   class asset_registry
   {
      public:
         virtual ~asset_registry(){}

         virtual void transfer( const address& from, const address& to, item_id_type item ) = 0;
   };
   typedef std::shared_ptr<asset_registry> asset_registry_ptr;

} } // nfa::auction
