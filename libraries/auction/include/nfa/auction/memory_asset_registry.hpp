#pragma once
#include <nfa/auction/asset_registry.hpp>

#include <set>

namespace nfa { namespace auction {

   /**
    *  An asset_registry kept in process memory, acting on behalf of a single
    *  operator account (normally the escrow account of an auction).
    *
    *  The operator may move items it holds, and items whose owner approved it.
    *  Approvals are consumed by the transfer they authorize.
    */
   class memory_asset_registry : public asset_registry
   {
      public:
         explicit memory_asset_registry( const address& operator_account );

         void                register_item( item_id_type item, const address& owner );
         void                approve( const address& owner, item_id_type item );
         optional<address>   get_owner( item_id_type item )const;

         virtual void        transfer( const address& from, const address& to, item_id_type item ) override;

      private:
         address                              _operator;
         map<item_id_type, address>           _owners;
         std::set<item_id_type>               _approved;
   };
   typedef std::shared_ptr<memory_asset_registry> memory_asset_registry_ptr;

} } // nfa::auction
