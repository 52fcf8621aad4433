#include <nfa/auction/exceptions.hpp>
#include <nfa/auction/memory_asset_registry.hpp>

#include <fc/log/logger.hpp>
#include <fc/reflect/variant.hpp>

namespace nfa { namespace auction {

   memory_asset_registry::memory_asset_registry( const address& operator_account )
   :_operator(operator_account)
   {
      FC_ASSERT( !_operator.is_null(), "the registry needs an operator account" );
   }

   void memory_asset_registry::register_item( item_id_type item, const address& owner )
   {
      FC_ASSERT( _owners.find( item ) == _owners.end(), "item ${i} is already registered", ("i",item) );
      FC_ASSERT( !owner.is_null(), "items must have an owner" );
      _owners[ item ] = owner;
   }

   void memory_asset_registry::approve( const address& owner, item_id_type item )
   {
      const auto itr = _owners.find( item );
      if( itr == _owners.end() || itr->second != owner )
         FC_THROW_EXCEPTION( item_not_owned, "${o} does not own item ${i}", ("o",owner)("i",item) );
      _approved.insert( item );
   }

   optional<address> memory_asset_registry::get_owner( item_id_type item )const
   {
      const auto itr = _owners.find( item );
      if( itr == _owners.end() )
         return optional<address>();
      return itr->second;
   }

   void memory_asset_registry::transfer( const address& from, const address& to, item_id_type item )
   {
      const auto itr = _owners.find( item );
      if( itr == _owners.end() || itr->second != from )
         FC_THROW_EXCEPTION( item_not_owned, "${f} does not own item ${i}", ("f",from)("i",item) );
      if( from != _operator && _approved.count( item ) == 0 )
         FC_THROW_EXCEPTION( unauthorized_transfer, "${o} may not move item ${i} out of ${f}",
                             ("o",_operator)("i",item)("f",from) );
      if( to.is_null() )
         FC_THROW_EXCEPTION( unauthorized_transfer, "item ${i} cannot be sent to the null address", ("i",item) );

      _approved.erase( item );
      itr->second = to;
      dlog( "item ${i}: ${f} -> ${t}", ("i",item)("f",from)("t",to) );
   }

} } // nfa::auction
