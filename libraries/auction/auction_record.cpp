#include <nfa/auction/auction_record.hpp>
#include <nfa/auction/exceptions.hpp>

#include <fc/reflect/variant.hpp>

namespace nfa { namespace auction {

    auction_record::auction_record( const address& seller_arg, const address& escrow_account_arg,
                                    item_id_type item, const asset& starting_price )
    :item_id(item),seller(seller_arg),escrow_account(escrow_account_arg),highest_bid(starting_price)
    {
    }

    auction_state auction_record::state()const
    {
        if( ended ) return auction_state::ended;
        if( started ) return auction_state::active;
        return auction_state::created;
    }

    asset auction_record::get_refundable_balance( const address& owner )const
    {
        const auto itr = refundable.find( owner );
        if( itr == refundable.end() )
            return asset( 0, highest_bid.asset_id );
        return itr->second;
    }

    void auction_record::add_refundable_balance( const address& owner, const asset& amount )
    { try {
        if( amount.amount <= 0 )
            FC_THROW_EXCEPTION( invalid_amount, "refunds must be positive" );
        asset balance = get_refundable_balance( owner );
        balance += amount;
        refundable[ owner ] = balance;
    } FC_CAPTURE_AND_RETHROW( (owner)(amount) ) }

    asset auction_record::escrowed_total()const
    {
        asset total( 0, highest_bid.asset_id );
        for( const auto& item : refundable )
            total += item.second;
        if( has_bidder() && !ended )
            total += highest_bid;
        return total;
    }

    void auction_record::sanity_check()const
    { try {
        if( seller.is_null() || escrow_account.is_null() )
            FC_THROW_EXCEPTION( invalid_auction_record, "seller and escrow account must be set" );
        if( seller == escrow_account )
            FC_THROW_EXCEPTION( invalid_auction_record, "seller cannot be the escrow account" );
        if( end_at.valid() != started )
            FC_THROW_EXCEPTION( invalid_auction_record, "end time must be set exactly when the auction is started" );
        if( ended && !started )
            FC_THROW_EXCEPTION( invalid_auction_record, "an auction cannot end before it starts" );
        if( highest_bid.amount < 0 )
            FC_THROW_EXCEPTION( invalid_auction_record, "negative highest bid" );
        if( !started && ( has_bidder() || !refundable.empty() ) )
            FC_THROW_EXCEPTION( invalid_auction_record, "bids recorded before the auction started" );

        for( const auto& item : refundable )
        {
            if( item.first.is_null() )
                FC_THROW_EXCEPTION( invalid_auction_record, "refundable balance held by the null address" );
            if( item.second.amount <= 0 )
                FC_THROW_EXCEPTION( invalid_auction_record, "refundable balances must be positive" );
            check_same_currency( item.second, highest_bid );
        }
    } FC_CAPTURE_AND_RETHROW( (*this) ) }

}} // nfa::auction
