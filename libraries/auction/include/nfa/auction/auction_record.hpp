// The complete state of one auction, as the hosting ledger persists it

#pragma once
#include <nfa/auction/address.hpp>
#include <nfa/auction/asset.hpp>
#include <nfa/auction/types.hpp>

#include <fc/reflect/reflect.hpp>

namespace nfa { namespace auction {

    enum auction_state
    {
        created = 0,
        active  = 1,
        ended   = 2
    };

    struct auction_record
    {
        auction_record(){}
        auction_record( const address& seller, const address& escrow_account,
                        item_id_type item, const asset& starting_price );

        item_id_type                     item_id = 0;
        address                          seller;
        address                          escrow_account;

        optional<time_point_sec>         end_at;
        bool                             started = false;
        bool                             ended = false;

        address                          highest_bidder; // null until the first accepted bid
        asset                            highest_bid;

        map<address, asset>              refundable;

        auction_state                    state()const;
        bool                             has_bidder()const { return !highest_bidder.is_null(); }

        /** Absent accounts read as a zero balance in the auction's currency. */
        asset                            get_refundable_balance( const address& owner )const;
        void                             add_refundable_balance( const address& owner, const asset& amount );

        /** Sum of every refundable balance plus the leading bid until it is paid out. */
        asset                            escrowed_total()const;

        void                             sanity_check()const;
    };

}} // nfa::auction

FC_REFLECT_ENUM( nfa::auction::auction_state, (created)(active)(ended) )
FC_REFLECT( nfa::auction::auction_record,
        (item_id)
        (seller)
        (escrow_account)
        (end_at)
        (started)
        (ended)
        (highest_bidder)
        (highest_bid)
        (refundable)
        )
