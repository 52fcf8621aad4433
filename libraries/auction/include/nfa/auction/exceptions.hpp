#pragma once

#include <fc/exception/exception.hpp>

namespace nfa { namespace auction {

FC_DECLARE_EXCEPTION(         auction_exception,                                                     40000, "Auction Exception" );
FC_DECLARE_DERIVED_EXCEPTION( unauthorized,                     nfa::auction::auction_exception,     40001, "unauthorized" );
FC_DECLARE_DERIVED_EXCEPTION( bid_too_low,                      nfa::auction::auction_exception,     40002, "bid too low" );
FC_DECLARE_DERIVED_EXCEPTION( external_call_failed,             nfa::auction::auction_exception,     40003, "external call failed" );
FC_DECLARE_DERIVED_EXCEPTION( asset_type_mismatch,              nfa::auction::auction_exception,     40004, "asset type mismatch" );
FC_DECLARE_DERIVED_EXCEPTION( addition_overflow,                nfa::auction::auction_exception,     40005, "addition overflow" );
FC_DECLARE_DERIVED_EXCEPTION( subtraction_overflow,             nfa::auction::auction_exception,     40006, "subtraction overflow" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_auction_record,           nfa::auction::auction_exception,     40007, "invalid auction record" );
FC_DECLARE_DERIVED_EXCEPTION( invalid_amount,                   nfa::auction::auction_exception,     40008, "invalid amount" );

FC_DECLARE_DERIVED_EXCEPTION( invalid_state,                    nfa::auction::auction_exception,     41000, "invalid auction state" );
FC_DECLARE_DERIVED_EXCEPTION( auction_not_started,              nfa::auction::invalid_state,         41001, "auction not started" );
FC_DECLARE_DERIVED_EXCEPTION( auction_already_started,          nfa::auction::invalid_state,         41002, "auction already started" );
FC_DECLARE_DERIVED_EXCEPTION( auction_already_ended,            nfa::auction::invalid_state,         41003, "auction already ended" );
FC_DECLARE_DERIVED_EXCEPTION( auction_expired,                  nfa::auction::invalid_state,         41004, "auction expired" );
FC_DECLARE_DERIVED_EXCEPTION( auction_too_early,                nfa::auction::invalid_state,         41005, "auction has not reached its end time" );
FC_DECLARE_DERIVED_EXCEPTION( operation_in_progress,            nfa::auction::invalid_state,         41006, "auction operation already in progress" );

FC_DECLARE_EXCEPTION(         capability_exception,                                                  42000, "Capability Exception" );
FC_DECLARE_DERIVED_EXCEPTION( unauthorized_transfer,            nfa::auction::capability_exception,  42001, "unauthorized transfer" );
FC_DECLARE_DERIVED_EXCEPTION( item_not_owned,                   nfa::auction::capability_exception,  42002, "item not owned" );
FC_DECLARE_DERIVED_EXCEPTION( insufficient_funds,               nfa::auction::capability_exception,  42003, "insufficient funds" );
FC_DECLARE_DERIVED_EXCEPTION( transfer_rejected,                nfa::auction::capability_exception,  42004, "transfer rejected" );

} } // nfa::auction
