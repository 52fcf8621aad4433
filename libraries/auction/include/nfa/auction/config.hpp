#pragma once

#include <stdint.h>

/** @file nfa/auction/config.hpp
 *  @brief Defines global constants that determine auction behavior
 */
/**
 *  The address prepended to string representation of
 *  addresses.
 */
#define NFA_ADDRESS_PREFIX                                  "NFA"

/**
 *  Length of the bidding window opened by start().  The window is
 *  fixed; auctions are never extended.
 */
#define NFA_AUCTION_DURATION_SEC                            uint32_t(60*60*24*7) // 7 days

/** Asset id of the currency used when a starting price does not name one. */
#define NFA_DEFAULT_CURRENCY_ID                             0

#define NFA_REPLAY_DEFAULT_START_TIME                       "20200101T000000"
#define NFA_REPLAY_CONFIG_FILENAME                          "config.json"
