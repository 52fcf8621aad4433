#pragma once

#include <nfa/auction/address.hpp>

#include <fc/io/varint.hpp>
#include <fc/optional.hpp>
#include <fc/time.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace nfa { namespace auction {

    typedef fc::signed_int              asset_id_type;
    typedef int64_t                     share_type;
    typedef uint64_t                    item_id_type;

    using std::string;
    using fc::optional;
    using std::map;
    using std::vector;
    using std::pair;
    using std::unique_ptr;
    using std::shared_ptr;
    using fc::time_point_sec;
    using fc::time_point;

} } // nfa::auction
