#pragma once

#include <fc/time.hpp>

namespace nfa { namespace auction {

   /**
    *  Current time as seen by every auction in this process.  Deadlines are
    *  only ever checked against this clock, at call time.
    */
   fc::time_point_sec           now();

   void                         start_simulated_time( const fc::time_point sim_time );
   void                         stop_simulated_time();
   bool                         is_simulated_time();
   void                         advance_time( int32_t delta_seconds );

} } // nfa::auction
