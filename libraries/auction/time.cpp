#include <nfa/auction/time.hpp>

#include <fc/exception/exception.hpp>

#include <atomic>

namespace nfa { namespace auction {

static std::atomic<int64_t> simulated_time( 0 );
static std::atomic<int64_t> adjusted_time_sec( 0 );

fc::time_point_sec now()
{
   if( simulated_time )
       return fc::time_point() + fc::seconds( simulated_time + adjusted_time_sec );

   return fc::time_point::now() + fc::seconds( adjusted_time_sec );
}

void start_simulated_time( const fc::time_point sim_time )
{
   FC_ASSERT( sim_time.sec_since_epoch() > 0, "simulated time must be after the epoch" );
   simulated_time = sim_time.sec_since_epoch();
   adjusted_time_sec = 0;
}

void stop_simulated_time()
{
   simulated_time = 0;
   adjusted_time_sec = 0;
}

bool is_simulated_time()
{
   return simulated_time != 0;
}

void advance_time( int32_t delta_seconds )
{
   adjusted_time_sec += delta_seconds;
}

} } // nfa::auction
