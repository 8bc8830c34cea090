//    --------------------------------------------------------------------
//
//    This file is part of fmill.
//
//    fmill is free software: you can redistribute it and/or modify
//    it under the terms of the GNU General Public License as published by
//    the Free Software Foundation, either version 3 of the License, or
//    (at your option) any later version.
//
//    fmill is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU General Public License for more details.
//
//    You should have received a copy of the GNU General Public License
//    along with fmill. If not, see <http://www.gnu.org/licenses/>.
//
//    Please see LICENSE.txt for more details.
//
//    --------------------------------------------------------------------

#include "mill/bouts.h"
#include "mill/errors.h"

#include "helper/helper.h"

fmill::bout_stats_t fmill::flight_bouts( const std::vector<double> & events ,
					 const double recording_duration ,
					 const double gap )
{

  if ( ! ( gap > 0 ) )
    throw invalid_config_error( "bout-gap must be positive" );

  bout_stats_t b;

  const int n = events.size();

  if ( n < 3 ) return b;

  //
  // runs of events without a long gap; single-event runs are not bouts
  //

  std::vector<double> durations;

  int start = 0;
  for (int i=1; i<=n; i++)
    {
      if ( i == n || events[i] - events[i-1] >= gap )
	{
	  if ( i - 1 > start )
	    durations.push_back( events[i-1] - events[start] );
	  start = i;
	}
    }

  b.n = durations.size();

  if ( b.n == 0 ) return b;

  b.longest = b.shortest = durations[0];

  for (int i=0; i<durations.size(); i++)
    {
      const double d = durations[i];

      b.flight_time += d;
      if ( d > b.longest ) b.longest = d;
      if ( d < b.shortest ) b.shortest = d;

      if      ( d >= 14400 ) ++b.events_more;
      else if ( d >= 3600 )  ++b.events_14400;
      else if ( d >= 900 )   ++b.events_3600;
      else if ( d >= 300 )   ++b.events_900;
      else if ( d >= 60 )    ++b.events_300;
    }

  if ( recording_duration > 0 )
    b.prop_flying = b.flight_time / recording_duration;

  return b;
}
