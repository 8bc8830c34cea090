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

#ifndef __FMILL_BOUTS_H__
#define __FMILL_BOUTS_H__

#include <vector>

namespace fmill {

  struct bout_stats_t {

    bout_stats_t()
      : n(0) , flight_time(0) , longest(0) , shortest(0) , prop_flying(0) ,
	events_300(0) , events_900(0) , events_3600(0) , events_14400(0) , events_more(0) { }

    int n;

    // summed bout durations (s)
    double flight_time;

    double longest;
    double shortest;

    // flight_time / recording duration
    double prop_flying;

    // bouts by duration class: [60,300) [300,900) [900,3600) [3600,14400) >=14400
    int events_300;
    int events_900;
    int events_3600;
    int events_14400;
    int events_more;

  };

  // a gap of at least 'gap' seconds between events ends a bout
  bout_stats_t flight_bouts( const std::vector<double> & events ,
			     const double recording_duration ,
			     const double gap = 20 );

}

#endif
