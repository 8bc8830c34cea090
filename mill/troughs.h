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

#ifndef __FMILL_TROUGHS_H__
#define __FMILL_TROUGHS_H__

#include <vector>

#include "defs/defs.h"
#include "mill/trial.h"

namespace fmill {

  //
  // derived per-trial statistics (immutable once detected)
  //

  struct trough_record_t {

    trough_record_t()
      : troughs(0) , mean_interval(0) , speed(0) , distance(0) , elapsed(0) ,
	circumference(0) , seg_troughs(0) , seg_elapsed(0) { }

    // completed revolutions (events - 1)
    int troughs;

    double mean_interval;

    // distance / elapsed (m/s)
    double speed;

    // troughs * circumference (m)
    double distance;

    // last - first event (s)
    double elapsed;

    double circumference;

    // per-interval speeds (m/s)
    std::vector<double> inst_speed;

    // first segment
    int seg_troughs;
    double seg_elapsed;

    // fewer than two events
    bool degenerate() const { return troughs == 0; }

    double value( const metric_t m ) const;

  };

  // throws invalid_signal_error
  trough_record_t detect( const trial_signal_t & signal , const double segment = 0.5 );

}

#endif
