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

#ifndef __FMILL_CLASSIFY_H__
#define __FMILL_CLASSIFY_H__

#include <map>
#include <set>
#include <string>
#include <vector>

#include "defs/defs.h"
#include "mill/troughs.h"

namespace fmill {

  //
  // relative-deviation bands
  //

  struct thresholds_t {

    thresholds_t( const double small_band = 0.1 , const double large_band = 0.5 )
      : small_band( small_band ) , large_band( large_band ) { }

    double small_band;
    double large_band;

    // throws invalid_config_error unless 0 <= small <= large
    void validate() const;

    change_level_t level( const double dev ) const;

  };


  //
  // expected metric values for one trial
  //

  struct baseline_t {

    baseline_t() : troughs(0) , speed(0) , distance(0) { }

    double troughs;
    double speed;
    double distance;

    double value( const metric_t m ) const;

    // extrapolated from the record's own first segment
    static baseline_t self( const trough_record_t & rec );

    // per-metric median; throws missing_baseline_error if fewer than min_trials
    static baseline_t set_median( const std::vector<trough_record_t> & recs , const int min_trials = 2 );

  };


  struct change_class_t {

    change_class_t() : small_changes(0) , large_changes(0) { }

    int small_changes;
    int large_changes;

    std::map<metric_t,change_level_t> level;
    std::map<metric_t,double> deviation;

    // chambers contributing a large change (at most one per trial)
    std::set<std::string> large_cids;

  };

  // |x-b|/|b|; b == 0 : 0 if x == 0, else +inf
  double relative_deviation( const double x , const double b );

  change_class_t classify( const trough_record_t & rec ,
			   const baseline_t & baseline ,
			   const thresholds_t & thresholds ,
			   const std::string & chamber_id ,
			   const std::vector<metric_t> & metrics = globals::all_metrics() );

}

#endif
