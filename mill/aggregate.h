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

#ifndef __FMILL_AGGREGATE_H__
#define __FMILL_AGGREGATE_H__

#include <map>
#include <set>
#include <string>
#include <vector>

#include "defs/defs.h"
#include "mill/trial.h"
#include "mill/troughs.h"
#include "mill/classify.h"
#include "mill/bouts.h"

namespace fmill {

  // one trial after detection and classification
  struct classified_trial_t {
    trial_signal_t signal;
    trough_record_t record;
    change_class_t changes;
    bout_stats_t bouts;
  };


  struct metric_tally_t {
    metric_tally_t() : small(0) , large(0) { }
    int small;
    int large;
    metric_tally_t & operator+=( const metric_tally_t & rhs )
    {
      small += rhs.small;
      large += rhs.large;
      return *this;
    }
  };


  //
  // per set
  //

  struct set_summary_t {

    set_summary_t()
      : set_id(-1) , total(0) , small_changes(0) , large_changes(0) ,
	changed_trials(0) , large_trials(0) { }

    int set_id;

    // valid trials
    int total;

    // summed over trials and statistics
    int small_changes;
    int large_changes;

    // trials with any flagged statistic / with a large one
    int changed_trials;
    int large_trials;

    std::set<std::string> large_cids;

    std::map<metric_t,metric_tally_t> by_metric;

    // trials without any flagged statistic
    int no_change() const { return total - changed_trials; }

    double large_prop() const { return total == 0 ? 0 : large_trials / (double)total; }

    // per statistic
    int no_change( const metric_t m ) const;

    double large_prop( const metric_t m ) const;

    // throws malformed_aggregate_error if set ids differ
    set_summary_t & operator+=( const set_summary_t & rhs );

  };


  //
  // per (set, combo): series keyed by chamber
  //

  typedef std::pair<int,std::string> combo_key_t;

  struct combo_record_t {

    combo_record_t() : set_id(-1) { }

    int set_id;
    std::string combo_id;

    std::map<std::string,double> troughs;
    std::map<std::string,double> speed;
    std::map<std::string,double> distance;

    // source labels
    std::set<std::string> labels;

    const std::map<std::string,double> & series( const metric_t m ) const;

    int size() const { return troughs.size(); }

    // throws unknown_grouping_error if a chamber appears twice
    combo_record_t & operator+=( const combo_record_t & rhs );

  };


  //
  // accumulates classified trials; order of addition is irrelevant
  //

  struct aggregator_t {

    // throws unknown_grouping_error (no set id, blank combo, duplicate chamber)
    void add( const classified_trial_t & trial );

    // throws unknown_grouping_error (duplicate chamber) or malformed_aggregate_error
    // (mismatched set ids); *this is unchanged on a throw
    aggregator_t & operator+=( const aggregator_t & rhs );

    // remove a set (e.g. aborted part-way)
    void drop( const int set_id );

    bool empty() const { return summaries.size() == 0; }

    std::map<int,set_summary_t> summaries;

    std::map<combo_key_t,combo_record_t> combos;

  };

  aggregator_t aggregate( const std::vector<classified_trial_t> & trials );

}

#endif
