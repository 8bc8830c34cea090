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

#ifndef __FMILL_PIPELINE_H__
#define __FMILL_PIPELINE_H__

#include <atomic>
#include <functional>
#include <set>
#include <string>
#include <vector>

#include "defs/defs.h"
#include "mill/trial.h"
#include "mill/classify.h"
#include "mill/aggregate.h"

struct param_t;

namespace fmill {

  struct diag_options_t {

    diag_options_t();

    thresholds_t thresholds;

    baseline_policy_t baseline;

    // smallest set for a set-median reference
    int min_trials;

    // first-segment fraction for the self baseline
    double segment;

    // bout splitting gap (s)
    double bout_gap;

    int threads;

    std::vector<metric_t> metrics;

    // throws invalid_config_error
    void validate() const;

    // small-band large-band baseline min-trials segment metrics threads bout-gap
    static diag_options_t from_param( const param_t & param );

  };


  struct trial_problem_t {
    trial_id_t id;
    std::string label;
    std::string msg;
  };

  struct set_problem_t {
    int set_id;
    std::string msg;
  };


  struct run_result_t {

    run_result_t() : cancelled( false ) { }

    aggregator_t aggregator;

    // trials of emitted sets, in input order
    std::vector<classified_trial_t> trials;

    // excluded trials
    std::vector<trial_problem_t> invalid;

    // aborted sets
    std::vector<set_problem_t> failed;

    // sets not fully processed before cancellation
    std::set<int> incomplete;

    bool cancelled;

  };


  //
  // detect -> classify -> aggregate over a batch of trials
  //

  struct pipeline_t {

    // throws invalid_config_error
    explicit pipeline_t( const diag_options_t & options );

    // errors other than invalid_signal_error (including any thrown by the
    // progress callback) stop the run and are rethrown here
    run_result_t run( const std::vector<trial_signal_t> & signals );

    // stop claiming new trials (safe from any thread)
    void cancel() { cancelled = true; }

    // called after each trial is processed; returning false cancels
    void set_progress( std::function<bool(const trial_id_t&)> f ) { progress = f; }

    const diag_options_t & options() const { return opt; }

  private:

    diag_options_t opt;

    std::atomic<bool> cancelled;

    std::function<bool(const trial_id_t&)> progress;

  };

}

#endif
