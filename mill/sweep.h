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


#ifndef __FMILL_SWEEP_H__
#define __FMILL_SWEEP_H__

#include <map>
#include <string>
#include <vector>

#include "defs/defs.h"
#include "mill/trial.h"
#include "mill/classify.h"
#include "mill/pipeline.h"

struct param_t;

namespace fmill {

  //
  // sensitivity of voltage-trace trials to the standardization band
  //

  struct sweep_options_t {

    sweep_options_t();

    // candidate dev-min and dev-max values (V), ascending
    std::vector<double> devs;

    // spread (max - min over the grid) at or above which a statistic
    // is a large change; any smaller non-zero spread is a small change
    std::map<metric_t,double> large_spread;

    int refractory;

    int threads;

    // throws invalid_config_error
    void validate() const;

    change_level_t level( const metric_t m , const double spread ) const;

    // sweep-devs sweep-trough sweep-speed sweep-distance refractory threads
    static sweep_options_t from_param( const param_t & param );

  };


  struct sweep_result_t {

    trial_id_t id;

    std::string label;

    std::vector<double> devs;

    // per statistic, element i * devs.size() + j for (devs[i], devs[j])
    std::map<metric_t,std::vector<double> > grid;

    std::map<metric_t,double> spread;

    // levels from the spreads; large changes record the chamber
    change_class_t changes;

  };

  // throws invalid_signal_error
  sweep_result_t sweep( const trial_source_t & source ,
			const sample_trace_t & trace ,
			const double arm ,
			const sweep_options_t & options );


  struct sweep_batch_t {
    std::vector<sweep_result_t> results;
    std::vector<trial_problem_t> invalid;
  };

  // loads and sweeps each trial; unreadable trials and trials without
  // a set id are reported in 'invalid'
  sweep_batch_t sweep_batch( const std::vector<trial_source_t> & sources ,
			     const double arm ,
			     const sweep_options_t & options );

}

#endif
