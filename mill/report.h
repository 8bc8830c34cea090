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

#ifndef __FMILL_REPORT_H__
#define __FMILL_REPORT_H__

#include <map>
#include <string>
#include <vector>

#include "mill/aggregate.h"
#include "mill/dtable.h"
#include "mill/sweep.h"

class SQL;

namespace fmill {

  struct report_tables_t {

    // one row per set
    dtable_t summary;

    // three rows (trough, speed, distance) per combo
    dtable_t combos;

    // one row per set and statistic
    dtable_t metrics;

    // one row per valid trial (filled by render_trials())
    dtable_t trials;

    // deviation-band sweep of voltage traces (filled by render_sweep())
    dtable_t sweep;
    dtable_t sweep_summary;

  };

  // throws malformed_aggregate_error; nothing is returned on failure
  report_tables_t render( const std::map<int,set_summary_t> & summaries ,
			  const std::map<combo_key_t,combo_record_t> & combos );

  report_tables_t render( const aggregator_t & agg );

  // combo-table column for a chamber: c_<id>
  std::string chamber_column( const std::string & chamber_id );

  dtable_t render_trials( const std::vector<classified_trial_t> & trials );

  // one row per trial and statistic: spread, level and the grid values
  // (column g_<dev-min>_<dev-max>); throws malformed_aggregate_error
  // if the trials were swept over different grids
  dtable_t render_sweep( const std::vector<sweep_result_t> & results );

  // one row per set and statistic
  dtable_t render_sweep_summary( const std::vector<sweep_result_t> & results );

  // diagnostics_{summary,combos,metrics,trials,sweep,sweep_summary}.csv
  void write_tables( const report_tables_t & tables ,
		     const std::string & folder ,
		     const char delim = ',' );

  // tables SUMMARY, COMBOS, METRICS, TRIALS, SWEEP, SWEEP_SUMMARY (replaced if present)
  void save_tables( const report_tables_t & tables , SQL & sql );

  void save_table( const dtable_t & table , const std::string & name , SQL & sql );

}

#endif
