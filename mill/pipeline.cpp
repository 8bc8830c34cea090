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

#include "mill/pipeline.h"
#include "mill/errors.h"
#include "mill/troughs.h"
#include "mill/bouts.h"

#include "helper/helper.h"
#include "helper/logger.h"
#include "param.h"

#include <map>
#include <mutex>
#include <thread>
#include <exception>

extern logger_t logger;


//
// options
//

fmill::diag_options_t::diag_options_t()
{
  baseline = BASELINE_SELF;
  min_trials = 2;
  segment = 0.5;
  bout_gap = 20;
  threads = 1;
  metrics = globals::all_metrics();
}

void fmill::diag_options_t::validate() const
{
  thresholds.validate();

  if ( min_trials < 1 )
    throw invalid_config_error( "min-trials must be at least 1" );

  if ( ! ( segment > 0 && segment <= 1 ) )
    throw invalid_config_error( "segment must be in (0,1]" );

  if ( ! ( bout_gap > 0 ) )
    throw invalid_config_error( "bout-gap must be positive" );

  if ( threads < 1 )
    throw invalid_config_error( "threads must be at least 1" );

  if ( metrics.size() == 0 )
    throw invalid_config_error( "no statistics selected" );
}

fmill::diag_options_t fmill::diag_options_t::from_param( const param_t & param )
{

  diag_options_t opt;

  if ( param.has( "small-band" ) ) opt.thresholds.small_band = param.requires_dbl( "small-band" );
  if ( param.has( "large-band" ) ) opt.thresholds.large_band = param.requires_dbl( "large-band" );

  if ( param.has( "baseline" ) )
    {
      const std::string b = param.requires( "baseline" );
      if ( ! globals::baseline_lookup( b , &opt.baseline ) )
	throw invalid_config_error( "baseline should be self or set-median, not " + b );
    }

  if ( param.has( "min-trials" ) ) opt.min_trials = param.requires_int( "min-trials" );
  if ( param.has( "segment" ) ) opt.segment = param.requires_dbl( "segment" );
  if ( param.has( "bout-gap" ) ) opt.bout_gap = param.requires_dbl( "bout-gap" );
  if ( param.has( "threads" ) ) opt.threads = param.requires_int( "threads" );

  if ( param.has( "metrics" ) )
    {
      opt.metrics.clear();
      std::vector<std::string> m = param.strvector( "metrics" );
      std::set<metric_t> seen;
      for (int i=0; i<m.size(); i++)
	{
	  metric_t metric;
	  if ( ! globals::metric_lookup( m[i] , &metric ) )
	    throw invalid_config_error( "unknown statistic " + m[i] );
	  if ( seen.count( metric ) ) continue;
	  seen.insert( metric );
	  opt.metrics.push_back( metric );
	}
    }

  opt.validate();

  return opt;
}


//
// pipeline
//

fmill::pipeline_t::pipeline_t( const diag_options_t & options )
  : opt( options ) , cancelled( false )
{
  opt.validate();
}


namespace {

  // per-trial result slot, written by exactly one worker
  struct slot_t {
    slot_t() : done(false) , ok(false) { }
    bool done;
    bool ok;
    fmill::classified_trial_t trial;
    std::string msg;
  };

}


fmill::run_result_t fmill::pipeline_t::run( const std::vector<trial_signal_t> & signals )
{

  run_result_t result;

  const int n = signals.size();

  std::vector<slot_t> slots( n );

  const bool self = opt.baseline == BASELINE_SELF;

  logger << "  processing " << n << " trial(s), baseline=" << globals::baseline_label( opt.baseline )
	 << ", bands=" << opt.thresholds.small_band << "/" << opt.thresholds.large_band << "\n";

  //
  // pass 1: detect (and classify against the self baseline)
  //

  std::atomic<int> next( 0 );
  std::mutex mtx;
  std::exception_ptr first_error;

  auto worker = [&]()
    {
      while ( ! cancelled )
	{
	  const int i = next++;
	  if ( i >= n ) break;

	  slot_t & slot = slots[i];
	  slot.trial.signal = signals[i];

	  try
	    {
	      slot.trial.record = detect( slot.trial.signal , opt.segment );

	      slot.trial.bouts = flight_bouts( slot.trial.signal.events ,
					       slot.trial.signal.recording_duration() ,
					       opt.bout_gap );

	      if ( self )
		slot.trial.changes = classify( slot.trial.record ,
					       baseline_t::self( slot.trial.record ) ,
					       opt.thresholds ,
					       slot.trial.signal.id.chamber_id ,
					       opt.metrics );
	      slot.ok = true;
	    }
	  catch ( const invalid_signal_error & e )
	    {
	      slot.msg = e.what();
	    }
	  catch ( ... )
	    {
	      std::lock_guard<std::mutex> lock( mtx );
	      if ( ! first_error ) first_error = std::current_exception();
	      cancelled = true;
	    }

	  slot.done = true;

	  if ( progress )
	    {
	      std::lock_guard<std::mutex> lock( mtx );
	      try
		{
		  if ( ! progress( slot.trial.signal.id ) )
		    cancelled = true;
		}
	      catch ( ... )
		{
		  if ( ! first_error ) first_error = std::current_exception();
		  cancelled = true;
		}
	    }
	}
    };

  const int nt = opt.threads < n ? opt.threads : ( n > 0 ? n : 1 );

  if ( nt == 1 )
    worker();
  else
    {
      std::vector<std::thread> pool;
      for (int t=0; t<nt; t++)
	pool.push_back( std::thread( worker ) );
      for (int t=0; t<nt; t++)
	pool[t].join();
    }

  if ( first_error )
    std::rethrow_exception( first_error );

  //
  // exclusions and grouping
  //

  std::map<int,std::vector<int> > sets;

  for (int i=0; i<n; i++)
    {
      const trial_id_t & id = signals[i].id;

      if ( ! slots[i].done )
	{
	  result.cancelled = true;
	  if ( id.has_set() ) result.incomplete.insert( id.set_id );
	  continue;
	}

      if ( ! slots[i].ok )
	{
	  trial_problem_t p;
	  p.id = id;
	  p.label = signals[i].name();
	  p.msg = slots[i].msg;
	  result.invalid.push_back( p );
	  logger.warning( "excluding " + p.label + ": " + p.msg );
	  continue;
	}

      // no set: excluded on its own
      if ( ! id.has_set() )
	{
	  trial_problem_t p;
	  p.id = id;
	  p.label = signals[i].name();
	  p.msg = unknown_grouping_error( p.label + " has no set id" ).what();
	  result.invalid.push_back( p );
	  logger.warning( "excluding " + p.msg );
	  continue;
	}

      sets[ id.set_id ].push_back( i );
    }

  if ( cancelled ) result.cancelled = true;

  //
  // pass 2: per-set baselines, then gather
  //

  std::set<int> emitted;

  std::map<int,std::vector<int> >::const_iterator ss = sets.begin();
  while ( ss != sets.end() )
    {

      const int set_id = ss->first;
      const std::vector<int> & members = ss->second;

      if ( result.incomplete.count( set_id ) )
	{
	  logger.warning( "set " + Helper::int2str( set_id ) + " was not fully processed, skipping" );
	  ++ss;
	  continue;
	}

      try
	{

	  if ( ! self )
	    {
	      std::vector<trough_record_t> recs;
	      for (int j=0; j<members.size(); j++)
		recs.push_back( slots[ members[j] ].trial.record );

	      const baseline_t median = baseline_t::set_median( recs , opt.min_trials );

	      for (int j=0; j<members.size(); j++)
		{
		  classified_trial_t & t = slots[ members[j] ].trial;
		  t.changes = classify( t.record , median , opt.thresholds ,
					t.signal.id.chamber_id , opt.metrics );
		}
	    }

	  aggregator_t agg;
	  for (int j=0; j<members.size(); j++)
	    agg.add( slots[ members[j] ].trial );

	  result.aggregator += agg;

	  emitted.insert( set_id );

	}
      catch ( const missing_baseline_error & e )
	{
	  set_problem_t p;
	  p.set_id = set_id;
	  p.msg = e.what();
	  result.failed.push_back( p );
	  logger.warning( "set " + Helper::int2str( set_id ) + " aborted, " + p.msg );
	}
      catch ( const unknown_grouping_error & e )
	{
	  set_problem_t p;
	  p.set_id = set_id;
	  p.msg = e.what();
	  result.failed.push_back( p );
	  logger.warning( "set " + Helper::int2str( set_id ) + " aborted, " + p.msg );
	}

      ++ss;
    }

  for (int i=0; i<n; i++)
    if ( slots[i].ok && signals[i].id.has_set() && emitted.count( signals[i].id.set_id ) )
      result.trials.push_back( slots[i].trial );

  logger << "  " << result.trials.size() << " trial(s) in " << emitted.size() << " set(s) summarized, "
	 << result.invalid.size() << " excluded, "
	 << result.failed.size() << " set(s) aborted";
  if ( result.cancelled )
    logger << ", cancelled with " << result.incomplete.size() << " incomplete set(s)";
  logger << "\n";

  return result;
}
