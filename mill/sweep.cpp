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


#include "mill/sweep.h"
#include "mill/errors.h"
#include "mill/troughs.h"

#include "dsp/standardize.h"
#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "param.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>

extern logger_t logger;


fmill::sweep_options_t::sweep_options_t()
{
  devs = { 0.02 , 0.04 , 0.06 , 0.08 , 0.10 };
  large_spread[ TROUGHS ] = 25;
  large_spread[ SPEED ] = 0.1;
  large_spread[ DISTANCE ] = 25;
  refractory = 100;
  threads = 1;
}

void fmill::sweep_options_t::validate() const
{
  if ( devs.size() == 0 )
    throw invalid_config_error( "sweep-devs is empty" );

  for (int i=0; i<devs.size(); i++)
    {
      if ( ! Helper::realnum( devs[i] ) || ! ( devs[i] > 0 ) )
	throw invalid_config_error( "sweep-devs values must be positive" );
      if ( i && ! ( devs[i] > devs[i-1] ) )
	throw invalid_config_error( "sweep-devs values must be distinct and ascending" );
    }

  const std::vector<metric_t> metrics = globals::all_metrics();
  for (int m=0; m<metrics.size(); m++)
    {
      std::map<metric_t,double>::const_iterator ss = large_spread.find( metrics[m] );
      if ( ss == large_spread.end() || ! Helper::realnum( ss->second ) || ! ( ss->second > 0 ) )
	throw invalid_config_error( "sweep-" + globals::metric_label( metrics[m] ) + " must be positive" );
    }

  if ( refractory < 0 )
    throw invalid_config_error( "refractory cannot be negative" );

  if ( threads < 1 )
    throw invalid_config_error( "threads must be at least 1" );
}

change_level_t fmill::sweep_options_t::level( const metric_t m , const double spread ) const
{
  std::map<metric_t,double>::const_iterator ss = large_spread.find( m );
  if ( ss != large_spread.end() && spread >= ss->second ) return LARGE_CHANGE;
  if ( spread > 0 ) return SMALL_CHANGE;
  return NO_CHANGE;
}

fmill::sweep_options_t fmill::sweep_options_t::from_param( const param_t & param )
{

  sweep_options_t opt;

  if ( param.has( "sweep-devs" ) )
    {
      opt.devs = param.dblvector( "sweep-devs" );
      std::sort( opt.devs.begin() , opt.devs.end() );
      opt.devs.erase( std::unique( opt.devs.begin() , opt.devs.end() ) , opt.devs.end() );
    }

  const std::vector<metric_t> metrics = globals::all_metrics();
  for (int m=0; m<metrics.size(); m++)
    {
      const std::string key = "sweep-" + globals::metric_label( metrics[m] );
      if ( param.has( key ) ) opt.large_spread[ metrics[m] ] = param.requires_dbl( key );
    }

  if ( param.has( "refractory" ) ) opt.refractory = param.requires_int( "refractory" );
  if ( param.has( "threads" ) ) opt.threads = param.requires_int( "threads" );

  opt.validate();

  return opt;
}


fmill::sweep_result_t fmill::sweep( const trial_source_t & source ,
				    const sample_trace_t & trace ,
				    const double arm ,
				    const sweep_options_t & options )
{

  if ( trace.size() == 0 )
    throw invalid_signal_error( source.filename + " has no samples" );

  sweep_result_t r;
  r.id = source.id;
  r.label = source.filename;
  r.devs = options.devs;

  std::vector<std::vector<double> > events = dsptools::trough_sweep( trace.times , trace.volts ,
								     options.devs , options.refractory );

  const std::vector<metric_t> metrics = globals::all_metrics();

  for (int k=0; k<events.size(); k++)
    {
      trial_signal_t s;
      s.id = source.id;
      s.label = source.filename;
      s.arm = arm;
      s.duration = source.duration > 0 ? source.duration : trace.times.back();
      s.events = events[k];

      // no troughs at this band: all statistics are zero
      trough_record_t rec;
      if ( s.events.size() != 0 )
	rec = detect( s );

      for (int m=0; m<metrics.size(); m++)
	r.grid[ metrics[m] ].push_back( rec.value( metrics[m] ) );
    }

  for (int m=0; m<metrics.size(); m++)
    {
      const std::vector<double> & g = r.grid[ metrics[m] ];
      const double spread = MiscMath::max( g ) - MiscMath::min( g );
      const change_level_t lvl = options.level( metrics[m] , spread );

      r.spread[ metrics[m] ] = spread;
      r.changes.deviation[ metrics[m] ] = spread;
      r.changes.level[ metrics[m] ] = lvl;

      if ( lvl == SMALL_CHANGE ) ++r.changes.small_changes;
      else if ( lvl == LARGE_CHANGE )
	{
	  ++r.changes.large_changes;
	  r.changes.large_cids.insert( source.id.chamber_id );
	}
    }

  return r;
}


fmill::sweep_batch_t fmill::sweep_batch( const std::vector<trial_source_t> & sources ,
					 const double arm ,
					 const sweep_options_t & options )
{

  options.validate();

  const int n = sources.size();

  logger << "  sweeping " << n << " trial(s) over " << options.devs.size() << "x"
	 << options.devs.size() << " deviation bands\n";

  std::vector<sweep_result_t> results( n );
  std::vector<std::string> msgs( n );
  std::vector<int> ok( n , 0 );

  std::atomic<int> next( 0 );
  std::atomic<bool> stop( false );
  std::mutex mtx;
  std::exception_ptr first_error;

  auto worker = [&]()
    {
      while ( ! stop )
	{
	  const int i = next++;
	  if ( i >= n ) break;

	  try
	    {
	      if ( ! sources[i].id.has_set() )
		throw unknown_grouping_error( sources[i].filename + " has no set id" );
	      results[i] = sweep( sources[i] , load_trace( sources[i].filename ) , arm , options );
	      ok[i] = 1;
	    }
	  catch ( const invalid_signal_error & e )
	    {
	      msgs[i] = e.what();
	    }
	  catch ( const unknown_grouping_error & e )
	    {
	      msgs[i] = e.what();
	    }
	  catch ( ... )
	    {
	      std::lock_guard<std::mutex> lock( mtx );
	      if ( ! first_error ) first_error = std::current_exception();
	      stop = true;
	    }
	}
    };

  const int nt = options.threads < n ? options.threads : ( n > 0 ? n : 1 );

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

  sweep_batch_t batch;

  for (int i=0; i<n; i++)
    {
      if ( ok[i] )
	{
	  batch.results.push_back( results[i] );
	  continue;
	}

      trial_problem_t p;
      p.id = sources[i].id;
      p.label = sources[i].filename;
      p.msg = msgs[i];
      batch.invalid.push_back( p );
      logger.warning( "not sweeping " + p.label + ": " + p.msg );
    }

  logger << "  swept " << batch.results.size() << " trial(s), " << batch.invalid.size() << " excluded\n";

  return batch;
}
