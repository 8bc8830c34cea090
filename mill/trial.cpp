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

#include "mill/trial.h"
#include "mill/errors.h"

#include "dsp/standardize.h"
#include "helper/helper.h"
#include "helper/logger.h"
#include "param.h"

#include <fstream>
#include <cmath>

extern logger_t logger;

const double fmill::trial_signal_t::default_arm = 0.1;


bool fmill::trial_id_t::has_combo() const
{
  const std::string c = Helper::lrtrim( combo_id );
  return c != "" && c != ".";
}

std::string fmill::trial_id_t::print() const
{
  std::stringstream ss;
  ss << "set" << ( has_set() ? Helper::zero_pad( set_id , 3 ) : "?" )
     << "-" << ( has_combo() ? combo_id : "?" )
     << "-" << chamber_id;
  return ss.str();
}

bool fmill::trial_id_t::operator<( const trial_id_t & rhs ) const
{
  if ( set_id != rhs.set_id ) return set_id < rhs.set_id;
  if ( combo_id != rhs.combo_id ) return combo_id < rhs.combo_id;
  return chamber_id < rhs.chamber_id;
}


double fmill::trial_signal_t::circumference() const
{
  return 2.0 * M_PI * arm;
}

double fmill::trial_signal_t::recording_duration() const
{
  if ( duration > 0 ) return duration;
  return events.size() == 0 ? 0 : events.back();
}

std::string fmill::trial_signal_t::name() const
{
  return label != "" ? label : id.print();
}

void fmill::trial_signal_t::validate() const
{

  const int n = events.size();

  if ( n == 0 )
    throw invalid_signal_error( name() + " has no revolution events" );

  for (int i=0; i<n; i++)
    {
      if ( ! Helper::realnum( events[i] ) )
	throw invalid_signal_error( name() + " has a non-numeric timestamp at event " + Helper::int2str( i+1 ) );

      if ( i && events[i] <= events[i-1] )
	throw invalid_signal_error( name() + " timestamps are not strictly increasing at event "
				    + Helper::int2str( i+1 ) + " ("
				    + Helper::dbl2str( events[i-1] ) + " then "
				    + Helper::dbl2str( events[i] ) + ")" );
    }

  if ( duration < 0 || ( duration > 0 && duration < events.back() ) )
    throw invalid_signal_error( name() + " duration " + Helper::dbl2str( duration )
				+ " is shorter than its last event (" + Helper::dbl2str( events.back() ) + ")" );

  if ( ! ( arm > 0 ) )
    throw invalid_signal_error( name() + " requires a positive arm length" );

}


//
// loading
//

fmill::load_options_t::load_options_t()
{
  format = FORMAT_EVENTS;
  arm = trial_signal_t::default_arm;
  dev_min = 0.1;
  dev_max = 0.1;
  refractory = 100;
}


fmill::load_options_t fmill::load_options_t::from_param( const param_t & param )
{

  load_options_t opt;

  if ( param.has( "format" ) )
    {
      const std::string f = param.requires( "format" );
      if      ( Helper::iequals( f , "events" ) ) opt.format = FORMAT_EVENTS;
      else if ( Helper::iequals( f , "flags" ) ) opt.format = FORMAT_FLAGS;
      else if ( Helper::iequals( f , "volts" ) ) opt.format = FORMAT_VOLTS;
      else throw invalid_config_error( "format should be events, flags or volts, not " + f );
    }

  if ( param.has( "arm" ) ) opt.arm = param.requires_dbl( "arm" );

  if ( param.has( "dev-min" ) ) opt.dev_min = param.requires_dbl( "dev-min" );
  if ( param.has( "dev-max" ) ) opt.dev_max = param.requires_dbl( "dev-max" );
  if ( param.has( "refractory" ) ) opt.refractory = param.requires_int( "refractory" );

  if ( ! ( opt.arm > 0 ) )
    throw invalid_config_error( "arm must be positive" );

  if ( opt.dev_min < 0 || opt.dev_max < 0 )
    throw invalid_config_error( "dev-min and dev-max cannot be negative" );

  if ( opt.refractory < 0 )
    throw invalid_config_error( "refractory cannot be negative" );

  return opt;
}


std::vector<fmill::trial_source_t> fmill::read_trial_list( const std::string & filename )
{

  const std::string f = Helper::expand( filename );

  if ( ! Helper::fileExists( f ) )
    Helper::halt( "could not open trial list " + f );

  std::vector<trial_source_t> sources;

  std::ifstream IN1( f.c_str() , std::ios::in );

  int line_n = 0;

  while ( ! IN1.eof() )
    {

      std::string line;
      Helper::safe_getline( IN1 , line );
      if ( IN1.eof() && line == "" ) break;
      ++line_n;

      line = Helper::lrtrim( line );
      if ( line == "" || line[0] == '#' ) continue;

      std::vector<std::string> tok = Helper::parse( line , " \t" );

      if ( tok.size() != 4 && tok.size() != 5 )
	Helper::halt( "expecting 4 or 5 fields (set combo chamber file [duration]) on line "
		      + Helper::int2str( line_n ) + " of " + f );

      trial_source_t source;

      // unassigned ids are kept: the pipeline reports them
      int s = -1;
      if ( Helper::str2int( tok[0] , &s ) && s >= 0 )
	source.id.set_id = s;

      source.id.combo_id = tok[1] == "." ? "" : tok[1];
      source.id.chamber_id = tok[2];
      source.filename = Helper::expand( tok[3] );

      if ( tok.size() == 5 )
	{
	  if ( ! Helper::str2dbl( tok[4] , &source.duration ) || source.duration < 0 )
	    Helper::halt( "invalid duration on line " + Helper::int2str( line_n ) + " of " + f );
	}

      sources.push_back( source );
    }

  IN1.close();

  logger << "  read " << sources.size() << " trial(s) from " << f << "\n";

  return sources;
}


// comment lines start with '#'; fields split on commas, spaces or tabs
static std::vector<std::vector<double> > read_columns( const std::string & filename , const int need )
{

  if ( ! Helper::fileExists( filename ) )
    throw fmill::invalid_signal_error( "could not open " + filename );

  std::ifstream IN1( filename.c_str() , std::ios::in );

  std::vector<std::vector<double> > cols( need );

  int line_n = 0;

  while ( ! IN1.eof() )
    {

      std::string line;
      Helper::safe_getline( IN1 , line );
      if ( IN1.eof() && line == "" ) break;
      ++line_n;

      line = Helper::lrtrim( line );
      if ( line == "" || line[0] == '#' ) continue;

      std::vector<std::string> tok = Helper::parse( line , ", \t" );

      if ( tok.size() < need )
	throw fmill::invalid_signal_error( filename + " line " + Helper::int2str( line_n ) + " has too few columns" );

      for (int j=0; j<need; j++)
	{
	  double x = 0;
	  if ( ! Helper::str2dbl( tok[j] , &x ) )
	    throw fmill::invalid_signal_error( filename + " line " + Helper::int2str( line_n ) + " is not numeric" );
	  cols[j].push_back( x );
	}
    }

  IN1.close();

  return cols;
}


fmill::sample_trace_t fmill::load_trace( const std::string & filename )
{
  std::vector<std::vector<double> > cols = read_columns( filename , 2 );
  sample_trace_t trace;
  trace.times = cols[0];
  trace.volts = cols[1];
  return trace;
}


fmill::trial_signal_t fmill::load_trial( const trial_source_t & source , const load_options_t & options )
{

  trial_signal_t signal;
  signal.id = source.id;
  signal.label = source.filename;
  signal.arm = options.arm;
  signal.duration = source.duration;

  std::vector<double> times;

  if ( options.format == FORMAT_EVENTS )
    {
      signal.events = read_columns( source.filename , 1 )[0];
    }
  else if ( options.format == FORMAT_FLAGS )
    {
      std::vector<std::vector<double> > cols = read_columns( source.filename , 2 );
      times = cols[0];
      for (int i=0; i<times.size(); i++)
	if ( Helper::similar( cols[1][i] , 1.0 ) ) signal.events.push_back( times[i] );
    }
  else
    {
      sample_trace_t trace = load_trace( source.filename );
      times = trace.times;
      signal.events = dsptools::trough_times( trace.times , trace.volts ,
					      options.dev_min , options.dev_max ,
					      options.refractory );
    }

  // sampled formats: recording runs to the last sample
  if ( signal.duration == 0 && times.size() != 0 )
    signal.duration = times.back();

  return signal;
}
