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

#include "fmill.h"
#include "main.h"

#include <cstring>
#include <new>

//
// global resources
//

extern globals global;

extern logger_t logger;


int main(int argc , char ** argv )
{

  //
  // initiate global defintions
  //

  std::set_new_handler(NoMem);

  global.init_defs();


  //
  // display version info?
  //

  bool show_version = argc >= 2
    && ( strcmp( argv[1] ,"-v" ) == 0
	 || strcmp( argv[1] ,"--version" ) == 0 );

  if ( show_version )
    {
      global.api();
      std::cerr << fmill_version() ;
      std::cerr << "sqlite v"
		<< SQL::library_version() << " (header " << SQL::header_version() << ")\n";
      std::exit( globals::retcode );
    }


  //
  // primary usage
  //

  std::string usage_msg = fmill_version() +
    "primary usage: fmill trials.txt [key=value] [@param-file] [-o out.db] [-t outdir]\n"
    "  trials.txt rows : set_id combo_id chamber_id file [duration]\n"
    "  options         : format=events|flags|volts arm=0.1 dev-min=0.1 dev-max=0.1 refractory=100\n"
    "                    small-band=0.1 large-band=0.5 baseline=self|set-median min-trials=2\n"
    "                    segment=0.5 metrics=trough,speed,distance bout-gap=20 threads=1 log=FILE\n"
    "  band sweep      : sweep (format=volts only) sweep-devs=0.02,0.04,0.06,0.08,0.1\n"
    "                    sweep-trough=25 sweep-speed=0.1 sweep-distance=25\n";

  if ( argc == 1 )
    {
      std::cerr << usage_msg << "\n";
      std::exit(1);
    }


  //
  // command-line options
  //

  param_t param;

  std::string trial_list , dbfile , outdir = ".";

  build_param( &param , argc , argv , &trial_list , &dbfile , &outdir );

  if ( trial_list == "" )
    Helper::halt( "no trial list given\n" + usage_msg );

  if ( param.has( "log" ) )
    logger.write_log( param.requires( "log" ) );

  logger.banner( globals::version , globals::date );

  if ( param.size() )
    logger << "input(s): " << trial_list << "\n"
	   << "options:\n" << param.dump( "  " , "\n" ) << "\n";


  //
  // configuration
  //

  fmill::load_options_t load_opt;
  fmill::diag_options_t diag_opt;
  fmill::sweep_options_t sweep_opt;

  const bool do_sweep = param.yesno( "sweep" );

  try
    {
      load_opt = fmill::load_options_t::from_param( param );
      diag_opt = fmill::diag_options_t::from_param( param );

      if ( do_sweep )
	{
	  if ( load_opt.format != FORMAT_VOLTS )
	    throw fmill::invalid_config_error( "sweep requires format=volts" );
	  sweep_opt = fmill::sweep_options_t::from_param( param );
	}
    }
  catch ( const fmill::invalid_config_error & e )
    {
      Helper::halt( e.what() );
    }


  //
  // load trials; unreadable trials are excluded, not fatal
  //

  std::vector<fmill::trial_source_t> sources = fmill::read_trial_list( trial_list );

  std::vector<fmill::trial_signal_t> signals;

  std::vector<fmill::trial_problem_t> load_problems;

  for (int i=0; i<sources.size(); i++)
    {
      try
	{
	  signals.push_back( fmill::load_trial( sources[i] , load_opt ) );
	}
      catch ( const fmill::invalid_signal_error & e )
	{
	  fmill::trial_problem_t p;
	  p.id = sources[i].id;
	  p.label = sources[i].filename;
	  p.msg = e.what();
	  load_problems.push_back( p );
	  logger.warning( "excluding " + p.label + ": " + p.msg );
	}
    }


  //
  // detect, classify and aggregate
  //

  fmill::run_result_t result;

  try
    {
      fmill::pipeline_t pipeline( diag_opt );
      result = pipeline.run( signals );
    }
  catch ( const fmill::error & e )
    {
      Helper::halt( e.what() );
    }

  result.invalid.insert( result.invalid.begin() , load_problems.begin() , load_problems.end() );


  //
  // sensitivity of voltage traces to the deviation band
  //

  fmill::sweep_batch_t swept;

  if ( do_sweep )
    {
      try
	{
	  swept = fmill::sweep_batch( sources , load_opt.arm , sweep_opt );
	}
      catch ( const fmill::error & e )
	{
	  Helper::halt( e.what() );
	}
    }


  //
  // tables
  //

  fmill::report_tables_t tables;

  try
    {
      tables = fmill::render( result.aggregator );
      tables.trials = fmill::render_trials( result.trials );
      if ( do_sweep )
	{
	  tables.sweep = fmill::render_sweep( swept.results );
	  tables.sweep_summary = fmill::render_sweep_summary( swept.results );
	}
    }
  catch ( const fmill::malformed_aggregate_error & e )
    {
      Helper::halt( e.what() );
    }

  fmill::write_tables( tables , outdir , globals::table_delimiter );

  if ( dbfile != "" )
    {
      SQL sql;
      if ( ! sql.open( dbfile ) )
	Helper::halt( "could not open database " + dbfile );
      fmill::save_tables( tables , sql );
      sql.close();
      logger << "  saved tables to " << dbfile << "\n";
    }


  //
  // problems
  //

  if ( result.invalid.size() || result.failed.size() )
    {
      logger << "\n  " << result.invalid.size() << " trial(s) excluded, "
	     << result.failed.size() << " set(s) aborted\n";

      for (int i=0; i<result.invalid.size(); i++)
	logger << "   " << result.invalid[i].label << " : " << result.invalid[i].msg << "\n";

      for (int i=0; i<result.failed.size(); i++)
	logger << "   set " << result.failed[i].set_id << " : " << result.failed[i].msg << "\n";
    }

  if ( swept.invalid.size() )
    {
      logger << "\n  " << swept.invalid.size() << " trial(s) not swept\n";
      for (int i=0; i<swept.invalid.size(); i++)
	logger << "   " << swept.invalid[i].label << " : " << swept.invalid[i].msg << "\n";
    }

  std::exit( globals::retcode );

}


//
// build parameters from the command line: first non-option argument is
// the trial list, @file includes, -o database, -t output folder
//

void build_param( param_t * param , int argc , char ** argv ,
		  std::string * trial_list , std::string * dbfile , std::string * outdir )
{

  for (int i=1; i<argc; i++)
    {
      std::string x = argv[i];

      if ( x == "" ) continue;

      if ( x == "-o" || x == "-t" )
	{
	  if ( i + 1 >= argc )
	    Helper::halt( x + " requires an argument" );
	  if ( x == "-o" ) *dbfile = Helper::expand( argv[ ++i ] );
	  else *outdir = Helper::expand( argv[ ++i ] );
	  continue;
	}

      if ( x[0] == '@' )
	{
	  if ( x.size() == 1 ) Helper::halt( "bad @include" );
	  param->include( x.substr(1) );
	  continue;
	}

      if ( x.find( "=" ) == std::string::npos && *trial_list == "" )
	{
	  *trial_list = x;
	  continue;
	}

      param->parse( x );
    }

}


//
// report fmill version
//

std::string fmill_version()
{
  std::stringstream ss;
  ss << "fmill version " << globals::version << " (release date " << globals::date << ")\n";
  ss << "fmill build date/time " << __DATE__ << " " << __TIME__ << "\n";
  return ss.str();
}


//
// "handle" out-of-memory conditions
//

void NoMem()
{
  std::cerr << "*****************************************************\n"
	    << "* FATAL ERROR    Exhausted system memory            *\n"
	    << "*                                                   *\n"
	    << "* Forced exit now...                                *\n"
	    << "*****************************************************\n\n";
  std::exit(1);
}
