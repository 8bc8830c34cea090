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

#include "tests/synthetic.h"

#include <sstream>

static std::vector<double> flat_trace( const int n , const std::vector<int> & dips )
{
  std::vector<double> v( n , 1.0 );
  for (int i=0; i<dips.size(); i++) v[ dips[i] ] = 0.0;
  return v;
}

TEST( Standardize , SingleDipsAreTroughs )
{
  std::vector<int> dips = { 50 , 250 , 450 , 650 , 850 };
  std::vector<int> flags = dsptools::trough_flags( flat_trace( 1000 , dips ) , 0.1 , 0.1 );

  ASSERT_EQ( flags.size() , 1000u );

  int cnt = 0;
  for (int i=0; i<flags.size(); i++) cnt += flags[i];
  EXPECT_EQ( cnt , 5 );

  for (int i=0; i<dips.size(); i++)
    EXPECT_EQ( flags[ dips[i] ] , 1 );
}

TEST( Standardize , RunOfLowSamplesGivesOneTrough )
{
  std::vector<double> v( 500 , 1.0 );
  v[100] = v[101] = 0.0;
  std::vector<int> flags = dsptools::trough_flags( v , 0.1 , 0.1 );
  EXPECT_EQ( flags[100] , 1 );
  EXPECT_EQ( flags[101] , 0 );
}

TEST( Standardize , DoubleTroughSuppressed )
{
  // 305 is five samples after 300; 350 falls in the cleared window
  std::vector<int> dips = { 300 , 305 , 350 , 600 };
  std::vector<int> flags = dsptools::trough_flags( flat_trace( 1000 , dips ) , 0.1 , 0.1 , 100 );

  EXPECT_EQ( flags[300] , 1 );
  EXPECT_EQ( flags[305] , 0 );
  EXPECT_EQ( flags[350] , 0 );
  EXPECT_EQ( flags[600] , 1 );
}

TEST( Standardize , TroughTimes )
{
  std::vector<double> t( 1000 );
  for (int i=0; i<1000; i++) t[i] = i * 0.01;
  std::vector<double> e = dsptools::trough_times( t , flat_trace( 1000 , { 100 , 400 } ) , 0.1 , 0.1 );
  ASSERT_EQ( e.size() , 2u );
  EXPECT_NEAR( e[0] , 1.0 , 1e-9 );
  EXPECT_NEAR( e[1] , 4.0 , 1e-9 );
}

TEST( Standardize , BadInputThrows )
{
  EXPECT_THROW( dsptools::trough_flags( std::vector<double>() , 0.1 , 0.1 ) , fmill::invalid_signal_error );
  EXPECT_THROW( dsptools::trough_flags( std::vector<double>( 10 , 1.0 ) , 0 , 0 ) , fmill::invalid_signal_error );
  EXPECT_THROW( dsptools::trough_times( std::vector<double>( 3 , 0 ) , std::vector<double>( 4 , 1.0 ) , 0.1 , 0.1 ) ,
		fmill::invalid_signal_error );
}


//
// deviation-band sweep
//

// 100 Hz, 5 V baseline with 3 V dips every second from 0.5 s; 'shallow'
// adds 4.75 V dips on each whole second, which only the narrow bands see
static fmill::sample_trace_t mill_trace( const bool shallow )
{
  fmill::sample_trace_t tr;
  for (int i=0; i<2000; i++)
    {
      tr.times.push_back( i * 0.01 );
      tr.volts.push_back( 5.0 );
    }
  for (int i=50; i<2000; i+=100) tr.volts[i] = 3.0;
  if ( shallow )
    for (int i=100; i<2000; i+=100) tr.volts[i] = 4.75;
  return tr;
}

static fmill::trial_source_t mill_source( const std::string & chamber )
{
  fmill::trial_source_t src;
  src.id = fmill::trial_id_t( 1 , "A" , chamber );
  src.filename = chamber + ".csv";
  return src;
}

TEST( Sweep , GridIsRowMajor )
{
  fmill::sample_trace_t tr = mill_trace( true );

  std::vector<double> devs = { 0.02 , 0.1 };
  std::vector<std::vector<double> > g = dsptools::trough_sweep( tr.times , tr.volts , devs );

  ASSERT_EQ( g.size() , 4u );
  EXPECT_EQ( g[0].size() , 39u );
  EXPECT_EQ( g[3].size() , 20u );

  // each cell matches a single standardization at that band
  EXPECT_EQ( g[1] , dsptools::trough_times( tr.times , tr.volts , 0.02 , 0.1 ) );
  EXPECT_EQ( g[2] , dsptools::trough_times( tr.times , tr.volts , 0.1 , 0.02 ) );
}

TEST( Sweep , CleanTraceIsStable )
{
  fmill::sweep_result_t r = fmill::sweep( mill_source( "A1" ) , mill_trace( false ) , 0.1 , fmill::sweep_options_t() );

  ASSERT_EQ( r.grid[ TROUGHS ].size() , 25u );
  for (int k=0; k<25; k++)
    EXPECT_EQ( r.grid[ TROUGHS ][k] , 19 );

  EXPECT_EQ( r.spread[ TROUGHS ] , 0 );
  EXPECT_NEAR( r.spread[ SPEED ] , 0 , 1e-12 );
  EXPECT_EQ( r.changes.small_changes , 0 );
  EXPECT_EQ( r.changes.large_changes , 0 );
  EXPECT_TRUE( r.changes.large_cids.empty() );
}

TEST( Sweep , ShallowDipsSpreadTheStatistics )
{
  fmill::sweep_result_t r = fmill::sweep( mill_source( "A2" ) , mill_trace( true ) , 0.1 , fmill::sweep_options_t() );

  // narrowest band first, widest last
  EXPECT_EQ( r.grid[ TROUGHS ].front() , 38 );
  EXPECT_EQ( r.grid[ TROUGHS ].back() , 19 );

  EXPECT_NEAR( r.spread[ TROUGHS ] , 19 , 1e-9 );
  EXPECT_NEAR( r.spread[ DISTANCE ] , 19 * 0.2 * M_PI , 1e-6 );
  EXPECT_NEAR( r.spread[ SPEED ] , 0.2 * M_PI , 1e-6 );

  EXPECT_EQ( r.changes.level[ TROUGHS ] , SMALL_CHANGE );
  EXPECT_EQ( r.changes.level[ DISTANCE ] , SMALL_CHANGE );
  EXPECT_EQ( r.changes.level[ SPEED ] , LARGE_CHANGE );
  EXPECT_EQ( r.changes.small_changes , 2 );
  EXPECT_EQ( r.changes.large_changes , 1 );
  EXPECT_EQ( r.changes.large_cids , std::set<std::string>( { "A2" } ) );

  fmill::sweep_options_t strict;
  strict.large_spread[ TROUGHS ] = 10;
  fmill::sweep_result_t s = fmill::sweep( mill_source( "A2" ) , mill_trace( true ) , 0.1 , strict );
  EXPECT_EQ( s.changes.level[ TROUGHS ] , LARGE_CHANGE );
  EXPECT_EQ( s.changes.large_changes , 2 );
}

TEST( Sweep , Options )
{
  EXPECT_NO_THROW( fmill::sweep_options_t().validate() );

  param_t param;
  param.parse( "sweep-devs=0.1,0.05,0.05" );
  param.parse( "sweep-speed=0.5" );
  fmill::sweep_options_t opt = fmill::sweep_options_t::from_param( param );
  EXPECT_EQ( opt.devs , std::vector<double>( { 0.05 , 0.1 } ) );
  EXPECT_DOUBLE_EQ( opt.large_spread[ SPEED ] , 0.5 );
  EXPECT_DOUBLE_EQ( opt.large_spread[ TROUGHS ] , 25 );

  EXPECT_EQ( opt.level( SPEED , 0 ) , NO_CHANGE );
  EXPECT_EQ( opt.level( SPEED , 0.2 ) , SMALL_CHANGE );
  EXPECT_EQ( opt.level( SPEED , 0.5 ) , LARGE_CHANGE );

  param_t zero;
  zero.parse( "sweep-devs=0,0.1" );
  EXPECT_THROW( fmill::sweep_options_t::from_param( zero ) , fmill::invalid_config_error );

  param_t band;
  band.parse( "sweep-distance=0" );
  EXPECT_THROW( fmill::sweep_options_t::from_param( band ) , fmill::invalid_config_error );

  fmill::sweep_options_t empty;
  empty.devs.clear();
  EXPECT_THROW( empty.validate() , fmill::invalid_config_error );
}

TEST( Sweep , Batch )
{
  fmill::sample_trace_t tr = mill_trace( true );

  std::stringstream ss;
  for (int i=0; i<tr.size(); i++)
    ss << tr.times[i] << "," << tr.volts[i] << "\n";

  std::vector<fmill::trial_source_t> sources;

  sources.push_back( mill_source( "A1" ) );
  sources.back().filename = temp_file( "fmill_sweep_A1.csv" , ss.str() );

  sources.push_back( mill_source( "A2" ) );
  sources.back().filename = ::testing::TempDir() + "fmill_no_such_trace.csv";

  sources.push_back( mill_source( "A3" ) );
  sources.back().id.set_id = -1;
  sources.back().filename = sources[0].filename;

  fmill::sweep_options_t opt;
  opt.threads = 2;

  fmill::sweep_batch_t b = fmill::sweep_batch( sources , 0.1 , opt );

  ASSERT_EQ( b.results.size() , 1u );
  EXPECT_EQ( b.results[0].id.chamber_id , "A1" );
  EXPECT_EQ( b.results[0].changes.large_changes , 1 );

  ASSERT_EQ( b.invalid.size() , 2u );
  EXPECT_EQ( b.invalid[0].id.chamber_id , "A2" );
  EXPECT_EQ( b.invalid[1].id.chamber_id , "A3" );
}

TEST( Sweep , EmptyTraceThrows )
{
  EXPECT_THROW( fmill::sweep( mill_source( "A1" ) , fmill::sample_trace_t() , 0.1 , fmill::sweep_options_t() ) ,
		fmill::invalid_signal_error );
}
