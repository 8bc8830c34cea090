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

TEST( Param , ParseAndAccess )
{
  param_t p;
  p.parse( "small-band=0.2" );
  p.parse( "threads=4" );
  p.parse( "verbose" );
  p.parse( "expr=a=b" );

  EXPECT_TRUE( p.has( "small-band" ) );
  EXPECT_DOUBLE_EQ( p.requires_dbl( "small-band" ) , 0.2 );
  EXPECT_EQ( p.requires_int( "threads" ) , 4 );
  EXPECT_TRUE( p.empty( "verbose" ) );
  EXPECT_TRUE( p.yesno( "verbose" ) );
  EXPECT_FALSE( p.yesno( "quiet" ) );
  EXPECT_EQ( p.value( "expr" ) , "a=b" );
  EXPECT_EQ( p.value( "nothing" ) , "" );
  EXPECT_EQ( p.size() , 4 );
}

TEST( Param , AppendAndDuplicates )
{
  param_t p;
  p.parse( "metrics=trough" );
  p.parse( "metrics+=speed" );
  EXPECT_EQ( p.strvector( "metrics" ) , std::vector<std::string>( { "trough" , "speed" } ) );

  EXPECT_THROW( p.parse( "metrics=distance" ) , std::runtime_error );
}

TEST( Param , MissingValuesHalt )
{
  param_t p;
  p.parse( "threads=many" );
  EXPECT_THROW( p.requires( "absent" ) , std::runtime_error );
  EXPECT_THROW( p.requires_int( "threads" ) , std::runtime_error );
}

TEST( Param , IncludeFile )
{
  const std::string f = temp_file( "fmill_params.txt" ,
				   "% diagnostics settings\n"
				   "small-band=0.05 large-band=0.25\n"
				   "baseline=set-median   % per-set reference\n" );
  param_t p;
  p.include( f );
  EXPECT_EQ( p.size() , 3 );
  EXPECT_EQ( p.value( "baseline" ) , "set-median" );
}

TEST( DiagOptions , Defaults )
{
  fmill::diag_options_t opt;
  EXPECT_DOUBLE_EQ( opt.thresholds.small_band , 0.1 );
  EXPECT_DOUBLE_EQ( opt.thresholds.large_band , 0.5 );
  EXPECT_EQ( opt.baseline , BASELINE_SELF );
  EXPECT_EQ( opt.min_trials , 2 );
  EXPECT_DOUBLE_EQ( opt.segment , 0.5 );
  EXPECT_DOUBLE_EQ( opt.bout_gap , 20 );
  EXPECT_EQ( opt.threads , 1 );
  EXPECT_EQ( opt.metrics.size() , 3u );
  EXPECT_NO_THROW( opt.validate() );
}

TEST( DiagOptions , FromParam )
{
  param_t p;
  p.parse( "small-band=0.05" );
  p.parse( "large-band=0.3" );
  p.parse( "baseline=set-median" );
  p.parse( "min-trials=3" );
  p.parse( "segment=0.25" );
  p.parse( "metrics=troughs,distance,troughs" );
  p.parse( "threads=2" );
  p.parse( "bout-gap=10" );

  fmill::diag_options_t opt = fmill::diag_options_t::from_param( p );
  EXPECT_DOUBLE_EQ( opt.thresholds.small_band , 0.05 );
  EXPECT_DOUBLE_EQ( opt.thresholds.large_band , 0.3 );
  EXPECT_EQ( opt.baseline , BASELINE_SET_MEDIAN );
  EXPECT_EQ( opt.min_trials , 3 );
  EXPECT_DOUBLE_EQ( opt.segment , 0.25 );
  EXPECT_EQ( opt.threads , 2 );
  EXPECT_DOUBLE_EQ( opt.bout_gap , 10 );
  ASSERT_EQ( opt.metrics.size() , 2u );
  EXPECT_EQ( opt.metrics[0] , TROUGHS );
  EXPECT_EQ( opt.metrics[1] , DISTANCE );
}

TEST( DiagOptions , InvalidConfigurations )
{
  param_t bands;
  bands.parse( "small-band=0.6" );
  bands.parse( "large-band=0.5" );
  EXPECT_THROW( fmill::diag_options_t::from_param( bands ) , fmill::invalid_config_error );

  param_t baseline;
  baseline.parse( "baseline=mode" );
  EXPECT_THROW( fmill::diag_options_t::from_param( baseline ) , fmill::invalid_config_error );

  param_t metrics;
  metrics.parse( "metrics=trough,altitude" );
  EXPECT_THROW( fmill::diag_options_t::from_param( metrics ) , fmill::invalid_config_error );

  param_t threads;
  threads.parse( "threads=0" );
  EXPECT_THROW( fmill::diag_options_t::from_param( threads ) , fmill::invalid_config_error );

  param_t segment;
  segment.parse( "segment=1.5" );
  EXPECT_THROW( fmill::diag_options_t::from_param( segment ) , fmill::invalid_config_error );

  fmill::diag_options_t opt;
  opt.thresholds.small_band = -1;
  EXPECT_THROW( fmill::pipeline_t pipeline( opt ) , fmill::invalid_config_error );
}
