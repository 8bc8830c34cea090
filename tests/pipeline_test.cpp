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

#include <atomic>

// trough counts 10, 11 and 50 at one revolution per second
static std::vector<fmill::trial_signal_t> scenario()
{
  std::vector<fmill::trial_signal_t> s;
  s.push_back( even_trial( 1 , "A" , "C1" , 11 ) );
  s.push_back( even_trial( 1 , "A" , "C2" , 12 ) );
  s.push_back( even_trial( 1 , "A" , "C3" , 51 ) );
  return s;
}

static fmill::diag_options_t options( const baseline_policy_t b , const int threads = 1 )
{
  fmill::diag_options_t opt;
  opt.thresholds = fmill::thresholds_t( 0.1 , 0.5 );
  opt.baseline = b;
  opt.threads = threads;
  return opt;
}

TEST( Pipeline , SelfBaselineFlagsNothing )
{
  fmill::pipeline_t pipeline( options( BASELINE_SELF ) );
  fmill::run_result_t r = pipeline.run( scenario() );

  ASSERT_EQ( r.aggregator.summaries.size() , 1u );
  const fmill::set_summary_t & s = r.aggregator.summaries.at( 1 );
  EXPECT_EQ( s.total , 3 );
  EXPECT_EQ( s.small_changes , 0 );
  EXPECT_EQ( s.large_changes , 0 );
  EXPECT_TRUE( s.large_cids.empty() );
  EXPECT_EQ( r.trials.size() , 3u );
  EXPECT_FALSE( r.cancelled );
}

TEST( Pipeline , SetMedianFlagsTheOutlier )
{
  fmill::pipeline_t pipeline( options( BASELINE_SET_MEDIAN ) );
  fmill::run_result_t r = pipeline.run( scenario() );

  const fmill::set_summary_t & s = r.aggregator.summaries.at( 1 );
  EXPECT_EQ( s.total , 3 );

  // trough-count statistic
  EXPECT_EQ( s.by_metric.at( TROUGHS ).small , 0 );
  EXPECT_EQ( s.by_metric.at( TROUGHS ).large , 1 );
  EXPECT_EQ( s.large_cids , std::set<std::string>( { "C3" } ) );

  ASSERT_EQ( r.trials.size() , 3u );
  EXPECT_NEAR( r.trials[0].changes.deviation.at( TROUGHS ) , 1.0 / 11.0 , 1e-9 );
  EXPECT_EQ( r.trials[0].changes.level.at( TROUGHS ) , NO_CHANGE );
  EXPECT_NEAR( r.trials[2].changes.deviation.at( TROUGHS ) , 39.0 / 11.0 , 1e-9 );
}

TEST( Pipeline , TroughStatisticOnly )
{
  fmill::diag_options_t opt = options( BASELINE_SET_MEDIAN );
  opt.metrics = { TROUGHS };

  fmill::pipeline_t pipeline( opt );
  fmill::run_result_t r = pipeline.run( scenario() );

  const fmill::set_summary_t & s = r.aggregator.summaries.at( 1 );
  EXPECT_EQ( s.total , 3 );
  EXPECT_EQ( s.small_changes , 0 );
  EXPECT_EQ( s.large_changes , 1 );
  EXPECT_EQ( s.by_metric.size() , 1u );
}

TEST( Pipeline , InvalidTrialIsExcluded )
{
  std::vector<fmill::trial_signal_t> s = scenario();
  fmill::trial_signal_t bad = even_trial( 1 , "A" , "C4" , 3 );
  bad.events = { 0.0 , 0.5 , 0.3 };
  s.push_back( bad );

  fmill::pipeline_t pipeline( options( BASELINE_SELF ) );
  fmill::run_result_t r = pipeline.run( s );

  ASSERT_EQ( r.invalid.size() , 1u );
  EXPECT_EQ( r.invalid[0].id.chamber_id , "C4" );
  EXPECT_EQ( r.aggregator.summaries.at( 1 ).total , 3 );
  EXPECT_EQ( r.trials.size() , 3u );
}

TEST( Pipeline , TrialWithoutSetIsExcludedAlone )
{
  std::vector<fmill::trial_signal_t> s = scenario();
  s.push_back( even_trial( -1 , "A" , "C9" , 11 ) );

  fmill::pipeline_t pipeline( options( BASELINE_SELF ) );
  fmill::run_result_t r = pipeline.run( s );

  EXPECT_EQ( r.invalid.size() , 1u );
  EXPECT_TRUE( r.failed.empty() );
  EXPECT_EQ( r.aggregator.summaries.at( 1 ).total , 3 );
}

TEST( Pipeline , BlankComboAbortsItsSetOnly )
{
  std::vector<fmill::trial_signal_t> s = scenario();
  s.push_back( even_trial( 2 , "B" , "D1" , 11 ) );
  s.push_back( even_trial( 2 , "" , "D2" , 11 ) );

  fmill::pipeline_t pipeline( options( BASELINE_SELF ) );
  fmill::run_result_t r = pipeline.run( s );

  ASSERT_EQ( r.failed.size() , 1u );
  EXPECT_EQ( r.failed[0].set_id , 2 );
  EXPECT_EQ( r.aggregator.summaries.count( 2 ) , 0u );
  EXPECT_EQ( r.aggregator.combos.count( fmill::combo_key_t( 2 , "B" ) ) , 0u );
  EXPECT_EQ( r.aggregator.summaries.at( 1 ).total , 3 );
  EXPECT_EQ( r.trials.size() , 3u );
}

TEST( Pipeline , DuplicateTrialAbortsItsSet )
{
  std::vector<fmill::trial_signal_t> s = scenario();
  s.push_back( even_trial( 1 , "A" , "C1" , 20 ) );

  fmill::pipeline_t pipeline( options( BASELINE_SELF ) );
  fmill::run_result_t r = pipeline.run( s );

  ASSERT_EQ( r.failed.size() , 1u );
  EXPECT_TRUE( r.aggregator.empty() );
}

TEST( Pipeline , MissingBaselineAbortsItsSetOnly )
{
  std::vector<fmill::trial_signal_t> s = scenario();
  s.push_back( even_trial( 2 , "B" , "D1" , 11 ) );

  fmill::pipeline_t pipeline( options( BASELINE_SET_MEDIAN ) );
  fmill::run_result_t r = pipeline.run( s );

  ASSERT_EQ( r.failed.size() , 1u );
  EXPECT_EQ( r.failed[0].set_id , 2 );
  EXPECT_NE( r.failed[0].msg.find( "missing baseline" ) , std::string::npos );
  EXPECT_EQ( r.aggregator.summaries.size() , 1u );
  EXPECT_EQ( r.aggregator.summaries.at( 1 ).total , 3 );
}

TEST( Pipeline , ThreadCountDoesNotChangeResults )
{
  std::vector<fmill::trial_signal_t> s;
  for (int set=1; set<=4; set++)
    for (int c=0; c<6; c++)
      s.push_back( even_trial( set , c % 2 ? "A" : "B" , "C" + Helper::int2str( c ) , 10 + set * 3 + c * 7 ) );

  fmill::pipeline_t serial( options( BASELINE_SET_MEDIAN , 1 ) );
  fmill::pipeline_t parallel( options( BASELINE_SET_MEDIAN , 4 ) );

  fmill::run_result_t a = serial.run( s );
  fmill::run_result_t b = parallel.run( s );

  ASSERT_EQ( a.aggregator.summaries.size() , 4u );
  ASSERT_EQ( b.aggregator.summaries.size() , 4u );

  for (int set=1; set<=4; set++)
    {
      const fmill::set_summary_t & x = a.aggregator.summaries.at( set );
      const fmill::set_summary_t & y = b.aggregator.summaries.at( set );
      EXPECT_EQ( x.total , y.total );
      EXPECT_EQ( x.small_changes , y.small_changes );
      EXPECT_EQ( x.large_changes , y.large_changes );
      EXPECT_EQ( x.large_cids , y.large_cids );
    }

  EXPECT_EQ( a.aggregator.combos.size() , b.aggregator.combos.size() );

  ASSERT_EQ( a.trials.size() , b.trials.size() );
  for (int i=0; i<a.trials.size(); i++)
    EXPECT_EQ( a.trials[i].signal.id , b.trials[i].signal.id );
}

TEST( Pipeline , CallbackCancels )
{
  std::vector<fmill::trial_signal_t> s = scenario();
  s.push_back( even_trial( 2 , "B" , "D1" , 11 ) );
  s.push_back( even_trial( 2 , "B" , "D2" , 11 ) );

  fmill::pipeline_t pipeline( options( BASELINE_SELF , 1 ) );

  int seen = 0;
  pipeline.set_progress( [&seen]( const fmill::trial_id_t & ) { ++seen; return false; } );

  fmill::run_result_t r = pipeline.run( s );

  EXPECT_EQ( seen , 1 );
  EXPECT_TRUE( r.cancelled );
  EXPECT_TRUE( r.incomplete.count( 1 ) );
  EXPECT_TRUE( r.incomplete.count( 2 ) );
  EXPECT_TRUE( r.aggregator.empty() );
  EXPECT_TRUE( r.trials.empty() );
}

TEST( Pipeline , CancelledSetsAreNotEmitted )
{
  // the three set-1 trials come first, set 2 is never reached
  std::vector<fmill::trial_signal_t> s = scenario();
  s.push_back( even_trial( 2 , "B" , "D1" , 11 ) );

  fmill::pipeline_t pipeline( options( BASELINE_SELF , 1 ) );

  int seen = 0;
  pipeline.set_progress( [&seen]( const fmill::trial_id_t & ) { return ++seen < 3; } );

  fmill::run_result_t r = pipeline.run( s );

  EXPECT_TRUE( r.cancelled );
  EXPECT_EQ( r.incomplete , std::set<int>( { 2 } ) );
  ASSERT_EQ( r.aggregator.summaries.size() , 1u );
  EXPECT_EQ( r.aggregator.summaries.at( 1 ).total , 3 );
}

TEST( Pipeline , EmptyBatch )
{
  fmill::pipeline_t pipeline( options( BASELINE_SELF , 4 ) );
  fmill::run_result_t r = pipeline.run( std::vector<fmill::trial_signal_t>() );
  EXPECT_TRUE( r.aggregator.empty() );
  EXPECT_FALSE( r.cancelled );
}

TEST( Pipeline , WorkerErrorsReachTheCaller )
{
  std::vector<fmill::trial_signal_t> s = scenario();
  s.push_back( even_trial( 2 , "B" , "D1" , 11 ) );
  s.push_back( even_trial( 2 , "B" , "D2" , 11 ) );

  for (int threads=1; threads<=4; threads+=3)
    {
      fmill::pipeline_t pipeline( options( BASELINE_SELF , threads ) );

      pipeline.set_progress( []( const fmill::trial_id_t & id ) -> bool
			     {
			       if ( id.set_id == 2 ) throw fmill::malformed_aggregate_error( id.print() );
			       return true;
			     } );

      // any fmill::error, so a single handler in the driver suffices
      EXPECT_THROW( pipeline.run( s ) , fmill::error );
    }
}
