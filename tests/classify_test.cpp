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

#include <cmath>

TEST( Classify , RelativeDeviation )
{
  EXPECT_DOUBLE_EQ( fmill::relative_deviation( 11 , 10 ) , 0.1 );
  EXPECT_DOUBLE_EQ( fmill::relative_deviation( 9 , -10 ) , 1.9 );
  EXPECT_DOUBLE_EQ( fmill::relative_deviation( 0 , 0 ) , 0 );
  EXPECT_TRUE( std::isinf( fmill::relative_deviation( 1 , 0 ) ) );
}

TEST( Classify , BandEdges )
{
  fmill::thresholds_t th( 0.1 , 0.5 );
  EXPECT_EQ( th.level( 0 ) , NO_CHANGE );
  EXPECT_EQ( th.level( 0.1 ) , NO_CHANGE );
  EXPECT_EQ( th.level( 0.10001 ) , SMALL_CHANGE );
  EXPECT_EQ( th.level( 0.5 ) , SMALL_CHANGE );
  EXPECT_EQ( th.level( 0.50001 ) , LARGE_CHANGE );
}

TEST( Classify , ThresholdsValidated )
{
  EXPECT_NO_THROW( fmill::thresholds_t( 0 , 0 ).validate() );
  EXPECT_THROW( fmill::thresholds_t( 0.6 , 0.5 ).validate() , fmill::invalid_config_error );
  EXPECT_THROW( fmill::thresholds_t( -0.1 , 0.5 ).validate() , fmill::invalid_config_error );
}

TEST( Classify , SelfBaselineConstantRate )
{
  fmill::trough_record_t r = fmill::detect( even_trial( 1 , "A" , "A1" , 51 ) );
  fmill::baseline_t b = fmill::baseline_t::self( r );

  EXPECT_NEAR( b.troughs , 50 , 1e-9 );
  EXPECT_NEAR( b.speed , r.speed , 1e-9 );
  EXPECT_NEAR( b.distance , r.distance , 1e-9 );

  fmill::change_class_t cc = fmill::classify( r , b , fmill::thresholds_t() , "A1" );
  EXPECT_EQ( cc.small_changes , 0 );
  EXPECT_EQ( cc.large_changes , 0 );
  EXPECT_TRUE( cc.large_cids.empty() );
  EXPECT_EQ( cc.level.size() , 3u );
}

TEST( Classify , SelfBaselineAcceleration )
{
  // 1 s spacing to t=10, then 0.5 s spacing to t=20
  fmill::trial_signal_t s = even_trial( 1 , "A" , "A1" , 11 );
  for (int i=1; i<=20; i++) s.events.push_back( 10 + i * 0.5 );

  fmill::trough_record_t r = fmill::detect( s );
  ASSERT_EQ( r.troughs , 30 );
  ASSERT_EQ( r.seg_troughs , 10 );

  fmill::change_class_t cc = fmill::classify( r , fmill::baseline_t::self( r ) , fmill::thresholds_t( 0.1 , 0.6 ) , "A1" );

  // 30 troughs against 20 expected
  EXPECT_NEAR( cc.deviation[ TROUGHS ] , 0.5 , 1e-9 );
  EXPECT_EQ( cc.level[ TROUGHS ] , SMALL_CHANGE );
  EXPECT_EQ( cc.small_changes , 3 );
  EXPECT_EQ( cc.large_changes , 0 );

  fmill::change_class_t strict = fmill::classify( r , fmill::baseline_t::self( r ) , fmill::thresholds_t( 0.1 , 0.25 ) , "A1" );
  EXPECT_EQ( strict.large_changes , 3 );
  EXPECT_EQ( strict.large_cids.size() , 1u );
  EXPECT_EQ( *strict.large_cids.begin() , "A1" );
}

TEST( Classify , ShortSegmentIsItsOwnBaseline )
{
  fmill::trial_signal_t s = even_trial( 1 , "A" , "A1" , 2 );
  s.events = { 0.0 , 10.0 };
  fmill::trough_record_t r = fmill::detect( s );
  EXPECT_EQ( r.seg_troughs , 0 );

  fmill::change_class_t cc = fmill::classify( r , fmill::baseline_t::self( r ) , fmill::thresholds_t() , "A1" );
  EXPECT_EQ( cc.small_changes + cc.large_changes , 0 );
}

TEST( Classify , SetMedian )
{
  std::vector<fmill::trough_record_t> recs;
  recs.push_back( fmill::detect( even_trial( 1 , "A" , "A1" , 11 ) ) );
  recs.push_back( fmill::detect( even_trial( 1 , "A" , "A2" , 12 ) ) );
  recs.push_back( fmill::detect( even_trial( 1 , "A" , "A3" , 51 ) ) );

  fmill::baseline_t b = fmill::baseline_t::set_median( recs );
  EXPECT_DOUBLE_EQ( b.troughs , 11 );

  fmill::change_class_t c1 = fmill::classify( recs[0] , b , fmill::thresholds_t( 0.1 , 0.5 ) , "A1" , { TROUGHS } );
  EXPECT_NEAR( c1.deviation[ TROUGHS ] , 1.0 / 11.0 , 1e-9 );
  EXPECT_EQ( c1.level[ TROUGHS ] , NO_CHANGE );

  fmill::change_class_t c3 = fmill::classify( recs[2] , b , fmill::thresholds_t( 0.1 , 0.5 ) , "A3" , { TROUGHS } );
  EXPECT_NEAR( c3.deviation[ TROUGHS ] , 39.0 / 11.0 , 1e-9 );
  EXPECT_EQ( c3.large_changes , 1 );
  EXPECT_EQ( c3.large_cids.count( "A3" ) , 1u );

  // even count: mean of the two middle values
  recs.pop_back();
  EXPECT_DOUBLE_EQ( fmill::baseline_t::set_median( recs ).troughs , 10.5 );
}

TEST( Classify , SetMedianNeedsEnoughTrials )
{
  std::vector<fmill::trough_record_t> recs;
  EXPECT_THROW( fmill::baseline_t::set_median( recs ) , fmill::missing_baseline_error );

  recs.push_back( fmill::detect( even_trial( 1 , "A" , "A1" , 11 ) ) );
  EXPECT_THROW( fmill::baseline_t::set_median( recs , 2 ) , fmill::missing_baseline_error );
  EXPECT_NO_THROW( fmill::baseline_t::set_median( recs , 1 ) );
}

TEST( Classify , MetricSubset )
{
  fmill::trough_record_t r = fmill::detect( even_trial( 1 , "A" , "A1" , 11 ) );
  fmill::baseline_t b;
  b.troughs = 100;
  b.speed = r.speed;
  b.distance = 100;

  fmill::change_class_t cc = fmill::classify( r , b , fmill::thresholds_t() , "A1" , { SPEED } );
  EXPECT_EQ( cc.level.size() , 1u );
  EXPECT_EQ( cc.large_changes , 0 );

  fmill::change_class_t all = fmill::classify( r , b , fmill::thresholds_t() , "A1" );
  EXPECT_EQ( all.large_changes , 2 );
  EXPECT_EQ( all.large_cids.size() , 1u );
}
