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

#include "mill/classify.h"
#include "mill/errors.h"

#include "miscmath/miscmath.h"
#include "helper/helper.h"

#include <cmath>
#include <limits>

void fmill::thresholds_t::validate() const
{
  if ( ! Helper::realnum( small_band ) || ! Helper::realnum( large_band ) )
    throw invalid_config_error( "bands must be finite numbers" );

  if ( small_band < 0 )
    throw invalid_config_error( "small-band cannot be negative" );

  if ( small_band > large_band )
    throw invalid_config_error( "small-band (" + Helper::dbl2str( small_band )
				+ ") exceeds large-band (" + Helper::dbl2str( large_band ) + ")" );
}

change_level_t fmill::thresholds_t::level( const double dev ) const
{
  if ( dev > large_band ) return LARGE_CHANGE;
  if ( dev > small_band ) return SMALL_CHANGE;
  return NO_CHANGE;
}


double fmill::baseline_t::value( const metric_t m ) const
{
  if ( m == TROUGHS ) return troughs;
  if ( m == SPEED ) return speed;
  return distance;
}


fmill::baseline_t fmill::baseline_t::self( const trough_record_t & rec )
{

  baseline_t b;

  // too short a first segment to extrapolate from
  if ( rec.seg_troughs < 1 || ! ( rec.seg_elapsed > 0 ) )
    {
      b.troughs = rec.troughs;
      b.speed = rec.speed;
      b.distance = rec.distance;
      return b;
    }

  const double rate = rec.seg_troughs / rec.seg_elapsed;

  b.troughs = rate * rec.elapsed;
  b.speed = rec.seg_troughs * rec.circumference / rec.seg_elapsed;
  b.distance = b.troughs * rec.circumference;

  return b;
}


fmill::baseline_t fmill::baseline_t::set_median( const std::vector<trough_record_t> & recs , const int min_trials )
{

  const int n = recs.size();

  if ( n == 0 || n < min_trials )
    throw missing_baseline_error( "set has " + Helper::int2str( n )
				  + " trial(s), need at least " + Helper::int2str( min_trials ) );

  std::vector<double> t( n ) , s( n ) , d( n );
  for (int i=0; i<n; i++)
    {
      t[i] = recs[i].troughs;
      s[i] = recs[i].speed;
      d[i] = recs[i].distance;
    }

  baseline_t b;
  b.troughs = MiscMath::median( t );
  b.speed = MiscMath::median( s );
  b.distance = MiscMath::median( d );
  return b;
}


double fmill::relative_deviation( const double x , const double b )
{
  if ( b == 0 )
    return x == 0 ? 0 : std::numeric_limits<double>::infinity();
  return fabs( x - b ) / fabs( b );
}


fmill::change_class_t fmill::classify( const trough_record_t & rec ,
				       const baseline_t & baseline ,
				       const thresholds_t & thresholds ,
				       const std::string & chamber_id ,
				       const std::vector<metric_t> & metrics )
{

  thresholds.validate();

  change_class_t cc;

  for (int i=0; i<metrics.size(); i++)
    {
      const metric_t m = metrics[i];

      // each statistic counted once
      if ( cc.level.count( m ) ) continue;

      const double dev = relative_deviation( rec.value( m ) , baseline.value( m ) );
      const change_level_t lvl = thresholds.level( dev );

      cc.deviation[ m ] = dev;
      cc.level[ m ] = lvl;

      if ( lvl == SMALL_CHANGE )
	++cc.small_changes;
      else if ( lvl == LARGE_CHANGE )
	{
	  ++cc.large_changes;
	  cc.large_cids.insert( chamber_id );
	}
    }

  return cc;
}
