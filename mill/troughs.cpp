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

#include "mill/troughs.h"
#include "mill/errors.h"

#include "miscmath/miscmath.h"
#include "helper/helper.h"

double fmill::trough_record_t::value( const metric_t m ) const
{
  if ( m == TROUGHS ) return troughs;
  if ( m == SPEED ) return speed;
  return distance;
}


fmill::trough_record_t fmill::detect( const trial_signal_t & signal , const double segment )
{

  signal.validate();

  if ( ! ( segment > 0 && segment <= 1 ) )
    throw invalid_config_error( "segment must be in (0,1], not " + Helper::dbl2str( segment ) );

  trough_record_t rec;

  const std::vector<double> & t = signal.events;
  const int n = t.size();

  rec.circumference = signal.circumference();

  // a single event: nothing completed
  if ( n < 2 ) return rec;

  rec.troughs = n - 1;
  rec.elapsed = t[n-1] - t[0];
  rec.distance = rec.troughs * rec.circumference;
  rec.speed = rec.distance / rec.elapsed;
  rec.mean_interval = rec.elapsed / (double)rec.troughs;

  std::vector<double> dt = MiscMath::diff( t );
  rec.inst_speed.resize( dt.size() );
  for (int i=0; i<dt.size(); i++)
    rec.inst_speed[i] = rec.circumference / dt[i];

  //
  // first segment
  //

  const double cut = t[0] + segment * rec.elapsed + 1e-9 * ( rec.elapsed > 1 ? rec.elapsed : 1 );

  int last = 0;
  while ( last + 1 < n && t[ last + 1 ] <= cut ) ++last;

  rec.seg_troughs = last;
  rec.seg_elapsed = t[last] - t[0];

  return rec;
}
