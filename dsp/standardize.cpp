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

#include "dsp/standardize.h"

#include "miscmath/miscmath.h"
#include "helper/helper.h"
#include "mill/errors.h"

std::vector<int> dsptools::trough_flags( const std::vector<double> & volts ,
					 const double dev_min ,
					 const double dev_max ,
					 const int refractory )
{

  const int n = volts.size();

  if ( n == 0 )
    throw fmill::invalid_signal_error( "empty voltage trace" );

  //
  // deviation band around the channel mean
  //

  std::vector<double> v( n );
  for (int i=0; i<n; i++)
    v[i] = MiscMath::round( volts[i] , 2 );

  const double channel_mean = MiscMath::mean( v );

  const double lo = MiscMath::round( channel_mean - dev_min , 2 );
  const double hi = MiscMath::round( channel_mean + dev_max , 2 );

  if ( ! ( hi > lo ) )
    throw fmill::invalid_signal_error( "degenerate deviation band ("
				       + Helper::dbl2str( lo ) + " to " + Helper::dbl2str( hi ) + ")" );

  std::vector<int> low( n , 0 );
  for (int i=0; i<n; i++)
    if ( ( v[i] - lo ) / ( hi - lo ) < -2 ) low[i] = 1;

  //
  // compress each run of low samples to a single trough
  //

  std::vector<int> troughs( n , 0 );

  for (int j=0; j<n-1; j++)
    {

      const int prior = j > 0 ? low[j-1] : 0 ;

      if ( ! ( low[j] > prior && low[j] >= low[j+1] ) ) continue;

      const bool double_trough =
	( j >= 3 && low[j-3] >= low[j] ) ||
	( j >= 5 && low[j-5] >= low[j] ) ||
	( j >= 7 && low[j-7] >= low[j] ) ;

      if ( double_trough )
	{
	  const int stop = j + refractory < n ? j + refractory : n ;
	  for (int i=j; i<stop; i++) low[i] = 0;
	}
      else
	troughs[j] = 1;

    }

  return troughs;

}


std::vector<double> dsptools::trough_times( const std::vector<double> & times ,
					    const std::vector<double> & volts ,
					    const double dev_min ,
					    const double dev_max ,
					    const int refractory )
{

  if ( times.size() != volts.size() )
    throw fmill::invalid_signal_error( "time and voltage columns differ in length" );

  std::vector<int> flags = trough_flags( volts , dev_min , dev_max , refractory );

  std::vector<double> t;
  for (int i=0; i<flags.size(); i++)
    if ( flags[i] ) t.push_back( times[i] );

  return t;
}


std::vector<std::vector<double> > dsptools::trough_sweep( const std::vector<double> & times ,
							  const std::vector<double> & volts ,
							  const std::vector<double> & devs ,
							  const int refractory )
{
  const int nd = devs.size();

  std::vector<std::vector<double> > grid;

  for (int i=0; i<nd; i++)
    for (int j=0; j<nd; j++)
      grid.push_back( trough_times( times , volts , devs[i] , devs[j] , refractory ) );

  return grid;
}
