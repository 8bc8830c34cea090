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

#ifndef __FMILL_STANDARDIZE_H__
#define __FMILL_STANDARDIZE_H__

#include <vector>

namespace dsptools
{

  // optical-sensor voltage trace -> 0/1 trough flags (one per sample)
  //  a sample is 'low' when (v - lo)/(hi - lo) < -2, with lo/hi the
  //  (2dp-rounded) mean minus dev_min / plus dev_max; the first sample
  //  of each low run is a trough unless another low sample sits 3, 5
  //  or 7 samples before it (double trough), in which case the next
  //  'refractory' samples are cleared

  std::vector<int> trough_flags( const std::vector<double> & volts ,
				 const double dev_min ,
				 const double dev_max ,
				 const int refractory = 100 );

  // times of the flagged troughs
  std::vector<double> trough_times( const std::vector<double> & times ,
				    const std::vector<double> & volts ,
				    const double dev_min ,
				    const double dev_max ,
				    const int refractory = 100 );

  // trough times for every (dev_min, dev_max) pair drawn from devs,
  // row-major: element i * devs.size() + j uses dev_min = devs[i], dev_max = devs[j]
  std::vector<std::vector<double> > trough_sweep( const std::vector<double> & times ,
						  const std::vector<double> & volts ,
						  const std::vector<double> & devs ,
						  const int refractory = 100 );

}

#endif
