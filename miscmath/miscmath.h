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

#ifndef __FMILL_MISCMATH_H__
#define __FMILL_MISCMATH_H__

#include <vector>
#include <cstddef>

namespace MiscMath
{

  // sum/mean
  double sum( const std::vector<double> & x );
  double mean( const std::vector<double> & x );

  // differences, x[i+1] - x[i]
  std::vector<double> diff( const std::vector<double> & x );

  // 'also_upper' : average the two middle elements for even n
  double median( const std::vector<double> & x , const bool also_upper = true );

  double max( const std::vector<double> & x );
  double min( const std::vector<double> & x );

  // round to 'dp' decimal places
  double round( const double x , const int dp );

  //
  // Wirth's k-th smallest selection (N. Wirth, Algorithms + data structures = programs)
  //

  typedef double elem_type ;

  elem_type kth_smallest_destroy(elem_type a[], int n, int k);

  elem_type kth_smallest_preserve( const std::vector<elem_type> & a , int k );

}

#endif
