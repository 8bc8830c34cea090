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

#include "miscmath/miscmath.h"
#include "helper/helper.h"

#include <cmath>
#include <algorithm>

double MiscMath::sum( const std::vector<double> & x )
{
  double s = 0;
  for (int i=0;i<x.size();i++) s += x[i];
  return s;
}

double MiscMath::mean( const std::vector<double> & x )
{
  const int n = x.size();
  if ( n == 0 ) return 0; // silently fail here
  return sum( x ) / (double)n;
}

std::vector<double> MiscMath::diff( const std::vector<double> & x )
{
  std::vector<double> d;
  if ( x.size() < 2 ) return d;
  d.resize( x.size() - 1 );
  for (int i=1;i<x.size();i++) d[i-1] = x[i] - x[i-1];
  return d;
}

double MiscMath::median( const std::vector<double> & x , const bool also_upper )
{

  const int n = x.size();

  const bool is_odd = n % 2;

  if ( n == 0 ) Helper::halt( "internal problem, taking median of 0 elements");
  if ( n == 1 ) return x[0];

  if ( is_odd )
    return MiscMath::kth_smallest_preserve( x , ( n - 1 ) / 2 );

  const double lower_median = MiscMath::kth_smallest_preserve( x , n / 2 - 1 );

  if ( ! also_upper ) return lower_median;

  const double upper_median = MiscMath::kth_smallest_preserve( x , n / 2 );

  return ( lower_median + upper_median ) / 2.0 ;

}

double MiscMath::max( const std::vector<double> & x )
{
  if ( x.size() == 0 ) return 0;
  return *std::max_element( x.begin() , x.end() );
}

double MiscMath::min( const std::vector<double> & x )
{
  if ( x.size() == 0 ) return 0;
  return *std::min_element( x.begin() , x.end() );
}

double MiscMath::round( const double x , const int dp )
{
  const double f = pow( 10.0 , dp );
  return std::round( x * f ) / f;
}


MiscMath::elem_type MiscMath::kth_smallest_preserve( const std::vector<MiscMath::elem_type> & a , int k )
{
  std::vector<elem_type> cpy = a;
  return kth_smallest_destroy( &(cpy[0]), cpy.size(), k );
}

MiscMath::elem_type MiscMath::kth_smallest_destroy(MiscMath::elem_type a[], int n, int k)
{
  int i,j,l,m ;
  elem_type x ;

  l=0 ; m=n-1 ;
  while (l<m) {
    x=a[k] ;
    i=l ;
    j=m ;
    do {
      while (a[i]<x) i++ ;
      while (x<a[j]) j-- ;
      if (i<=j) {
	std::swap( a[i] , a[j] ) ;
	i++ ; j-- ;
      }
    } while (i<=j) ;
    if (j<k) l=i ;
    if (k<i) m=j ;
  }
  return a[k] ;
}
