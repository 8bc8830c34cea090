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

#ifndef __FMILL_TEST_SYNTHETIC_H__
#define __FMILL_TEST_SYNTHETIC_H__

#include "fmill.h"

#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <vector>

// constant-rate trial: n events, one every dt seconds from t=0
inline fmill::trial_signal_t even_trial( const int set_id ,
					 const std::string & combo ,
					 const std::string & chamber ,
					 const int n ,
					 const double dt = 1.0 )
{
  fmill::trial_signal_t s;
  s.id = fmill::trial_id_t( set_id , combo , chamber );
  for (int i=0; i<n; i++) s.events.push_back( i * dt );
  s.label = chamber + ".txt";
  return s;
}

inline fmill::classified_trial_t classified( const fmill::trial_signal_t & s ,
					     const fmill::thresholds_t & th = fmill::thresholds_t() )
{
  fmill::classified_trial_t t;
  t.signal = s;
  t.record = fmill::detect( s );
  t.changes = fmill::classify( t.record , fmill::baseline_t::self( t.record ) , th , s.id.chamber_id );
  t.bouts = fmill::flight_bouts( s.events , s.recording_duration() );
  return t;
}

inline std::string temp_file( const std::string & name , const std::string & content )
{
  const std::string f = ::testing::TempDir() + name;
  std::ofstream O1( f.c_str() , std::ios::out );
  O1 << content;
  O1.close();
  return f;
}

#endif
