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

#include "defs/defs.h"
#include "helper/helper.h"

std::string globals::version;
std::string globals::date;

int globals::retcode;

std::string globals::none_label = "None";
std::string globals::missing_label = "NA";

char globals::folder_delimiter = '/';
char globals::table_delimiter = ',';

void (*globals::bail_function) ( const std::string & );

void (*globals::logger_function) ( const std::string & );

bool globals::silent;
bool globals::api_mode;
bool globals::bail_on_fail;


std::vector<metric_t> globals::all_metrics()
{
  std::vector<metric_t> m;
  m.push_back( TROUGHS );
  m.push_back( SPEED );
  m.push_back( DISTANCE );
  return m;
}

std::string globals::metric_label( const metric_t m )
{
  if ( m == TROUGHS ) return "trough";
  if ( m == SPEED ) return "speed";
  return "distance";
}

bool globals::metric_lookup( const std::string & s , metric_t * m )
{
  const std::string t = Helper::lrtrim( s );
  if ( Helper::iequals( t , "trough" ) || Helper::iequals( t , "troughs" ) ) { *m = TROUGHS; return true; }
  if ( Helper::iequals( t , "speed" ) ) { *m = SPEED; return true; }
  if ( Helper::iequals( t , "distance" ) || Helper::iequals( t , "dist" ) ) { *m = DISTANCE; return true; }
  return false;
}

std::string globals::baseline_label( const baseline_policy_t b )
{
  return b == BASELINE_SELF ? "self" : "set-median" ;
}

bool globals::baseline_lookup( const std::string & s , baseline_policy_t * b )
{
  const std::string t = Helper::lrtrim( s );
  if ( Helper::iequals( t , "self" ) ) { *b = BASELINE_SELF; return true; }
  if ( Helper::iequals( t , "set-median" ) || Helper::iequals( t , "median" ) ) { *b = BASELINE_SET_MEDIAN; return true; }
  return false;
}


void globals::api()
{
  silent = true;
  api_mode = true;
}


void globals::init_defs()
{

  //
  // Version
  //

  version = "v0.3.1";

  date    = "19-Oct-2026";

  //
  // Return code
  //

  retcode = 0;

  //
  // Optional bail function after halt() is called
  //

  bail_function = NULL;

  bail_on_fail = true;

  //
  // Optional redirect of logger?
  //

  logger_function = NULL;

  //
  // Output
  //

  silent = false;

  api_mode = false;

  //
  // Export conventions
  //

  none_label = "None";

  missing_label = "NA";

  table_delimiter = ',';

}

