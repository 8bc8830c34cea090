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

#ifndef __FMILL_DEFS_H__
#define __FMILL_DEFS_H__

#include <string>
#include <vector>

// per-trial statistics that are classified and tabulated

enum metric_t
  {
    TROUGHS = 0 ,
    SPEED ,
    DISTANCE
  };

enum baseline_policy_t
  {
    BASELINE_SELF ,        // trial's own first segment
    BASELINE_SET_MEDIAN    // per-metric median over the set
  };

enum change_level_t
  {
    NO_CHANGE = 0 ,
    SMALL_CHANGE ,
    LARGE_CHANGE
  };

// input layouts understood by the trial loader

enum trial_format_t
  {
    FORMAT_EVENTS ,  // one revolution timestamp per line
    FORMAT_FLAGS ,   // time, trough-flag (0/1)
    FORMAT_VOLTS     // time, voltage : standardized in-process
  };


struct globals
{

  static std::string version;
  static std::string date;

  // return code for the driver
  static int retcode;

  // classified statistics, in table order
  static std::vector<metric_t> all_metrics();

  static std::string metric_label( const metric_t m );

  static bool metric_lookup( const std::string & s , metric_t * m );

  static std::string baseline_label( const baseline_policy_t b );

  static bool baseline_lookup( const std::string & s , baseline_policy_t * b );

  // export sentinels, only used at the serialization boundary
  static std::string none_label;

  static std::string missing_label;

  static char folder_delimiter;

  static char table_delimiter;

  // function to bail to if needed
  static void (*bail_function) ( const std::string & msg );

  // optional redirect of all logger output
  static void (*logger_function) ( const std::string & msg );

  // no console output
  static bool silent;

  // running embedded (e.g. tests): no banners/log files
  static bool api_mode;

  static bool bail_on_fail;

  // primary initiation of all globals
  void init_defs();

  // embedded mode
  void api();

};

#endif
