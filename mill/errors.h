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

#ifndef __FMILL_ERRORS_H__
#define __FMILL_ERRORS_H__

#include <stdexcept>
#include <string>

namespace fmill {

  struct error : public std::runtime_error {
    explicit error( const std::string & msg ) : std::runtime_error( msg ) { }
  };

  // malformed trial input: empty or non-monotonic timestamps, bad duration
  struct invalid_signal_error : public error {
    explicit invalid_signal_error( const std::string & msg ) : error( "invalid signal: " + msg ) { }
  };

  // too few trials to form a set-median reference
  struct missing_baseline_error : public error {
    explicit missing_baseline_error( const std::string & msg ) : error( "missing baseline: " + msg ) { }
  };

  // trial without a usable set/combo identity
  struct unknown_grouping_error : public error {
    explicit unknown_grouping_error( const std::string & msg ) : error( "unknown grouping: " + msg ) { }
  };

  // aggregate lacks fields expected at render time
  struct malformed_aggregate_error : public error {
    explicit malformed_aggregate_error( const std::string & msg ) : error( "malformed aggregate: " + msg ) { }
  };

  struct invalid_config_error : public error {
    explicit invalid_config_error( const std::string & msg ) : error( "invalid configuration: " + msg ) { }
  };

}

#endif
