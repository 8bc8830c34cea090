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

#ifndef __FMILL_TRIAL_H__
#define __FMILL_TRIAL_H__

#include <string>
#include <vector>

#include "defs/defs.h"

struct param_t;

namespace fmill {

  //
  // structured trial identity, assigned at ingestion
  //

  struct trial_id_t {

    trial_id_t() : set_id(-1) { }

    trial_id_t( int set_id , const std::string & combo_id , const std::string & chamber_id )
      : set_id( set_id ) , combo_id( combo_id ) , chamber_id( chamber_id ) { }

    // -1 : not assigned
    int set_id;

    std::string combo_id;

    std::string chamber_id;

    bool has_set() const { return set_id >= 0; }

    bool has_combo() const;

    // e.g. set003-A-A4
    std::string print() const;

    bool operator<( const trial_id_t & rhs ) const;

    bool operator==( const trial_id_t & rhs ) const
    {
      return set_id == rhs.set_id && combo_id == rhs.combo_id && chamber_id == rhs.chamber_id;
    }

  };


  //
  // one trial: ordered revolution-event timestamps (seconds since trial start)
  //

  struct trial_signal_t {

    trial_signal_t() : duration(0) , arm( default_arm ) { }

    trial_id_t id;

    std::vector<double> events;

    // recording length (s); 0 means 'up to the last event'
    double duration;

    // flight-mill arm length (m), i.e. radius of the flight path
    double arm;

    // source file, for traceability
    std::string label;

    static const double default_arm;

    double circumference() const;

    double recording_duration() const;

    // label if given, else the printed id
    std::string name() const;

    // throws invalid_signal_error
    void validate() const;

  };


  //
  // trial list (driver input)
  //

  struct trial_source_t {
    trial_source_t() : duration(0) { }
    trial_id_t id;
    std::string filename;
    double duration;
  };

  struct load_options_t {

    load_options_t();

    trial_format_t format;

    double arm;

    // standardization of voltage traces (FORMAT_VOLTS)
    double dev_min;
    double dev_max;
    int refractory;

    static load_options_t from_param( const param_t & param );

  };

  // rows: set_id combo_id chamber_id file [duration]
  std::vector<trial_source_t> read_trial_list( const std::string & filename );

  // throws invalid_signal_error for unreadable or malformed data
  trial_signal_t load_trial( const trial_source_t & source , const load_options_t & options );


  //
  // raw optical-sensor trace (time, voltage per line)
  //

  struct sample_trace_t {
    std::vector<double> times;
    std::vector<double> volts;
    int size() const { return times.size(); }
  };

  // throws invalid_signal_error
  sample_trace_t load_trace( const std::string & filename );

}

#endif
