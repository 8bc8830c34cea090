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


#ifndef __FMILL_MAIN_H__
#define __FMILL_MAIN_H__

#include <string>
#include <vector>

struct param_t;

// misc helper: build params from the command line (key=value, @files)
//  and pull out the trial list, -o and -t arguments
void build_param( param_t * param , int argc , char ** argv ,
		  std::string * trial_list , std::string * dbfile , std::string * outdir );

// misc helper: manage memory resource issues
void NoMem();

// misc helper: return fmill version
std::string fmill_version();

#endif
