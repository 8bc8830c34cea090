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

#ifndef __FMILL_PARAM_H__
#define __FMILL_PARAM_H__

#include <string>
#include <map>
#include <vector>
#include <sstream>

//
// Helper to parse key=value options (command line and @files)
//

struct param_t
{

 public:

  void add( const std::string & option , const std::string & value = "" );

  int size() const;

  // key=value, or a bare key (flag)
  void parse( const std::string & s );

  // read key=value tokens from a file ('%' starts a comment)
  void include( const std::string & filename );

  void clear();

  bool has(const std::string & s ) const;

  bool empty(const std::string & s ) const;

  // if ! has(X) return default1
  // else if a bare flag, return default2
  // else return yesno(value(X))
  bool yesno(const std::string & s , const bool default1 = false , const bool default2 = true ) const;

  std::string value( const std::string & s , const bool uppercase = false ) const;

  std::string requires( const std::string & s , const bool uppercase = false ) const;

  int requires_int( const std::string & s ) const;

  double requires_dbl( const std::string & s ) const;

  std::string dump( const std::string & indent = "  ", const std::string & delim = "\n" ) const;

  std::vector<std::string> strvector( const std::string & k , const std::string delim = "," , const bool uppercase = false ) const;

  std::vector<double> dblvector( const std::string & k , const std::string delim = "," ) const;


private:

  std::map<std::string,std::string> opt;

};


#endif
