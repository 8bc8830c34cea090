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

#ifndef __FMILL_DTABLE_H__
#define __FMILL_DTABLE_H__

#include <iostream>
#include <string>
#include <vector>
#include <variant>

// diagnostic tables: column-major, variant cells
//  (monostate = missing, written as the NA sentinel)

typedef std::variant<std::string,double,int,std::monostate> dtable_elem_t;
typedef std::vector<std::vector<dtable_elem_t> > dtable_data_t;

struct dtable_t {

  dtable_t();

  std::vector<std::string> cols;

  // data[ col ][ row ]
  dtable_data_t data;

  // -1 until the first column is added
  int nrows;

  int ncols() const { return cols.size(); }

  bool has( const std::string & c ) const;

  // throws malformed_aggregate_error for an unknown column
  const std::vector<dtable_elem_t> & col( const std::string & c ) const;

  // cell as text
  std::string str( const int r , const int c ) const;

  std::string dump() const;

  // each add() throws malformed_aggregate_error for a repeated column
  // name or a length that differs from earlier columns

  void add( const std::string & v , const std::vector<std::string> & x );
  void add( const std::string & v , const std::vector<std::string> & x , const std::vector<bool> & m );

  void add( const std::string & v , const std::vector<double> & x );
  void add( const std::string & v , const std::vector<double> & x , const std::vector<bool> & m );

  void add( const std::string & v , const std::vector<int> & x );
  void add( const std::string & v , const std::vector<int> & x , const std::vector<bool> & m );

  // delimited text, header row first; fields containing the delimiter are quoted
  void write( std::ostream & out , const char delim = ',' ) const;

  // all cells are read back as strings (NA -> missing)
  static dtable_t read( std::istream & in , const char delim = ',' );

 private:

  void checkrows( int n );

  void checkname( const std::string & v ) const;

};

#endif
