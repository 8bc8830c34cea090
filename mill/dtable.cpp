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

#include "mill/dtable.h"
#include "mill/errors.h"

#include "helper/helper.h"
#include "defs/defs.h"

#include <sstream>

dtable_t::dtable_t()
{
  nrows = -1;
}

bool dtable_t::has( const std::string & c ) const
{
  for (int j=0; j<cols.size(); j++)
    if ( cols[j] == c ) return true;
  return false;
}

const std::vector<dtable_elem_t> & dtable_t::col( const std::string & c ) const
{
  for (int j=0; j<cols.size(); j++)
    if ( cols[j] == c ) return data[j];
  throw fmill::malformed_aggregate_error( "no column " + c );
}

std::string dtable_t::str( const int r , const int c ) const
{
  const dtable_elem_t & e = data[ c ][ r ];

  if ( std::holds_alternative<double>( e ) )
    {
      std::stringstream ss;
      ss.precision( 10 );
      ss << std::get<double>( e );
      return ss.str();
    }
  else if ( std::holds_alternative<int>( e ) )
    return Helper::int2str( std::get<int>( e ) );
  else if ( std::holds_alternative<std::string>( e ) )
    return std::get<std::string>( e );

  return globals::missing_label;
}

std::string dtable_t::dump() const
{

  if ( nrows == -1 ) return "<empty>";

  std::stringstream ss;

  const int nc = cols.size();

  // header
  for (int j=0; j<nc; j++)
    {
      if ( j ) ss << "\t";
      ss << cols[j];
    }
  ss << "\n";

  // data
  for (int i=0;i<nrows;i++)
    {
      for (int j=0; j<nc; j++)
	{
	  if ( j ) ss << "\t";
	  ss << str( i , j );
	}
      ss << "\n";
    }

  return ss.str();

}


void dtable_t::checkname( const std::string & v ) const
{
  if ( has( v ) )
    throw fmill::malformed_aggregate_error( "duplicate column " + v );
}

void dtable_t::checkrows( int n )
{
  if ( nrows == -1 )
    nrows = n;
  else if ( nrows != n )
    throw fmill::malformed_aggregate_error( "column lengths differ ("
					    + Helper::int2str( nrows ) + " vs "
					    + Helper::int2str( n ) + ")" );
}

void dtable_t::add( const std::string & v , const std::vector<std::string> & x )
{
  checkname( v );
  checkrows( x.size() );
  std::vector<bool> missing( nrows , false );
  add( v, x , missing );
}

void dtable_t::add( const std::string & v , const std::vector<std::string> & x , const std::vector<bool> & m )
{
  checkname( v );
  checkrows( x.size() );
  checkrows( m.size() );
  cols.push_back(v);
  std::vector<dtable_elem_t> d( nrows , std::monostate{} );
  for (int i=0;i<nrows;i++)
    if ( ! m[i] ) d[i] = x[i] ;
  data.push_back( d );
}

// doubles

void dtable_t::add( const std::string & v , const std::vector<double> & x )
{
  checkname( v );
  checkrows( x.size() );
  std::vector<bool> missing( nrows , false );
  add( v, x , missing );
}

void dtable_t::add( const std::string & v , const std::vector<double> & x , const std::vector<bool> & m )
{
  checkname( v );
  checkrows( x.size() );
  checkrows( m.size() );
  cols.push_back(v);
  std::vector<dtable_elem_t> d( nrows , std::monostate{} );
  for (int i=0;i<nrows;i++)
    if ( ! m[i] ) d[i] = x[i] ;
  data.push_back( d );
}

// ints

void dtable_t::add( const std::string & v , const std::vector<int> & x )
{
  checkname( v );
  checkrows( x.size() );
  std::vector<bool> missing( nrows , false );
  add( v, x , missing );
}

void dtable_t::add( const std::string & v , const std::vector<int> & x , const std::vector<bool> & m )
{
  checkname( v );
  checkrows( x.size() );
  checkrows( m.size() );
  cols.push_back(v);
  std::vector<dtable_elem_t> d( nrows , std::monostate{} );
  for (int i=0;i<nrows;i++)
    if ( ! m[i] ) d[i] = x[i] ;
  data.push_back( d );
}


//
// delimited text
//

void dtable_t::write( std::ostream & out , const char delim ) const
{

  const int nc = cols.size();

  for (int j=0; j<nc; j++)
    {
      if ( j ) out << delim;
      out << Helper::quote_if( cols[j] , delim );
    }
  out << "\n";

  for (int i=0; i<nrows; i++)
    {
      for (int j=0; j<nc; j++)
	{
	  if ( j ) out << delim;
	  out << Helper::quote_if( str( i , j ) , delim );
	}
      out << "\n";
    }

}


dtable_t dtable_t::read( std::istream & in , const char delim )
{

  dtable_t t;

  std::vector<std::vector<std::string> > cells;
  std::vector<std::vector<bool> > missing;

  bool header = true;

  while ( ! in.eof() )
    {
      std::string line;
      Helper::safe_getline( in , line );
      if ( in.eof() && line == "" ) break;
      if ( line == "" ) continue;

      std::vector<std::string> tok = Helper::quoted_parse( line , delim , '"' , '"' , true );

      if ( header )
	{
	  for (int j=0; j<tok.size(); j++)
	    t.cols.push_back( Helper::unquote( tok[j] ) );
	  cells.resize( tok.size() );
	  missing.resize( tok.size() );
	  header = false;
	  continue;
	}

      if ( tok.size() != t.cols.size() )
	throw fmill::malformed_aggregate_error( "expecting " + Helper::int2str( (int)t.cols.size() )
						+ " fields, found " + Helper::int2str( (int)tok.size() ) );

      for (int j=0; j<tok.size(); j++)
	{
	  const std::string v = Helper::unquote( tok[j] );
	  cells[j].push_back( v );
	  missing[j].push_back( v == globals::missing_label );
	}
    }

  if ( header ) return t;

  t.nrows = cells.size() == 0 ? 0 : cells[0].size();
  t.data.resize( cells.size() );

  for (int j=0; j<cells.size(); j++)
    {
      t.data[j].resize( t.nrows , std::monostate{} );
      for (int i=0; i<t.nrows; i++)
	if ( ! missing[j][i] ) t.data[j][i] = cells[j][i];
    }

  return t;
}
