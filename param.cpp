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

#include "param.h"

#include "helper/helper.h"
#include "helper/logger.h"

#include <fstream>

extern logger_t logger;

//
// param_t
//

void param_t::add( const std::string & option , const std::string & value )
{

  if ( option == "" ) return;

  // key+=value  ","-appends to any existing list

  const bool append_mode = option[ option.size() - 1 ] == '+';

  if ( append_mode )
    {
      const std::string option1 = option.substr( 0 , option.size() - 1 );
      if ( option1 == "" ) return;
      if ( opt.find( option1 ) == opt.end() )
	opt[ option1 ] = value;
      else
	opt[ option1 ] = opt[ option1 ] + "," + value;
      return;
    }

  // else check no doubles
  if ( opt.find( option ) != opt.end() )
    Helper::halt( option + " parameter specified twice, only one value would be retained" );

  opt[ option ] = value;

}


int param_t::size() const
{
  return opt.size();
}


void param_t::parse( const std::string & s )
{
  std::vector<std::string> tok = Helper::quoted_parse( s , '=' );
  if ( tok.size() == 2 )     add( tok[0] , tok[1] );
  else if ( tok.size() == 1 ) add( tok[0] , "__null__" );
  else if ( tok.size() > 2 ) // key=value=2 means "value=2" is set to 'key'
    {
      std::string v = tok[1];
      for (int i=2;i<tok.size();i++) v += "=" + tok[i];
      add( tok[0] , v );
    }
}


void param_t::include( const std::string & filename )
{

  const std::string f = Helper::expand( filename );

  if ( ! Helper::fileExists( f ) )
    Helper::halt( "could not open parameter file " + f );

  std::ifstream IN1( f.c_str() , std::ios::in );

  int cnt = 0;

  while ( ! IN1.eof() )
    {
      std::string line;
      Helper::safe_getline( IN1 , line );
      if ( IN1.eof() && line == "" ) break;

      // comments
      const size_t c = line.find( '%' );
      if ( c != std::string::npos ) line = line.substr( 0 , c );

      std::vector<std::string> tok = Helper::quoted_parse( line , ' ' );
      for (int i=0; i<tok.size(); i++)
	{
	  const std::string t = Helper::lrtrim( tok[i] );
	  if ( t == "" ) continue;
	  parse( t );
	  ++cnt;
	}
    }

  IN1.close();

  logger << "  read " << cnt << " parameter(s) from " << f << "\n";

}


void param_t::clear()
{
  opt.clear();
}

bool param_t::has(const std::string & s ) const
{
  return opt.find(s) != opt.end();
}

bool param_t::empty(const std::string & s ) const
{
  if ( ! has( s ) ) return true;
  return opt.find( s )->second == "__null__";
}

bool param_t::yesno(const std::string & s , const bool default1 , const bool default2 ) const
{
  if ( ! has( s ) ) return default1;
  if ( empty( s ) ) return default2;
  return Helper::yesno( opt.find( s )->second ) ;
}

std::string param_t::value( const std::string & s , const bool uppercase ) const
{
  if ( has( s ) )
    return uppercase ?
      Helper::remove_all_quotes( Helper::toupper( opt.find( s )->second ) )
      : Helper::remove_all_quotes( opt.find( s )->second );
  else
    return "";
}

std::string param_t::requires( const std::string & s , const bool uppercase ) const
{
  if ( ! has(s) ) Helper::halt( "requires parameter " + s );
  if ( empty(s) ) Helper::halt( "requires parameter " + s + " to have a value" );
  return value(s, uppercase );
}

int param_t::requires_int( const std::string & s ) const
{
  int r = 0;
  if ( ! Helper::str2int( requires(s) , &r ) )
    Helper::halt( "requires parameter " + s + " to have an integer value" );
  return r;
}

double param_t::requires_dbl( const std::string & s ) const
{
  double r = 0;
  if ( ! Helper::str2dbl( requires(s) , &r ) )
    Helper::halt( "requires parameter " + s + " to have a numeric value" );
  return r;
}

std::string param_t::dump( const std::string & indent , const std::string & delim ) const
{
  std::map<std::string,std::string>::const_iterator ii = opt.begin();
  int sz = opt.size();
  int cnt = 1;
  std::stringstream ss;
  while ( ii != opt.end() )
    {

      if ( ii->second != "__null__" )
	ss << indent << ii->first << "=" << ii->second;
      else
	ss << indent << ii->first ;

      if ( cnt != sz )
	ss << delim;

      ++cnt;
      ++ii;
    }
  return ss.str();
}

std::vector<std::string> param_t::strvector( const std::string & k , const std::string delim , const bool uppercase ) const
{
  std::vector<std::string> s;
  if ( ! has(k) ) return s;
  if ( delim.size() != 1 ) Helper::halt( "internal error: strvector() expects a single-character delimiter" );
  std::vector<std::string> tok = Helper::quoted_parse( value(k,uppercase) , delim[0] );
  for (int i=0;i<tok.size();i++)
    s.push_back( Helper::unquote( tok[i]) );
  return s;
}

std::vector<double> param_t::dblvector( const std::string & k , const std::string delim ) const
{
  std::vector<double> s;
  std::vector<std::string> tok = strvector( k , delim );
  for (int i=0;i<tok.size();i++)
    {
      double d = 0;
      if ( ! Helper::str2dbl( tok[i] , &d ) ) Helper::halt( "Option " + k + " requires a double value(s)" );
      s.push_back(d);
    }
  return s;
}
