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

#include "helper/helper.h"
#include "helper/logger.h"
#include "defs/defs.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>

extern logger_t logger;

std::string Helper::toupper( const std::string & s )
{
  std::string j = s;
  for (int i=0;i<j.size();i++) j[i] = std::toupper( s[i] );
  return j;
}

std::string Helper::remove_all_quotes(const std::string &s , const char q2 )
{
  std::string r;
  r.reserve( s.size() );
  for (int i=0; i<s.size(); i++)
    if ( ! ( s[i] == '"' || s[i] == q2 ) ) r += s[i];
  return r;
}

std::string Helper::quote_if( const std::string & s , char q )
{
  // empty strings stay as is
  if ( s == "" ) return s;

  // already quoted?
  if ( s.size() > 1 && s[0] == '"' && s[ s.size() - 1 ] == '"' ) return s;

  // does not contain flagged character: return as is
  if ( s.find( q ) == std::string::npos ) return s;

  // otherwise, place quotes
  return "\"" + s + "\"";
}

bool Helper::yesno( const std::string & s )
{
  // 0 no NO n N F f false FALSE
  // versus all else  (including empty, i.e. 'var'  --> 'var=T'
  if ( s.size() == 0 ) return false;
  if ( s[0] == '0' || s[0] == 'n' || s[0] == 'N' || s[0] == 'f' || s[0] == 'F' ) return false;
  return true;
}

bool Helper::iequals(const std::string& a, const std::string& b)
{
  unsigned int sz = a.size();
  if (b.size() != sz)
    return false;
  for (unsigned int i = 0; i < sz; ++i)
    if (tolower(a[i]) != tolower(b[i]))
      return false;
  return true;
}

bool Helper::fileExists( const std::string & f )
{
  FILE *file;
  if ( ( file = fopen( f.c_str() , "r" ) ) )
    {
      fclose(file);
      return true;
    }
  return false;
}

std::string Helper::expand( const std::string & f )
{
  // only expand ~ if first character for home-folder subst
  if ( f.size() == 0 ) return f;
  if ( f[0] != '~' ) return f;
  const char * home = getenv("HOME");
  if ( home == NULL ) return f;
  return std::string( home ) + f.substr(1);
}


// https://stackoverflow.com/questions/6089231/getting-std-ifstream-to-handle-lf-cr-and-crlf

std::istream& Helper::safe_getline(std::istream& is, std::string& t)
{
  t.clear();

  std::istream::sentry se(is, true);
  std::streambuf* sb = is.rdbuf();

  for ( ; ; )
    {

      int c = sb->sbumpc();

      switch (c)
	{
	case '\n':
	  return is;

	case '\r':
	  if (sb->sgetc() == '\n')
	    sb->sbumpc();
	  return is;

 	case EOF :
 	  // Also handle the case when the last line has no line ending
 	  if(t.empty())
 	    is.setstate(std::ios::eofbit);
 	  return is;

	default:
	  t += (char)c;
	}
    }
}

void Helper::halt( const std::string & msg )
{

  // some other code handles the exit, e.g. embedded/test mode
  if ( globals::bail_function != NULL )
    globals::bail_function( msg );

  // do not kill the process?
  if ( ! globals::bail_on_fail ) return;

  // switch logger off , i.e. as we don't want close-out msg
  logger.off();

  std::cerr << "error : " << msg << "\n";

  std::exit(1);
}

void Helper::warn( const std::string & msg )
{
  logger.warning( msg );
}

bool Helper::realnum(double d)
{
  double zero = 0;
  if (d != d || d == 1/zero || d == -1/zero)
    return false;
  else
    return true;
}

bool Helper::similar( double a, double b , double EPS )
{
  return fabs( a - b ) < EPS ;
}

std::string Helper::int2str(int n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n)
{
  std::ostringstream s2( std::stringstream::out );
  s2 << n;
  return s2.str();
}

std::string Helper::dbl2str(double n, int dp )
{
  std::ostringstream ss( std::stringstream::out );
  ss << std::fixed
     << std::setprecision( dp );
  ss << n;
  return ss.str();
}

std::string Helper::zero_pad( int x , int n )
{
  // e.g. x = 22 n = 4 --> return 0022
  const std::string r = Helper::int2str( x < 0 ? -x : x );
  const int l = r.size();
  const std::string sign = x < 0 ? "-" : "";
  if ( l >= n ) return sign + r;
  return sign + std::string( n - l , '0' ) + r ;
}

bool Helper::str2dbl(const std::string & s , double * d)
{
  return from_string<double>(*d,s,std::dec);
}

bool Helper::str2int(const std::string & s , int * i)
{
  return from_string<int>(*i,s,std::dec);
}

std::vector<std::string> Helper::parse(const std::string & item, const char s , bool empty )
{
  return Helper::char_split( item , s , empty );
}

std::vector<std::string> Helper::parse(const std::string & item, const std::string & s , bool empty )
{
  if ( s.size() == 1 ) return Helper::char_split( item , s[0] , empty );
  if ( s.size() == 2 ) return Helper::char_split( item , s[0] , s[1] , empty );
  if ( s.size() == 3 ) return Helper::char_split( item , s[0] , s[1] , s[2] , empty );
  Helper::halt("internal error in parse/char_split");
  std::vector<std::string> dummy;
  return dummy;
}

std::vector<std::string> Helper::quoted_parse(const std::string & item , const char s , const char q , const char q2, bool empty )
{
  return Helper::quoted_char_split( item , s , q, q2, empty );
}


std::vector<std::string> Helper::char_split( const std::string & s , const char c , bool empty )
{
  return Helper::char_split( s , c , c , c , empty );
}

std::vector<std::string> Helper::char_split( const std::string & s , const char c , const char c2 , bool empty )
{
  return Helper::char_split( s , c , c2 , c2 , empty );
}

std::vector<std::string> Helper::char_split( const std::string & s , const char c , const char c2 , const char c3 , bool empty )
{
  std::vector<std::string> strs;
  if ( s.size() == 0 ) return strs;
  int p=0;

  for (int j=0; j<s.size(); j++)
    {
      if ( s[j] == c || s[j] == c2 || s[j] == c3 )
	{
	  if ( j == p ) // empty slot?
	    {
	      if ( empty ) strs.push_back( "." );
	      ++p;
	    }
	  else
	    {
	      strs.push_back(s.substr(p,j-p));
	      p=j+1;
	    }
	}
    }

  if ( empty && p == s.size() )
    strs.push_back( "." );
  else if ( p < s.size() )
    strs.push_back( s.substr(p) );

  return strs;
}


std::vector<std::string> Helper::quoted_char_split( const std::string & s , const char c , const char q , const char q2, bool empty )
{

  std::vector<std::string> strs;
  if ( s.size() == 0 ) return strs;
  int p=0;

  bool in_quote = false;

  for (int j=0; j<s.size(); j++)
    {

      if ( s[j] == '"' || s[j] == q || s[j] == q2 ) in_quote = ! in_quote;

      if ( (!in_quote) && s[j] == c )
	{
	  if ( j == p ) // empty slot?
	    {
	      if ( empty ) strs.push_back( "." );
	      ++p;
	    }
	  else
	    {
	      strs.push_back(s.substr(p,j-p));
	      p=j+1;
	    }
	}
    }

  if ( empty && p == s.size() )
    strs.push_back( "." );
  else if ( p < s.size() )
    strs.push_back( s.substr(p) );

  return strs;
}
