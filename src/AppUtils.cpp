/* LightOff: an application to analyze catalytic light-off activity data.
 
 Copyright 2018 National Technology & Engineering Solutions of Sandia, LLC
 (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
 Government retains certain rights in this software.
 For questions contact William Johnson via email at wcjohns@sandia.gov, or
 alternative emails of interspec@sandia.gov.
 
 This library is free software; you can redistribute it and/or
 modify it under the terms of the GNU Lesser General Public
 License as published by the Free Software Foundation; either
 version 2.1 of the License, or (at your option) any later version.
 
 This library is distributed in the hope that it will be useful,
 but WITHOUT ANY WARRANTY; without even the implied warranty of
 MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 Lesser General Public License for more details.
 
 You should have received a copy of the GNU Lesser General Public
 License along with this library; if not, write to the Free Software
 Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
 */

#include "LightOff_config.h"

#include <cmath>
#include <string>
#include <vector>
#include <cstring>
#include <cstdlib>
#include <iostream>
#include <algorithm>
#include <stdexcept>

// Some includes to get terminal width (and UTF-8 cl arguments on Windows)
#if defined(__APPLE__) || defined(linux) || defined(unix) || defined(__unix) || defined(__unix__)
#include <sys/ioctl.h>
#include <unistd.h>
#elif defined(_WIN32)
#define NOMINMAX
#define WIN32_LEAN_AND_MEAN 1
#include <Windows.h>
#include <stdio.h>
#endif

#include "SpecUtils/StringAlgo.h"

#include "LightOff/AppUtils.h"

using namespace std;

namespace
{
  vector<string> split_number_fields( const string &input )
  {
    vector<string> fields;
    SpecUtils::split( fields, input, ", \t\r\n;" );

    for( string &field : fields )
      SpecUtils::trim( field );

    fields.erase( std::remove_if( begin(fields), end(fields),
                                  []( const string &f ){ return f.empty(); } ),
                  end(fields) );
    return fields;
  }//split_number_fields(...)
}//namespace


namespace AppUtils
{
#if( USE_BATCH_TOOLS )
#if defined(__APPLE__) || defined(unix) || defined(__unix) || defined(__unix__)
unsigned terminal_width()
{
  winsize ws = {};
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) <= -1)
    return 80;
  unsigned w = (ws.ws_col);
  return std::max( 40u, w );
}
#elif defined(_WIN32)
unsigned terminal_width()
{
  HANDLE handle = GetStdHandle(STD_OUTPUT_HANDLE);
  if( handle == INVALID_HANDLE_VALUE )
    return 80;

  CONSOLE_SCREEN_BUFFER_INFO info;
  if( !GetConsoleScreenBufferInfo(handle, &info) )
    return 80;

  return unsigned(info.srWindow.Right - info.srWindow.Left);
}
#else
static_assert( 0, "Not unix and not win32?  Unsupported getting terminal width" );
#endif
#endif //#if( USE_BATCH_TOOLS )


uint32_t compile_date_as_int()
{
  //The below YEAR MONTH DAY macros are taken from
  //http://bytes.com/topic/c/answers/215378-convert-__date__-unsigned-int
  //  and I believe to be public domain code
#define YEAR ((((__DATE__ [7] - '0') * 10 + (__DATE__ [8] - '0')) * 10 \
+ (__DATE__ [9] - '0')) * 10 + (__DATE__ [10] - '0'))
#define MONTH (__DATE__ [2] == 'n' && __DATE__ [1] == 'a' ? 0 \
: __DATE__ [2] == 'b' ? 1 \
: __DATE__ [2] == 'r' ? (__DATE__ [0] == 'M' ? 2 : 3) \
: __DATE__ [2] == 'y' ? 4 \
: __DATE__ [2] == 'n' ? 5 \
: __DATE__ [2] == 'l' ? 6 \
: __DATE__ [2] == 'g' ? 7 \
: __DATE__ [2] == 'p' ? 8 \
: __DATE__ [2] == 't' ? 9 \
: __DATE__ [2] == 'v' ? 10 : 11)
#define DAY ((__DATE__ [4] == ' ' ? 0 : __DATE__ [4] - '0') * 10 + (__DATE__ [5] - '0'))

  return YEAR*10000 + (MONTH+1)*100 + DAY;
}//uint32_t compile_date_as_int()


vector<double> parse_double_list( const string &input )
{
  vector<double> answer;
  for( const string &field : split_number_fields( input ) )
  {
    double value = 0.0;
    if( !SpecUtils::parse_double( field.c_str(), field.size(), value ) || !std::isfinite(value) )
      throw runtime_error( "'" + field + "' is not a valid number (in '" + input + "')" );
    answer.push_back( value );
  }

  return answer;
}//parse_double_list(...)


vector<int> parse_int_list( const string &input )
{
  vector<int> answer;
  for( const string &field : split_number_fields( input ) )
  {
    int value = 0;
    if( !SpecUtils::parse_int( field.c_str(), field.size(), value ) )
      throw runtime_error( "'" + field + "' is not a valid integer (in '" + input + "')" );
    answer.push_back( value );
  }

  return answer;
}//parse_int_list(...)


#ifdef _WIN32
void getUtf8Args( int &argc, wchar_t **argvw, char **&argv )
{
  argv = (char **)malloc( sizeof( char * ) * argc );

  for( int i = 0; i < argc; ++i )
  {
    const std::string asutf8 = SpecUtils::convert_from_utf16_to_utf8( argvw[i] );
    argv[i] = (char *)malloc( sizeof( char ) * (asutf8.size() + 1) );
    strcpy( argv[i], asutf8.c_str() );
  }//for( int i = 0; i < argc; ++i)
}//void getUtf8Args(...)


void cleanupUtf8Args( int &argc, char **&argv )
{
  for( int i = 0; i < argc; ++i )
    free( argv[i] );
  free( argv );
  argc = 0;
  argv = nullptr;
}//void cleanupUtf8Args(...)
#endif
}//namespace AppUtils
