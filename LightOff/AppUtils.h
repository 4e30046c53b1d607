#ifndef LightOff_AppUtils_h
#define LightOff_AppUtils_h
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

#include <string>
#include <vector>
#include <cstdint>


namespace AppUtils
{
#if( USE_BATCH_TOOLS )
  /** Returns the terminal character width */
  LightOff_API unsigned terminal_width();
#endif

  /** Returns a int, representing compile date of AppUtils.cpp.

   For example, will return value 20120122 if you compile on Jan 22nd, 2012.
   */
  LightOff_API uint32_t compile_date_as_int();

  /** Parses a list of numbers seperated by commas, and/or whitespace.

   E.g., "500, 450,400 350" gives {500, 450, 400, 350}; an empty, or all whitespace, string gives an
   empty vector.

   Throws std::runtime_error, naming the offending field, if any field is not a number.
   */
  LightOff_API std::vector<double> parse_double_list( const std::string &input );

  /** Same as #parse_double_list, but each field must be an integer. */
  LightOff_API std::vector<int> parse_int_list( const std::string &input );

#ifdef _WIN32
  /** Converts the wide-character command line arguments to UTF-8; call #cleanupUtf8Args when done. */
  LightOff_API void getUtf8Args( int &argc, wchar_t **argvw, char **&argv );

  /** Frees the memory allocated by #getUtf8Args */
  LightOff_API void cleanupUtf8Args( int &argc, char **&argv );
#endif
}//namespace AppUtils

#endif //LightOff_AppUtils_h
