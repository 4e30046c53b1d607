#ifndef AscFileReader_h
#define AscFileReader_h
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
#include <istream>

#include "LightOff/TimeSeries.h"


/** Reading of the ".asc" time-trace exports of the FT-IR software.

 These files have a free-form header, followed by a line containing only "#DATA", after which each
 line is "<time [s]>\t<intensity>".
 */
namespace AscFileReader
{
  /** Parses the data section of an ASC file.

   Lines before "#DATA" are ignored; after it, lines with fewer than two tab-separated fields, or
   whose first two fields are not numbers, are skipped.  If there is no "#DATA" line, the returned
   series is empty.
   */
  LightOff_API TimeSeries parse_asc( std::istream &input );

  /** Opens and parses \p filename; throws std::runtime_error if the file can't be opened. */
  LightOff_API TimeSeries read_asc_file( const std::string &filename );

  /** Returns the full paths of the files ending in ".asc" (case insensitive) in \p directory, sorted.
   Returns an empty vector if \p directory is not a directory.
   */
  LightOff_API std::vector<std::string> list_asc_files( const std::string &directory );
}//namespace AscFileReader

#endif //AscFileReader_h
