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
#include <fstream>
#include <iostream>
#include <algorithm>
#include <stdexcept>

#include "SpecUtils/StringAlgo.h"
#include "SpecUtils/Filesystem.h"
#include "SpecUtils/ParseUtils.h"

#include "LightOff/TimeSeries.h"
#include "LightOff/AscFileReader.h"

using namespace std;

namespace AscFileReader
{

TimeSeries parse_asc( std::istream &input )
{
  TimeSeries series;

  bool in_data_section = false;
  string line;
  vector<string> fields;

  while( SpecUtils::safe_get_line( input, line, 16 * 1024 ) )
  {
    SpecUtils::trim( line );

    if( !in_data_section )
    {
      in_data_section = (line == "#DATA");
      continue;
    }

    if( line.empty() )
      continue;

    //Empty fields are kept, so "1.0<tab><tab>2.0" is a bad line rather than the point (1, 2)
    fields.clear();
    SpecUtils::split_no_delim_compress( fields, line, "\t" );
    if( fields.size() < 2 )
      continue;

    SpecUtils::trim( fields[0] );
    SpecUtils::trim( fields[1] );

    double time = 0.0, intensity = 0.0;
    if( fields[0].empty() || fields[1].empty()
        || !SpecUtils::parse_double( fields[0].c_str(), fields[0].size(), time )
        || !SpecUtils::parse_double( fields[1].c_str(), fields[1].size(), intensity ) )
      continue;

    series.times.push_back( time );
    series.intensities.push_back( intensity );
  }//while( SpecUtils::safe_get_line( input, line ) )

  return series;
}//parse_asc(...)


TimeSeries read_asc_file( const std::string &filename )
{
#ifdef _WIN32
  const std::wstring wfilename = SpecUtils::convert_from_utf8_to_utf16(filename);
  std::ifstream input( wfilename.c_str(), ios::in | ios::binary );
#else
  std::ifstream input( filename.c_str(), ios::in | ios::binary );
#endif

  if( !input.is_open() )
    throw runtime_error( "ASC file, '" + filename + "', could not be opened." );

  return parse_asc( input );
}//read_asc_file(...)


vector<string> list_asc_files( const std::string &directory )
{
  vector<string> answer;
  if( !SpecUtils::is_directory( directory ) )
    return answer;

  const vector<string> files = SpecUtils::ls_files_in_directory( directory );
  for( const string &file : files )
  {
    if( SpecUtils::iends_with( file, ".asc" ) )
      answer.push_back( file );
  }

  std::sort( begin(answer), end(answer) );

  return answer;
}//list_asc_files(...)

}//namespace AscFileReader
