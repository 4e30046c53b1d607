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
#include <stdexcept>

#include "LightOff/TimeSeries.h"

using namespace std;


double TimeSeries::duration() const
{
  if( times.empty() )
    return 0.0;
  return times.back() - times.front();
}//duration()


void TimeSeries::check_valid() const
{
  if( times.size() != intensities.size() )
    throw runtime_error( "TimeSeries: number of times (" + std::to_string(times.size())
                         + ") does not match number of intensities ("
                         + std::to_string(intensities.size()) + ")" );

  for( size_t i = 0; i < times.size(); ++i )
  {
    if( !std::isfinite(times[i]) )
      throw runtime_error( "TimeSeries: non-finite time at sample " + std::to_string(i) );

    if( i && (times[i] < times[i-1]) )
      throw runtime_error( "TimeSeries: times decrease at sample " + std::to_string(i) );
  }//for( size_t i = 0; i < times.size(); ++i )
}//void check_valid() const
