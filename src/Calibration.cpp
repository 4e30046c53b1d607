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

#include <vector>
#include <algorithm>
#include <stdexcept>

#include "LightOff/Calibration.h"

using namespace std;

namespace Calibration
{

CalibrationCurve default_curve()
{
  CalibrationCurve cal;
  cal.slope = -995.32;
  cal.intercept = 101.36;
  return cal;
}//default_curve()


double intensity_to_conversion( const double intensity, const CalibrationCurve &cal )
{
  return cal.slope * intensity + cal.intercept;
}


vector<double> intensities_to_conversions( const vector<double> &intensities, const CalibrationCurve &cal )
{
  vector<double> answer( intensities.size() );
  for( size_t i = 0; i < intensities.size(); ++i )
    answer[i] = intensity_to_conversion( intensities[i], cal );
  return answer;
}//intensities_to_conversions(...)


double auto_intercept( const vector<double> &intensities, const double slope )
{
  if( intensities.empty() )
    throw runtime_error( "Calibration::auto_intercept: no intensities" );

  //The largest intensity is where the least benzene has been oxidized, so we call it 0%:
  //  0 = slope*max_intensity + intercept
  const double max_intensity = *std::max_element( begin(intensities), end(intensities) );

  return -slope * max_intensity;
}//auto_intercept(...)


CalibrationCurve with_auto_intercept( const CalibrationCurve &cal, const vector<double> &intensities )
{
  CalibrationCurve answer = cal;
  answer.intercept = auto_intercept( intensities, cal.slope );
  return answer;
}//with_auto_intercept(...)

}//namespace Calibration
