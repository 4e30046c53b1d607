#ifndef Calibration_h
#define Calibration_h
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


namespace Calibration
{
  /** Two-point linear calibration of benzene IR intensity to conversion:

   conversion [%] = slope*intensity + intercept

   Conversions are not clamped to [0,100].
   */
  struct LightOff_API CalibrationCurve
  {
    double slope;
    double intercept;
  };//struct CalibrationCurve


  /** The default benzene calibration (slope -995.32, intercept 101.36). */
  LightOff_API CalibrationCurve default_curve();

  LightOff_API double intensity_to_conversion( const double intensity, const CalibrationCurve &cal );

  LightOff_API std::vector<double> intensities_to_conversions( const std::vector<double> &intensities,
                                                               const CalibrationCurve &cal );

  /** Returns the intercept that makes the largest of the intensities map to exactly 0% conversion,
   that is `-slope*max(intensities)`.

   Throws std::runtime_error if \p intensities is empty.
   */
  LightOff_API double auto_intercept( const std::vector<double> &intensities, const double slope );

  /** Returns a copy of \p cal, with its intercept replaced by `auto_intercept(intensities,cal.slope)`.

   The passed in curve is not modified, so stored calibration presets stay as the user entered them.
   */
  LightOff_API CalibrationCurve with_auto_intercept( const CalibrationCurve &cal,
                                                     const std::vector<double> &intensities );
}//namespace Calibration

#endif //Calibration_h
