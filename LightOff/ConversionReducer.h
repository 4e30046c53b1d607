#ifndef ConversionReducer_h
#define ConversionReducer_h
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

#include <map>
#include <vector>
#include <string>
#include <ostream>

#include "LightOff/Calibration.h"

namespace StepSegmenter
{
  struct StepWindow;
}


namespace ConversionReducer
{
  /** One averaged measurement point. */
  struct LightOff_API ActivitySample
  {
    size_t step_index;
    double temperature;
    double avg_intensity;
    double conversion;
    size_t data_points;
  };//struct ActivitySample


  /** The conversion data for a single reactor, in protocol step order (not sorted by temperature). */
  struct LightOff_API ReactorActivity
  {
    int reactor_id = 1;

    std::vector<ActivitySample> samples;

    /** The calibration actually used for this reactor; if auto-intercept was on, its intercept is
     the derived one.
     */
    Calibration::CalibrationCurve calibration = { 0.0, 0.0 };
    bool auto_intercept_applied = false;

    std::vector<double> temperatures() const;
    std::vector<double> conversions() const;
    std::vector<double> avg_intensities() const;
    std::vector<size_t> data_points() const;
  };//struct ReactorActivity


  /** Groups the windows by reactor id, and converts each window's mean intensity to a conversion.

   If \p auto_intercept is true, the intercept of \p cal is replaced, separately for each reactor,
   so that reactor's highest mean intensity corresponds to 0% conversion.
   */
  LightOff_API std::map<int,ReactorActivity> reduce( const std::vector<StepSegmenter::StepWindow> &windows,
                                                      const Calibration::CalibrationCurve &cal,
                                                      const bool auto_intercept );


  /** Writes the "Temperature_C,Avg_Intensity,Conversion_%,Data_Points" table for a reactor.

   Pass \p write_header false to append the rows of further reactors below a table already started.
   */
  LightOff_API void write_detail_csv( std::ostream &out, const ReactorActivity &activity,
                                      const bool include_reactor_column,
                                      const bool write_header = true );

  /** Plain-text table of the samples, for printing to a terminal. */
  LightOff_API std::string detail_table_text( const ReactorActivity &activity );
}//namespace ConversionReducer

#endif //ConversionReducer_h
