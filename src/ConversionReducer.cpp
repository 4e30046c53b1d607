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
#include <string>
#include <vector>
#include <sstream>
#include <iomanip>
#include <ostream>

#include "LightOff/Calibration.h"
#include "LightOff/StepSegmenter.h"
#include "LightOff/ConversionReducer.h"

using namespace std;

namespace ConversionReducer
{

vector<double> ReactorActivity::temperatures() const
{
  vector<double> answer;
  for( const ActivitySample &sample : samples )
    answer.push_back( sample.temperature );
  return answer;
}


vector<double> ReactorActivity::conversions() const
{
  vector<double> answer;
  for( const ActivitySample &sample : samples )
    answer.push_back( sample.conversion );
  return answer;
}


vector<double> ReactorActivity::avg_intensities() const
{
  vector<double> answer;
  for( const ActivitySample &sample : samples )
    answer.push_back( sample.avg_intensity );
  return answer;
}


vector<size_t> ReactorActivity::data_points() const
{
  vector<size_t> answer;
  for( const ActivitySample &sample : samples )
    answer.push_back( sample.data_points );
  return answer;
}


map<int,ReactorActivity> reduce( const vector<StepSegmenter::StepWindow> &windows,
                                 const Calibration::CalibrationCurve &cal,
                                 const bool auto_intercept )
{
  map<int,ReactorActivity> answer;

  //First pass groups the windows by reactor, keeping protocol order
  for( const StepSegmenter::StepWindow &window : windows )
  {
    ReactorActivity &activity = answer[window.reactor_id];
    activity.reactor_id = window.reactor_id;

    ActivitySample sample;
    sample.step_index = window.step_index;
    sample.temperature = window.temperature;
    sample.avg_intensity = window.representative_intensity;
    sample.conversion = 0.0;
    sample.data_points = window.sample_count();
    activity.samples.push_back( sample );
  }//for( const StepWindow &window : windows )

  //Second pass converts intensities, with the intercept derived from each reactors own data
  for( auto &id_activity : answer )
  {
    ReactorActivity &activity = id_activity.second;

    activity.auto_intercept_applied = auto_intercept && !activity.samples.empty();
    activity.calibration = activity.auto_intercept_applied
                             ? Calibration::with_auto_intercept( cal, activity.avg_intensities() )
                             : cal;

    for( ActivitySample &sample : activity.samples )
      sample.conversion = Calibration::intensity_to_conversion( sample.avg_intensity, activity.calibration );
  }//for( auto &id_activity : answer )

  return answer;
}//reduce(...)


void write_detail_csv( std::ostream &out, const ReactorActivity &activity,
                       const bool include_reactor_column,
                       const bool write_header )
{
  if( write_header )
  {
    if( include_reactor_column )
      out << "Reactor,";
    out << "Temperature_C,Avg_Intensity,Conversion_%,Data_Points\r\n";
  }

  for( const ActivitySample &sample : activity.samples )
  {
    if( include_reactor_column )
      out << activity.reactor_id << ",";
    out << std::setprecision(8) << sample.temperature
        << "," << sample.avg_intensity
        << "," << sample.conversion
        << "," << sample.data_points << "\r\n";
  }
}//write_detail_csv(...)


string detail_table_text( const ReactorActivity &activity )
{
  stringstream strm;
  strm << std::left << std::setw(16) << "Temperature [C]"
       << std::setw(16) << "Avg Intensity"
       << std::setw(16) << "Conversion [%]"
       << "Data Points" << "\n";

  for( const ActivitySample &sample : activity.samples )
  {
    strm << std::left << std::fixed
         << std::setw(16) << std::setprecision(1) << sample.temperature
         << std::setw(16) << std::setprecision(6) << sample.avg_intensity
         << std::setw(16) << std::setprecision(2) << sample.conversion
         << sample.data_points << "\n";
  }

  return strm.str();
}//detail_table_text(...)

}//namespace ConversionReducer
