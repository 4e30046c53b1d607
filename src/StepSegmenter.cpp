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
#include <numeric>
#include <algorithm>
#include <stdexcept>

#include "LightOff/Protocol.h"
#include "LightOff/TimeSeries.h"
#include "LightOff/StepSegmenter.h"

using namespace std;

namespace StepSegmenter
{

vector<StepWindow> segment_steps( const TimeSeries &series, const Protocol::TemperatureProtocol &protocol )
{
  protocol.check_valid();
  series.check_valid();

  vector<StepWindow> windows;
  if( series.empty() )
    return windows;

  const vector<double> &times = series.times;
  const vector<double> &intensities = series.intensities;

  const double origin = times.front();
  const double analysis_time = 60.0 * protocol.analysis_time;
  const vector<double> offsets = protocol.hold_start_offsets_seconds();

  for( size_t i = 0; i < protocol.steps.size(); ++i )
  {
    const Protocol::TemperatureStep &step = protocol.steps[i];
    const double hold_time = 60.0 * step.hold_time;

    //Only the end of the hold is used, to give the gas composition time to equilibrate; if the
    //  hold is shorter than the analysis time, the whole hold is used.
    const double hold_start = origin + offsets[i];
    const double analysis_window = std::min( analysis_time, hold_time );
    const double window_start = hold_start + (hold_time - analysis_window);
    const double window_end = hold_start + hold_time;

    const auto first = std::lower_bound( begin(times), end(times), window_start );
    const auto last = std::upper_bound( first, end(times), window_end );

    if( first == last )
      continue;

    StepWindow window;
    window.step_index = i;
    window.temperature = step.temperature;
    window.reactor_id = step.reactor_id;
    window.hold_start = hold_start;
    window.time_start = window_start;
    window.time_end = window_end;
    window.sample_begin = static_cast<size_t>( first - begin(times) );
    window.sample_end = static_cast<size_t>( last - begin(times) );

    const double sum = std::accumulate( begin(intensities) + window.sample_begin,
                                        begin(intensities) + window.sample_end, 0.0 );
    window.representative_intensity = sum / static_cast<double>( window.sample_count() );

    windows.push_back( window );
  }//for( size_t i = 0; i < protocol.steps.size(); ++i )

  return windows;
}//segment_steps(...)

}//namespace StepSegmenter
