#ifndef StepSegmenter_h
#define StepSegmenter_h
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

#include <cstddef>
#include <vector>

struct TimeSeries;

namespace Protocol
{
  struct TemperatureProtocol;
}


namespace StepSegmenter
{
  /** The part of a recording attributed to a single protocol step. */
  struct LightOff_API StepWindow
  {
    /** Index of the step in the protocol. */
    size_t step_index;

    double temperature;
    int reactor_id;

    /** Absolute time (same units and origin as the recording) the step's hold begins. */
    double hold_start;

    /** Inclusive bounds of the analysis window. */
    double time_start;
    double time_end;

    /** Indices [sample_begin, sample_end) into the recording of the samples in the window. */
    size_t sample_begin;
    size_t sample_end;

    /** Mean intensity over the window. */
    double representative_intensity;

    size_t sample_count() const { return sample_end - sample_begin; }
  };//struct StepWindow


  /** Maps each step of \p protocol onto the recording.

   The hold of step i starts at `times[0] + offset_i`, where the offset accumulates each previous
   step's hold time plus its ramp time (see `TemperatureProtocol::ramp_after_step_seconds`).
   The window is the trailing `min(analysis_time, hold_time)` of the hold, and includes samples
   exactly on either edge.

   Steps with no samples in their window are skipped, so the returned vector may have fewer
   entries than the protocol has steps; returned windows are in protocol order.
   An empty recording gives no windows.

   Throws std::runtime_error if the protocol or recording is invalid.
   */
  LightOff_API std::vector<StepWindow> segment_steps( const TimeSeries &series,
                                                      const Protocol::TemperatureProtocol &protocol );
}//namespace StepSegmenter

#endif //StepSegmenter_h
