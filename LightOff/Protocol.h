#ifndef Protocol_h
#define Protocol_h
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


namespace Protocol
{
  /** How reactors are assigned to the steps of a protocol. */
  enum class ProtocolMode : int
  {
    /** A single reactor; every step has reactor id 1. */
    Standard,

    /** One recording interleaves several reactors, each step says which reactor it measured. */
    SemiAuto
  };//enum class ProtocolMode

  LightOff_API const char *to_string( const ProtocolMode mode );

  /** Accepts "standard", "semi_auto", or "semi-auto" (case insensitive).
   Throws std::runtime_error for anything else.
   */
  LightOff_API ProtocolMode mode_from_string( const std::string &str );


  struct LightOff_API TemperatureStep
  {
    /** Nominal set-point, in Celsius. */
    double temperature;

    /** How long the reactor is held at this temperature, in minutes. */
    double hold_time;

    /** 1-based reactor id. */
    int reactor_id;

    TemperatureStep( const double temp, const double hold_minutes, const int reactor = 1 );
  };//struct TemperatureStep


  /** A programmed temperature schedule.

   The reactor is held at each step for its hold time, and then ramped to the next step over
   `ramp_time` - unless the next step has the same nominal temperature, in which case no ramp time
   is spent (this is how semi-auto mode alternates reactors at a single set-point).
   Only the trailing `analysis_time` of each hold is used for measurement.
   */
  struct LightOff_API TemperatureProtocol
  {
    std::string name;
    std::vector<TemperatureStep> steps;

    /** Minutes to move between differing set-points. */
    double ramp_time;

    /** Minutes, from the end of each hold, used for analysis. */
    double analysis_time;

    ProtocolMode mode;
    int num_reactors;

    TemperatureProtocol();

    /** Throws std::runtime_error describing the first problem found:
     - no steps
     - a non-positive (or non-finite) hold time
     - negative ramp time, or non-positive analysis time
     - `num_reactors < 1`
     - in standard mode, a reactor id other than 1
     - in semi-auto mode, a reactor id outside [1, num_reactors]
     */
    void check_valid() const;

    /** Ramp time in seconds spent after step \p index before the next step starts; zero for the last
     step, or if the next step has an identical nominal temperature.
     */
    double ramp_after_step_seconds( const size_t index ) const;

    /** Offset, in seconds from the start of the recording, where each step's hold begins. */
    std::vector<double> hold_start_offsets_seconds() const;

    /** Seconds from the start of the first hold to the end of the last one. */
    double total_duration_seconds() const;

    /** The sorted, unique, reactor ids referenced by the steps. */
    std::vector<int> reactor_ids() const;
  };//struct TemperatureProtocol


  /** 500 to 150 C in 50 C steps, 20 minute holds, 10 minute ramps, last 10 minutes analyzed. */
  LightOff_API TemperatureProtocol default_protocol();
}//namespace Protocol

#endif //Protocol_h
