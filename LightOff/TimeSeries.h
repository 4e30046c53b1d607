#ifndef TimeSeries_h
#define TimeSeries_h
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


/** A recorded absorbance trace, as read from an FT-IR export.

 Times are in seconds, and are expected to be non-decreasing; the first time does not need to be
 zero, as all protocol offsets are taken relative to it.
 */
struct LightOff_API TimeSeries
{
  std::vector<double> times;
  std::vector<double> intensities;

  size_t size() const { return times.size(); }
  bool empty() const { return times.empty(); }

  /** Returns `times.back() - times.front()`, or 0.0 if empty. */
  double duration() const;

  /** Throws std::runtime_error if the time and intensity arrays differ in length, or times decrease. */
  void check_valid() const;
};//struct TimeSeries

#endif //TimeSeries_h
