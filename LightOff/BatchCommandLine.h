#ifndef BatchCommandLine_h
#define BatchCommandLine_h
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

#include "LightOff/Protocol.h"

static_assert( USE_BATCH_TOOLS, "You must have USE_BATCH_TOOLS enabled to build this code" );


namespace BatchCommandLine
{
  /** Builds the protocol from the "protocol.*" option values.

   If \p temperatures is empty the standard protocol steps are used; \p hold_times and \p reactors
   may either have a single entry, applied to every step, or one entry per step, or be empty to keep
   the defaults (20 minutes, reactor 1).

   Throws std::runtime_error if the list lengths dont match, or the resulting protocol is invalid.
   */
  LightOff_API Protocol::TemperatureProtocol make_protocol( const std::string &name,
                                                            const std::vector<double> &temperatures,
                                                            const std::vector<double> &hold_times,
                                                            const std::vector<int> &reactors,
                                                            const double ramp_time,
                                                            const double analysis_time,
                                                            const std::string &mode,
                                                            const int num_reactors );

  /** Runs the batch analysis using the command line arguments, returning the exit code. */
  LightOff_API int run_batch_command( int argc, char **argv );
}//namespace BatchCommandLine

#endif //BatchCommandLine_h
