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

#include <set>
#include <cmath>
#include <string>
#include <vector>
#include <stdexcept>

#include "SpecUtils/StringAlgo.h"

#include "LightOff/Protocol.h"

using namespace std;

namespace Protocol
{

const char *to_string( const ProtocolMode mode )
{
  switch( mode )
  {
    case ProtocolMode::Standard: return "standard";
    case ProtocolMode::SemiAuto: return "semi_auto";
  }
  return "invalid";
}//to_string( ProtocolMode )


ProtocolMode mode_from_string( const std::string &input )
{
  const string str = SpecUtils::trim_copy( input );

  if( SpecUtils::iequals_ascii( str, "standard" ) )
    return ProtocolMode::Standard;

  if( SpecUtils::iequals_ascii( str, "semi_auto" ) || SpecUtils::iequals_ascii( str, "semi-auto" ) )
    return ProtocolMode::SemiAuto;

  throw runtime_error( "Invalid protocol mode '" + input + "' (must be 'standard' or 'semi_auto')" );
}//mode_from_string(...)


TemperatureStep::TemperatureStep( const double temp, const double hold_minutes, const int reactor )
  : temperature( temp ),
    hold_time( hold_minutes ),
    reactor_id( reactor )
{
}


TemperatureProtocol::TemperatureProtocol()
  : name(),
    steps(),
    ramp_time( 0.0 ),
    analysis_time( 0.0 ),
    mode( ProtocolMode::Standard ),
    num_reactors( 1 )
{
}


void TemperatureProtocol::check_valid() const
{
  const string prefix = "Protocol '" + name + "': ";

  if( steps.empty() )
    throw runtime_error( prefix + "must have at least one temperature step" );

  if( !std::isfinite(ramp_time) || (ramp_time < 0.0) )
    throw runtime_error( prefix + "ramp time must not be negative" );

  if( !std::isfinite(analysis_time) || (analysis_time <= 0.0) )
    throw runtime_error( prefix + "analysis time must be positive" );

  if( num_reactors < 1 )
    throw runtime_error( prefix + "number of reactors must be at least 1" );

  for( size_t i = 0; i < steps.size(); ++i )
  {
    const TemperatureStep &step = steps[i];
    const string stepstr = "step " + std::to_string(i+1) + " ";

    if( !std::isfinite(step.temperature) )
      throw runtime_error( prefix + stepstr + "has an invalid temperature" );

    if( !std::isfinite(step.hold_time) || (step.hold_time <= 0.0) )
      throw runtime_error( prefix + stepstr + "must have a positive hold time" );

    switch( mode )
    {
      case ProtocolMode::Standard:
        if( step.reactor_id != 1 )
          throw runtime_error( prefix + stepstr + "is assigned to reactor "
                               + std::to_string(step.reactor_id)
                               + ", but standard mode only uses reactor 1" );
        break;

      case ProtocolMode::SemiAuto:
        if( (step.reactor_id < 1) || (step.reactor_id > num_reactors) )
          throw runtime_error( prefix + stepstr + "is assigned to reactor "
                               + std::to_string(step.reactor_id) + ", which is outside of 1 to "
                               + std::to_string(num_reactors) );
        break;
    }//switch( mode )
  }//for( size_t i = 0; i < steps.size(); ++i )
}//void check_valid() const


double TemperatureProtocol::ramp_after_step_seconds( const size_t index ) const
{
  if( (index + 1) >= steps.size() )
    return 0.0;

  //Consecutive steps at the same set-point (e.g., alternating reactors in semi-auto mode) dont
  //  need any time to change temperature.
  if( steps[index].temperature == steps[index+1].temperature )
    return 0.0;

  return 60.0 * ramp_time;
}//ramp_after_step_seconds(...)


vector<double> TemperatureProtocol::hold_start_offsets_seconds() const
{
  vector<double> offsets( steps.size(), 0.0 );

  double cumulative_time = 0.0;
  for( size_t i = 0; i < steps.size(); ++i )
  {
    offsets[i] = cumulative_time;
    cumulative_time += 60.0*steps[i].hold_time + ramp_after_step_seconds( i );
  }

  return offsets;
}//hold_start_offsets_seconds()


double TemperatureProtocol::total_duration_seconds() const
{
  if( steps.empty() )
    return 0.0;

  return hold_start_offsets_seconds().back() + 60.0*steps.back().hold_time;
}//total_duration_seconds()


vector<int> TemperatureProtocol::reactor_ids() const
{
  set<int> ids;
  for( const TemperatureStep &step : steps )
    ids.insert( step.reactor_id );
  return vector<int>( begin(ids), end(ids) );
}//reactor_ids()


TemperatureProtocol default_protocol()
{
  TemperatureProtocol protocol;
  protocol.name = "Standard Protocol (500-150C)";
  for( double temp = 500.0; temp >= 150.0; temp -= 50.0 )
    protocol.steps.emplace_back( temp, 20.0, 1 );
  protocol.ramp_time = 10.0;
  protocol.analysis_time = 10.0;
  protocol.mode = ProtocolMode::Standard;
  protocol.num_reactors = 1;

  return protocol;
}//default_protocol()

}//namespace Protocol
