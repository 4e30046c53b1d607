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
#include <iostream>
#include <algorithm>
#include <stdexcept>

#include "SpecUtils/Filesystem.h"
#include "SpecUtils/StringAlgo.h"

#include "LightOff/Protocol.h"
#include "LightOff/TimeSeries.h"
#include "LightOff/SigmoidFit.h"
#include "LightOff/Calibration.h"
#include "LightOff/AscFileReader.h"
#include "LightOff/StepSegmenter.h"
#include "LightOff/ActivityAnalysis.h"
#include "LightOff/ConversionReducer.h"

using namespace std;

namespace
{
  string display_name_from_path( const string &path )
  {
    string name = SpecUtils::filename( path );
    const string ext = SpecUtils::file_extension( name );
    if( !ext.empty() && (ext.size() < name.size()) )
      name = name.substr( 0, name.size() - ext.size() );
    return name;
  }//display_name_from_path(...)
}//namespace


namespace ActivityAnalysis
{

AnalysisOptions::AnalysisOptions()
  : calibration( Calibration::default_curve() ),
    auto_intercept( true ),
    fit_model( SigmoidFit::SigmoidFitModel::Constrained ),
    tx_targets{ 20.0, 50.0, 80.0 },
    num_curve_points( 300 ),
    curve_padding( 20.0 )
{
}


RecordingAnalysis analyze_recording( const TimeSeries &series,
                                     const Protocol::TemperatureProtocol &protocol,
                                     const AnalysisOptions &options )
{
  protocol.check_valid();
  series.check_valid();

  RecordingAnalysis analysis;
  analysis.success = true;
  analysis.protocol = protocol;
  analysis.series = series;
  analysis.num_steps_expected = protocol.steps.size();
  analysis.recording_duration = series.duration();
  analysis.required_duration = protocol.total_duration_seconds();

  if( series.empty() )
    analysis.warnings.push_back( "Recording contains no data points." );
  else if( analysis.recording_duration < analysis.required_duration )
  {
    stringstream msg;
    msg << "Recording is " << (analysis.recording_duration / 60.0) << " minutes long, but the protocol"
        << " requires " << (analysis.required_duration / 60.0) << " minutes; later steps may be missing.";
    analysis.warnings.push_back( msg.str() );
  }

  analysis.windows = StepSegmenter::segment_steps( series, protocol );
  analysis.num_steps_found = analysis.windows.size();

  if( analysis.num_steps_found != analysis.num_steps_expected )
  {
    analysis.warnings.push_back( "Only detected " + std::to_string(analysis.num_steps_found) + "/"
                                 + std::to_string(analysis.num_steps_expected)
                                 + " temperature steps in the recording." );
  }

  const map<int,ConversionReducer::ReactorActivity> activities
        = ConversionReducer::reduce( analysis.windows, options.calibration, options.auto_intercept );

  for( const auto &id_activity : activities )
  {
    const int reactor_id = id_activity.first;

    ReactorResult &reactor = analysis.reactors[reactor_id];
    reactor.activity = id_activity.second;

    SigmoidFit::SigmoidFitter fitter( options.fit_model );
    if( !fitter.fit( reactor.activity.temperatures(), reactor.activity.conversions() ) )
    {
      reactor.fit = fitter.result();
      analysis.warnings.push_back( "Reactor " + std::to_string(reactor_id) + ": sigmoid fit failed ("
                                   + string(SigmoidFit::to_string(reactor.fit.m_status)) + "): "
                                   + reactor.fit.m_error_message );
      continue;
    }//if( fit failed )

    reactor.fit = fitter.result();
    reactor.tx_values = fitter.tx_values( options.tx_targets );

    const vector<double> temps = reactor.activity.temperatures();
    const auto minmax = std::minmax_element( begin(temps), end(temps) );
    SigmoidFit::fitted_curve( reactor.fit,
                              *minmax.first - options.curve_padding,
                              *minmax.second + options.curve_padding,
                              options.num_curve_points,
                              reactor.curve_temperatures, reactor.curve_conversions );
  }//for( const auto &id_activity : activities )

  return analysis;
}//analyze_recording(...)


RecordingAnalysis analyze_file( const std::string &filename,
                                const Protocol::TemperatureProtocol &protocol,
                                const AnalysisOptions &options )
{
  protocol.check_valid();

  TimeSeries series;
  try
  {
    series = AscFileReader::read_asc_file( filename );
    series.check_valid();
  }catch( std::exception &e )
  {
    RecordingAnalysis failed;
    failed.source_path = filename;
    failed.display_name = display_name_from_path( filename );
    failed.success = false;
    failed.protocol = protocol;
    failed.num_steps_expected = protocol.steps.size();
    failed.required_duration = protocol.total_duration_seconds();
    failed.warnings.push_back( e.what() );

    cerr << "Failed to read '" << filename << "': " << e.what() << endl;

    return failed;
  }//try / catch

  RecordingAnalysis analysis = analyze_recording( series, protocol, options );
  analysis.source_path = filename;
  analysis.display_name = display_name_from_path( filename );

  return analysis;
}//analyze_file(...)


vector<RecordingAnalysis> analyze_files( const vector<string> &filenames,
                                         const Protocol::TemperatureProtocol &protocol,
                                         const AnalysisOptions &options,
                                         const vector<string> &sample_names )
{
  protocol.check_valid();

  if( !sample_names.empty() && (sample_names.size() != filenames.size()) )
    throw runtime_error( "Number of sample names (" + std::to_string(sample_names.size())
                         + ") does not match the number of files (" + std::to_string(filenames.size()) + ")" );

  vector<RecordingAnalysis> answer;
  for( size_t i = 0; i < filenames.size(); ++i )
  {
    answer.push_back( analyze_file( filenames[i], protocol, options ) );

    if( !sample_names.empty() )
    {
      const string name = SpecUtils::trim_copy( sample_names[i] );
      if( !name.empty() )
        answer.back().display_name = name;
    }
  }//for( size_t i = 0; i < filenames.size(); ++i )

  return answer;
}//analyze_files(...)

}//namespace ActivityAnalysis
