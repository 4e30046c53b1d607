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

#include <cmath>
#include <random>
#include <string>
#include <vector>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

#define BOOST_TEST_MODULE test_ActivityAnalysis_suite
#include <boost/test/included/unit_test.hpp>

#include "SpecUtils/Filesystem.h"

#include "LightOff/Protocol.h"
#include "LightOff/TimeSeries.h"
#include "LightOff/SigmoidFit.h"
#include "LightOff/Calibration.h"
#include "LightOff/ActivityAnalysis.h"

using namespace std;

namespace
{
  double light_off( const double temp, const double b, const double c )
  {
    return 100.0 / (1.0 + std::exp( -b*(temp - c) ));
  }

  /** Builds a recording following \p protocol, sampled every 6 seconds, where each hold has the
   intensity that gives \p step_conversions with the default calibration slope, and the intensity
   changes linearly during ramps.
   */
  TimeSeries synthetic_recording( const Protocol::TemperatureProtocol &protocol,
                                  const vector<double> &step_conversions,
                                  const double noise_sigma,
                                  const double end_time = -1.0 )
  {
    const double full_intensity = 100.0 / 995.32;
    vector<double> step_intensities;
    for( const double conv : step_conversions )
      step_intensities.push_back( full_intensity * (1.0 - conv/100.0) );

    const vector<double> offsets = protocol.hold_start_offsets_seconds();
    const double last_time = (end_time >= 0.0) ? end_time : protocol.total_duration_seconds();

    std::mt19937 gen( 12345 );  // Fixed seed for reproducible tests
    std::normal_distribution<double> noise( 0.0, (noise_sigma > 0.0) ? noise_sigma : 1.0 );

    TimeSeries series;
    for( int k = 0; (6.0*k) <= last_time; ++k )
    {
      const double t = 6.0*k;

      size_t step = 0;
      while( (step + 1) < offsets.size() && t >= offsets[step+1] )
        ++step;

      const double hold_end = offsets[step] + 60.0*protocol.steps[step].hold_time;
      double intensity = step_intensities[step];
      if( (t > hold_end) && ((step + 1) < offsets.size()) )
      {
        const double frac = (t - hold_end) / (offsets[step+1] - hold_end);
        intensity += frac * (step_intensities[step+1] - step_intensities[step]);
      }

      if( noise_sigma > 0.0 )
        intensity += noise( gen );

      series.times.push_back( t );
      series.intensities.push_back( intensity );
    }//for( loop over samples )

    return series;
  }//synthetic_recording(...)


  vector<double> protocol_conversions( const Protocol::TemperatureProtocol &protocol,
                                       const double b, const double c )
  {
    vector<double> convs;
    for( const Protocol::TemperatureStep &step : protocol.steps )
      convs.push_back( light_off( step.temperature, b, c ) );
    return convs;
  }


  void write_asc( const string &filename, const TimeSeries &series )
  {
    ofstream output( filename.c_str(), ios::binary | ios::out );
    output << "TITLE\tsynthetic\n#DATA\n" << std::setprecision(12);
    for( size_t i = 0; i < series.size(); ++i )
      output << series.times[i] << "\t" << series.intensities[i] << "\n";
  }
}//namespace


BOOST_AUTO_TEST_CASE( test_standard_protocol_end_to_end )
{
  const double b = 0.05, c = 300.0;
  const Protocol::TemperatureProtocol protocol = Protocol::default_protocol();
  const TimeSeries series = synthetic_recording( protocol, protocol_conversions( protocol, b, c ), 2.0E-5 );

  BOOST_REQUIRE_CLOSE( series.times.back(), 13800.0, 1.0E-9 );

  const ActivityAnalysis::AnalysisOptions options;
  BOOST_CHECK( options.auto_intercept );
  BOOST_CHECK( options.fit_model == SigmoidFit::SigmoidFitModel::Constrained );
  BOOST_REQUIRE_EQUAL( options.tx_targets.size(), 3 );

  const ActivityAnalysis::RecordingAnalysis result
                                   = ActivityAnalysis::analyze_recording( series, protocol, options );

  BOOST_CHECK( result.success );
  BOOST_CHECK_EQUAL( result.num_steps_expected, 8 );
  BOOST_CHECK_EQUAL( result.num_steps_found, 8 );
  BOOST_CHECK_EQUAL( result.windows.size(), 8 );
  BOOST_CHECK_CLOSE( result.required_duration, 13800.0, 1.0E-9 );
  BOOST_CHECK_CLOSE( result.recording_duration, 13800.0, 1.0E-9 );
  BOOST_CHECK_MESSAGE( result.warnings.empty(),
                       "Unexpected warning: " << (result.warnings.empty() ? string() : result.warnings[0]) );

  BOOST_REQUIRE_EQUAL( result.reactors.size(), 1 );
  BOOST_REQUIRE( result.reactors.count(1) );

  const ActivityAnalysis::ReactorResult &reactor = result.reactors.at(1);
  BOOST_REQUIRE_EQUAL( reactor.activity.samples.size(), 8 );

  // Each window is the last 10 minutes of a hold at one sample per 6 seconds, edges included
  for( const auto &sample : reactor.activity.samples )
    BOOST_CHECK_EQUAL( sample.data_points, 101 );

  // 150 C has the highest intensity, so with auto-intercept it is zero conversion
  BOOST_CHECK_EQUAL( reactor.activity.samples.back().temperature, 150.0 );
  BOOST_CHECK_SMALL( reactor.activity.samples.back().conversion, 0.05 );
  BOOST_CHECK_CLOSE( reactor.activity.samples.front().conversion, 100.0, 0.5 );

  BOOST_REQUIRE_MESSAGE( reactor.fit.fitted(), "Fit failed: " << reactor.fit.m_error_message );
  BOOST_CHECK_GT( reactor.fit.m_r_squared, 0.95 );
  BOOST_CHECK_CLOSE( reactor.fit.m_inflection_temperature, c, 0.5 );
  BOOST_CHECK_CLOSE( reactor.fit.m_growth_rate, b, 5.0 );

  BOOST_REQUIRE_EQUAL( reactor.tx_values.size(), 3 );
  BOOST_CHECK_EQUAL( reactor.tx_values[0].label, "T20" );
  BOOST_CHECK_EQUAL( reactor.tx_values[1].label, "T50" );
  BOOST_CHECK_EQUAL( reactor.tx_values[2].label, "T80" );
  BOOST_REQUIRE( reactor.tx_values[1].temperature.has_value() );
  BOOST_CHECK_CLOSE( *reactor.tx_values[1].temperature, c, 0.5 );

  BOOST_REQUIRE_EQUAL( reactor.curve_temperatures.size(), 300 );
  BOOST_REQUIRE_EQUAL( reactor.curve_conversions.size(), 300 );
  BOOST_CHECK_CLOSE( reactor.curve_temperatures.front(), 130.0, 1.0E-9 );
  BOOST_CHECK_CLOSE( reactor.curve_temperatures.back(), 520.0, 1.0E-9 );
}


BOOST_AUTO_TEST_CASE( test_short_recording )
{
  const Protocol::TemperatureProtocol protocol = Protocol::default_protocol();
  const TimeSeries series = synthetic_recording( protocol, protocol_conversions( protocol, 0.05, 300.0 ),
                                                 0.0, 7000.0 );

  const ActivityAnalysis::RecordingAnalysis result
              = ActivityAnalysis::analyze_recording( series, protocol, ActivityAnalysis::AnalysisOptions() );

  // Holds start at 0, 1800, 3600, 5400, 7200, ... seconds, so only four steps are present
  BOOST_CHECK_EQUAL( result.num_steps_found, 4 );
  BOOST_CHECK_EQUAL( result.num_steps_expected, 8 );
  BOOST_CHECK_LT( result.recording_duration, result.required_duration );

  bool found_duration_warning = false, found_steps_warning = false;
  for( const string &warning : result.warnings )
  {
    found_duration_warning |= (warning.find( "minutes long" ) != string::npos);
    found_steps_warning |= (warning.find( "4/8" ) != string::npos);
  }
  BOOST_CHECK( found_duration_warning );
  BOOST_CHECK( found_steps_warning );

  // Raw points are still available
  BOOST_REQUIRE_EQUAL( result.reactors.size(), 1 );
  BOOST_CHECK_EQUAL( result.reactors.at(1).activity.samples.size(), 4 );
}


BOOST_AUTO_TEST_CASE( test_failed_fit_keeps_points )
{
  // With auto-intercept off and a zero slope, every conversion is the intercept
  const Protocol::TemperatureProtocol protocol = Protocol::default_protocol();
  const TimeSeries series = synthetic_recording( protocol, protocol_conversions( protocol, 0.05, 300.0 ), 0.0 );

  ActivityAnalysis::AnalysisOptions options;
  options.auto_intercept = false;
  options.calibration.slope = 0.0;
  options.calibration.intercept = 42.0;

  const ActivityAnalysis::RecordingAnalysis result = ActivityAnalysis::analyze_recording( series, protocol, options );
  BOOST_REQUIRE_EQUAL( result.reactors.size(), 1 );

  const ActivityAnalysis::ReactorResult &reactor = result.reactors.at(1);
  BOOST_CHECK( !reactor.fit.fitted() );
  BOOST_CHECK( reactor.fit.m_status == SigmoidFit::SigmoidFitStatus::DegenerateData );
  BOOST_CHECK_EQUAL( reactor.activity.samples.size(), 8 );
  BOOST_CHECK_CLOSE( reactor.activity.samples[3].conversion, 42.0, 1.0E-9 );
  BOOST_CHECK( reactor.tx_values.empty() );
  BOOST_CHECK( reactor.curve_temperatures.empty() );

  bool found_fit_warning = false;
  for( const string &warning : result.warnings )
    found_fit_warning |= (warning.find( "fit failed" ) != string::npos);
  BOOST_CHECK( found_fit_warning );
}


BOOST_AUTO_TEST_CASE( test_semi_auto_reactors )
{
  Protocol::TemperatureProtocol protocol;
  protocol.name = "Two reactors";
  protocol.mode = Protocol::ProtocolMode::SemiAuto;
  protocol.num_reactors = 2;
  protocol.ramp_time = 10.0;
  protocol.analysis_time = 10.0;
  for( const double temp : { 400.0, 300.0, 200.0 } )
  {
    protocol.steps.emplace_back( temp, 20.0, 1 );
    protocol.steps.emplace_back( temp, 20.0, 2 );
  }

  // Reactor 2 lights off 50 C later than reactor 1
  vector<double> convs;
  for( const Protocol::TemperatureStep &step : protocol.steps )
    convs.push_back( light_off( step.temperature, 0.05, (step.reactor_id == 1) ? 280.0 : 330.0 ) );

  const TimeSeries series = synthetic_recording( protocol, convs, 0.0 );
  const ActivityAnalysis::RecordingAnalysis result
              = ActivityAnalysis::analyze_recording( series, protocol, ActivityAnalysis::AnalysisOptions() );

  BOOST_CHECK_EQUAL( result.num_steps_found, 6 );
  BOOST_REQUIRE_EQUAL( result.reactors.size(), 2 );

  const ActivityAnalysis::ReactorResult &r1 = result.reactors.at(1);
  const ActivityAnalysis::ReactorResult &r2 = result.reactors.at(2);
  BOOST_REQUIRE_EQUAL( r1.activity.samples.size(), 3 );
  BOOST_REQUIRE_EQUAL( r2.activity.samples.size(), 3 );

  for( size_t i = 0; i < 3; ++i )
  {
    BOOST_CHECK_EQUAL( r1.activity.samples[i].temperature, r2.activity.samples[i].temperature );
    BOOST_CHECK_EQUAL( r1.activity.samples[i].step_index, 2*i );
    BOOST_CHECK_EQUAL( r2.activity.samples[i].step_index, 2*i + 1 );
  }

  // Each reactor's lowest temperature is its own zero
  BOOST_CHECK_SMALL( r1.activity.samples[2].conversion, 1.0E-6 );
  BOOST_CHECK_SMALL( r2.activity.samples[2].conversion, 1.0E-6 );
  BOOST_CHECK( r1.activity.calibration.intercept != r2.activity.calibration.intercept );

  BOOST_REQUIRE_MESSAGE( r1.fit.fitted(), "Reactor 1 fit failed: " << r1.fit.m_error_message );
  BOOST_REQUIRE_MESSAGE( r2.fit.fitted(), "Reactor 2 fit failed: " << r2.fit.m_error_message );
  BOOST_CHECK_GT( r2.fit.m_inflection_temperature, r1.fit.m_inflection_temperature + 20.0 );
}


BOOST_AUTO_TEST_CASE( test_invalid_input_throws )
{
  Protocol::TemperatureProtocol protocol = Protocol::default_protocol();
  protocol.analysis_time = 0.0;

  const TimeSeries series = synthetic_recording( Protocol::default_protocol(), vector<double>( 8, 50.0 ), 0.0 );
  BOOST_CHECK_THROW( ActivityAnalysis::analyze_recording( series, protocol, ActivityAnalysis::AnalysisOptions() ),
                     std::runtime_error );

  TimeSeries mismatched = series;
  mismatched.times.pop_back();
  BOOST_CHECK_THROW( ActivityAnalysis::analyze_recording( mismatched, Protocol::default_protocol(),
                                                          ActivityAnalysis::AnalysisOptions() ),
                     std::runtime_error );
}


BOOST_AUTO_TEST_CASE( test_analyze_files )
{
  const Protocol::TemperatureProtocol protocol = Protocol::default_protocol();
  const string dir = SpecUtils::temp_file_name( "lightoff_analysis_test", SpecUtils::temp_dir() );
  SpecUtils::create_directory( dir );
  BOOST_REQUIRE( SpecUtils::is_directory( dir ) );

  const string good_file = SpecUtils::append_path( dir, "catalyst_a.asc" );
  const string missing_file = SpecUtils::append_path( dir, "catalyst_b.asc" );
  write_asc( good_file, synthetic_recording( protocol, protocol_conversions( protocol, 0.05, 310.0 ), 0.0 ) );

  const vector<ActivityAnalysis::RecordingAnalysis> results
        = ActivityAnalysis::analyze_files( { missing_file, good_file }, protocol, ActivityAnalysis::AnalysisOptions() );

  BOOST_REQUIRE_EQUAL( results.size(), 2 );

  BOOST_CHECK( !results[0].success );
  BOOST_CHECK_EQUAL( results[0].source_path, missing_file );
  BOOST_CHECK_EQUAL( results[0].display_name, "catalyst_b" );
  BOOST_CHECK( !results[0].warnings.empty() );
  BOOST_CHECK( results[0].reactors.empty() );

  BOOST_CHECK( results[1].success );
  BOOST_CHECK_EQUAL( results[1].display_name, "catalyst_a" );
  BOOST_CHECK_EQUAL( results[1].num_steps_found, 8 );
  BOOST_REQUIRE_EQUAL( results[1].reactors.size(), 1 );
  BOOST_REQUIRE( results[1].reactors.at(1).fit.fitted() );
  BOOST_CHECK_CLOSE( results[1].reactors.at(1).fit.m_inflection_temperature, 310.0, 0.5 );

  // User supplied sample names replace the filename; blank ones keep it
  const vector<ActivityAnalysis::RecordingAnalysis> named
        = ActivityAnalysis::analyze_files( { good_file, missing_file }, protocol,
                                           ActivityAnalysis::AnalysisOptions(), { " Pt/Al2O3 fresh ", "" } );
  BOOST_REQUIRE_EQUAL( named.size(), 2 );
  BOOST_CHECK_EQUAL( named[0].display_name, "Pt/Al2O3 fresh" );
  BOOST_CHECK_EQUAL( named[0].source_path, good_file );
  BOOST_CHECK_EQUAL( named[1].display_name, "catalyst_b" );

  BOOST_CHECK_THROW( ActivityAnalysis::analyze_files( { good_file, missing_file }, protocol,
                                                      ActivityAnalysis::AnalysisOptions(), { "only one" } ),
                     std::runtime_error );

  SpecUtils::remove_file( good_file );
}
