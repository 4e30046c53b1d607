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

#include <cmath>
#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

#define BOOST_TEST_MODULE test_BatchAnalysis_suite
#include <boost/test/included/unit_test.hpp>

#include "nlohmann/json.hpp"

#include "SpecUtils/Filesystem.h"
#include "SpecUtils/StringAlgo.h"

#include "LightOff/Protocol.h"
#include "LightOff/TimeSeries.h"
#include "LightOff/SigmoidFit.h"
#include "LightOff/BatchAnalysis.h"
#include "LightOff/ActivityAnalysis.h"
#include "LightOff/BatchCommandLine.h"

using namespace std;

namespace
{
  /** Writes a recording of the default protocol, where the catalyst has a light-off temperature
   of \p c, sampled every 6 seconds, with the intensity ramping linearly between holds.
   */
  void write_default_protocol_asc( const string &filename, const double c )
  {
    const Protocol::TemperatureProtocol protocol = Protocol::default_protocol();
    const vector<double> offsets = protocol.hold_start_offsets_seconds();

    vector<double> step_intensities;
    for( const Protocol::TemperatureStep &step : protocol.steps )
    {
      const double conv = 100.0 / (1.0 + std::exp( -0.05*(step.temperature - c) ));
      step_intensities.push_back( (100.0 / 995.32) * (1.0 - conv/100.0) );
    }

    ofstream output( filename.c_str(), ios::binary | ios::out );
    output << "TITLE\t" << filename << "\n#DATA\n" << std::setprecision(12);

    for( int k = 0; (6.0*k) <= protocol.total_duration_seconds(); ++k )
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

      output << t << "\t" << intensity << "\n";
    }//for( loop over samples )
  }//write_default_protocol_asc(...)


  bool comparison_table_contains( const vector<ActivityAnalysis::RecordingAnalysis> &results, const string &text )
  {
    const string table = BatchAnalysis::comparison_table_text( results, { 50.0 } );
    return (table.find( text ) != string::npos);
  }


  string make_test_dir( const string &base )
  {
    const string dir = SpecUtils::temp_file_name( base, SpecUtils::temp_dir() );
    SpecUtils::create_directory( dir );
    return dir;
  }
}//namespace


BOOST_AUTO_TEST_CASE( test_make_protocol )
{
  // Nothing given gives the standard protocol
  const Protocol::TemperatureProtocol def
            = BatchCommandLine::make_protocol( "", {}, {}, {}, 10.0, 10.0, "standard", 1 );
  const Protocol::TemperatureProtocol expected = Protocol::default_protocol();
  BOOST_REQUIRE_EQUAL( def.steps.size(), expected.steps.size() );
  BOOST_CHECK_EQUAL( def.name, expected.name );
  for( size_t i = 0; i < def.steps.size(); ++i )
  {
    BOOST_CHECK_EQUAL( def.steps[i].temperature, expected.steps[i].temperature );
    BOOST_CHECK_EQUAL( def.steps[i].hold_time, 20.0 );
    BOOST_CHECK_EQUAL( def.steps[i].reactor_id, 1 );
  }

  // A single hold time applies to every step
  const Protocol::TemperatureProtocol custom
          = BatchCommandLine::make_protocol( "", { 400.0, 300.0, 200.0 }, { 15.0 }, {}, 5.0, 8.0, "Standard", 1 );
  BOOST_CHECK_EQUAL( custom.name, "Custom Protocol" );
  BOOST_REQUIRE_EQUAL( custom.steps.size(), 3 );
  for( const Protocol::TemperatureStep &step : custom.steps )
    BOOST_CHECK_EQUAL( step.hold_time, 15.0 );
  BOOST_CHECK_EQUAL( custom.ramp_time, 5.0 );
  BOOST_CHECK_EQUAL( custom.analysis_time, 8.0 );
  BOOST_CHECK( custom.mode == Protocol::ProtocolMode::Standard );

  // Per-step hold times, and a name
  const Protocol::TemperatureProtocol named
    = BatchCommandLine::make_protocol( "Fast screen", { 400.0, 300.0 }, { 20.0, 30.0 }, {}, 10.0, 10.0, "standard", 1 );
  BOOST_CHECK_EQUAL( named.name, "Fast screen" );
  BOOST_REQUIRE_EQUAL( named.steps.size(), 2 );
  BOOST_CHECK_EQUAL( named.steps[1].hold_time, 30.0 );

  // Semi-auto, alternating reactors
  const Protocol::TemperatureProtocol semi
    = BatchCommandLine::make_protocol( "", { 400.0, 400.0, 300.0, 300.0 }, { 20.0 }, { 1, 2, 1, 2 },
                                       10.0, 10.0, "semi_auto", 2 );
  BOOST_CHECK( semi.mode == Protocol::ProtocolMode::SemiAuto );
  BOOST_CHECK_EQUAL( semi.num_reactors, 2 );
  BOOST_REQUIRE_EQUAL( semi.steps.size(), 4 );
  BOOST_CHECK_EQUAL( semi.steps[1].reactor_id, 2 );
  BOOST_CHECK_EQUAL( semi.steps[2].reactor_id, 1 );

  // Mismatched list lengths
  BOOST_CHECK_THROW( BatchCommandLine::make_protocol( "", { 400.0, 300.0, 200.0 }, { 20.0, 30.0 }, {},
                                                      10.0, 10.0, "standard", 1 ), std::runtime_error );
  BOOST_CHECK_THROW( BatchCommandLine::make_protocol( "", { 400.0, 300.0, 200.0 }, {}, { 1, 1 },
                                                      10.0, 10.0, "standard", 1 ), std::runtime_error );

  // Reactor 2 isnt allowed in standard mode
  BOOST_CHECK_THROW( BatchCommandLine::make_protocol( "", { 400.0, 300.0 }, {}, { 1, 2 },
                                                      10.0, 10.0, "standard", 1 ), std::runtime_error );

  // Invalid mode, and invalid analysis time
  BOOST_CHECK_THROW( BatchCommandLine::make_protocol( "", {}, {}, {}, 10.0, 10.0, "automatic", 1 ),
                     std::runtime_error );
  BOOST_CHECK_THROW( BatchCommandLine::make_protocol( "", {}, {}, {}, 10.0, 0.0, "standard", 1 ),
                     std::runtime_error );
}


BOOST_AUTO_TEST_CASE( test_suggested_output_filename )
{
  BatchAnalysis::BatchAnalysisOptions options;
  options.output_dir = SpecUtils::temp_dir();

  const string input = SpecUtils::append_path( SpecUtils::append_path( "data", "july" ), "run1.asc" );
  const string csv_name = BatchAnalysis::suggested_output_filename( input, "_conversion.csv", options );
  BOOST_CHECK_EQUAL( csv_name, SpecUtils::append_path( options.output_dir, "run1_conversion.csv" ) );

  const string json_name = BatchAnalysis::suggested_output_filename( "run2", "_results.json", options );
  BOOST_CHECK_EQUAL( json_name, SpecUtils::append_path( options.output_dir, "run2_results.json" ) );
}


BOOST_AUTO_TEST_CASE( test_results_outputs )
{
  const string dir = make_test_dir( "lightoff_batch_outputs" );
  BOOST_REQUIRE( SpecUtils::is_directory( dir ) );

  const string filename = SpecUtils::append_path( dir, "pt_catalyst.asc" );
  write_default_protocol_asc( filename, 290.0 );

  const Protocol::TemperatureProtocol protocol = Protocol::default_protocol();
  const BatchAnalysis::BatchAnalysisOptions options;
  const ActivityAnalysis::RecordingAnalysis result = ActivityAnalysis::analyze_file( filename, protocol, options );
  BOOST_REQUIRE( result.success );
  BOOST_REQUIRE_EQUAL( result.reactors.size(), 1 );
  BOOST_REQUIRE( result.reactors.at(1).fit.fitted() );

  // CSV has the detail table, the fit table, and the TX table, separated by blank lines
  stringstream csv;
  BatchAnalysis::write_results_csv( csv, result );

  vector<string> lines;
  string line;
  while( std::getline( csv, line ) )
  {
    SpecUtils::trim( line );
    lines.push_back( line );
  }

  BOOST_REQUIRE_EQUAL( lines.size(), 1 + 8 + 1 + 2 + 1 + 1 + 3 );
  BOOST_CHECK_EQUAL( lines[0], "Reactor,Temperature_C,Avg_Intensity,Conversion_%,Data_Points" );
  BOOST_CHECK( SpecUtils::starts_with( lines[1], "1,500," ) );
  BOOST_CHECK( lines[9].empty() );
  BOOST_CHECK_EQUAL( lines[10], "Reactor,Model,Status,Growth_Rate_b,Inflection_Temperature_C,Upper_a,Lower_d,R_Squared" );
  BOOST_CHECK( SpecUtils::starts_with( lines[11], "1,constrained,Success," ) );
  BOOST_CHECK( lines[12].empty() );
  BOOST_CHECK_EQUAL( lines[13], "Reactor,TX,Target_%,Temperature_C" );
  BOOST_CHECK( SpecUtils::starts_with( lines[14], "1,T20,20," ) );
  BOOST_CHECK( SpecUtils::starts_with( lines[15], "1,T50,50," ) );
  BOOST_CHECK( SpecUtils::starts_with( lines[16], "1,T80,80," ) );

  // JSON
  nlohmann::json data;
  BatchAnalysis::add_recording_results_to_json( data, result );
  BOOST_CHECK_EQUAL( data["Filename"].get<string>(), "pt_catalyst.asc" );
  BOOST_CHECK_EQUAL( data["DisplayName"].get<string>(), "pt_catalyst" );
  BOOST_CHECK( data["Success"].get<bool>() );
  BOOST_CHECK_EQUAL( data["NumStepsFound"].get<size_t>(), 8 );
  BOOST_REQUIRE_EQUAL( data["Reactors"].size(), 1 );

  const nlohmann::json &reactor = data["Reactors"][0];
  BOOST_CHECK_EQUAL( reactor["ReactorId"].get<int>(), 1 );
  BOOST_CHECK_EQUAL( reactor["Points"].size(), 8 );
  BOOST_CHECK( reactor["Fit"]["Success"].get<bool>() );
  BOOST_CHECK_EQUAL( reactor["Fit"]["Model"].get<string>(), "constrained" );
  BOOST_CHECK_CLOSE( reactor["Fit"]["InflectionTemperature"].get<double>(), 290.0, 0.5 );
  BOOST_REQUIRE_EQUAL( reactor["TX"].size(), 3 );
  BOOST_CHECK_EQUAL( reactor["TX"][1]["Label"].get<string>(), "T50" );
  BOOST_CHECK( reactor["TX"][1]["Temperature"].is_number() );

  nlohmann::json protocol_data;
  BatchAnalysis::add_protocol_to_json( protocol_data, protocol );
  BOOST_CHECK_EQUAL( protocol_data["Protocol"]["Steps"].size(), 8 );
  BOOST_CHECK_EQUAL( protocol_data["Protocol"]["Mode"].get<string>(), "standard" );
  BOOST_CHECK_CLOSE( protocol_data["Protocol"]["TotalDurationSeconds"].get<double>(), 13800.0, 1.0E-9 );

  // Text outputs
  const string summary = BatchAnalysis::results_summary_text( result );
  BOOST_CHECK( summary.find( "pt_catalyst" ) != string::npos );
  BOOST_CHECK( summary.find( "T50" ) != string::npos );

  ActivityAnalysis::RecordingAnalysis missing;
  missing.display_name = "missing_sample";
  const string table = BatchAnalysis::comparison_table_text( { result, missing }, { 80.0, 50.0, 50.0 } );
  BOOST_CHECK( table.find( "Sample" ) != string::npos );
  BOOST_CHECK( table.find( "T50" ) != string::npos );
  BOOST_CHECK( table.find( "T80" ) != string::npos );
  BOOST_CHECK( table.find( "T20" ) == string::npos );
  BOOST_CHECK( table.find( "pt_catalyst" ) != string::npos );
  BOOST_CHECK( table.find( "missing_sample" ) != string::npos );
  BOOST_CHECK( table.find( "no data" ) != string::npos );

  SpecUtils::remove_file( filename );
}


BOOST_AUTO_TEST_CASE( test_analyze_files_in_batch )
{
  const string in_dir = make_test_dir( "lightoff_batch_in" );
  const string out_dir = make_test_dir( "lightoff_batch_out" );
  BOOST_REQUIRE( SpecUtils::is_directory( in_dir ) );
  BOOST_REQUIRE( SpecUtils::is_directory( out_dir ) );

  const string file_a = SpecUtils::append_path( in_dir, "sample_a.asc" );
  const string file_b = SpecUtils::append_path( in_dir, "sample_b.asc" );
  const string file_missing = SpecUtils::append_path( in_dir, "sample_c.asc" );
  write_default_protocol_asc( file_a, 280.0 );
  write_default_protocol_asc( file_b, 320.0 );

  const Protocol::TemperatureProtocol protocol = Protocol::default_protocol();

  BatchAnalysis::BatchAnalysisOptions options;
  options.output_dir = out_dir;
  options.create_json_output = true;

  const BatchAnalysis::BatchAnalysisResults results
    = BatchAnalysis::analyze_files_in_batch( { file_a, file_b, file_missing }, protocol, options );

  BOOST_REQUIRE_EQUAL( results.files.size(), 3 );
  BOOST_CHECK( !results.all_files_read );
  BOOST_CHECK( results.files[0].success );
  BOOST_CHECK( results.files[1].success );
  BOOST_CHECK( !results.files[2].success );

  BOOST_REQUIRE( results.files[0].reactors.at(1).fit.fitted() );
  BOOST_REQUIRE( results.files[1].reactors.at(1).fit.fitted() );
  BOOST_CHECK_LT( results.files[0].reactors.at(1).fit.m_inflection_temperature,
                  results.files[1].reactors.at(1).fit.m_inflection_temperature );

  bool missing_warning = false;
  for( const string &warn : results.warnings )
    missing_warning |= SpecUtils::starts_with( warn, "sample_c.asc: " );
  BOOST_CHECK( missing_warning );

  BOOST_CHECK( SpecUtils::is_file( SpecUtils::append_path( out_dir, "sample_a_conversion.csv" ) ) );
  BOOST_CHECK( SpecUtils::is_file( SpecUtils::append_path( out_dir, "sample_b_conversion.csv" ) ) );
  BOOST_CHECK( !SpecUtils::is_file( SpecUtils::append_path( out_dir, "sample_c_conversion.csv" ) ) );
  BOOST_CHECK( SpecUtils::is_file( SpecUtils::append_path( out_dir, "sample_a_results.json" ) ) );
  BOOST_CHECK( SpecUtils::is_file( SpecUtils::append_path( out_dir, "summary.json" ) ) );

  BOOST_CHECK_EQUAL( results.summary_json["Files"].size(), 3 );
  BOOST_CHECK_EQUAL( results.summary_json["InputFiles"].size(), 3 );
  BOOST_CHECK( results.summary_json.contains( "LightOffVersion" ) );
  BOOST_CHECK( results.summary_json.contains( "AnalysisOptions" ) );
  BOOST_CHECK( results.summary_json.contains( "Protocol" ) );

  // The summary written to disk parses back
  {
    ifstream input( SpecUtils::append_path( out_dir, "summary.json" ).c_str() );
    const nlohmann::json from_disk = nlohmann::json::parse( input );
    BOOST_CHECK_EQUAL( from_disk["Files"].size(), 3 );
  }

  // A second run will not overwrite the existing outputs
  const BatchAnalysis::BatchAnalysisResults second
    = BatchAnalysis::analyze_files_in_batch( { file_a }, protocol, options );
  bool overwrite_warning = false;
  for( const string &warn : second.warnings )
    overwrite_warning |= (warn.find( "would overwrite a file" ) != string::npos);
  BOOST_CHECK( overwrite_warning );
  BOOST_CHECK( second.all_files_read );

  options.overwrite_output_files = true;
  const BatchAnalysis::BatchAnalysisResults third
    = BatchAnalysis::analyze_files_in_batch( { file_a }, protocol, options );
  BOOST_CHECK( third.warnings.empty() );

  // Sample names label the results, but output files are still named after the input files
  options.sample_names = { "Fresh catalyst" };
  const BatchAnalysis::BatchAnalysisResults named
    = BatchAnalysis::analyze_files_in_batch( { file_a }, protocol, options );
  BOOST_REQUIRE_EQUAL( named.files.size(), 1 );
  BOOST_CHECK_EQUAL( named.files[0].display_name, "Fresh catalyst" );
  BOOST_CHECK_EQUAL( named.summary_json["Files"][0]["DisplayName"].get<string>(), "Fresh catalyst" );
  BOOST_CHECK( named.warnings.empty() );
  BOOST_CHECK( comparison_table_contains( named.files, "Fresh catalyst" ) );

  options.sample_names = { "Fresh catalyst", "Aged catalyst" };
  BOOST_CHECK_THROW( BatchAnalysis::analyze_files_in_batch( { file_a }, protocol, options ), std::runtime_error );
  options.sample_names.clear();

  // A non-existent output directory is an error
  options.output_dir = SpecUtils::append_path( out_dir, "not_a_dir" );
  BOOST_CHECK_THROW( BatchAnalysis::analyze_files_in_batch( { file_a }, protocol, options ), std::runtime_error );

  for( const string &name : { "sample_a_conversion.csv", "sample_b_conversion.csv", "sample_a_results.json",
                              "sample_b_results.json", "sample_c_results.json", "summary.json" } )
    SpecUtils::remove_file( SpecUtils::append_path( out_dir, name ) );
  SpecUtils::remove_file( file_a );
  SpecUtils::remove_file( file_b );
}
