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

#include <chrono>
#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>

#include "nlohmann/json.hpp"

#include "SpecUtils/DateTime.h"
#include "SpecUtils/Filesystem.h"
#include "SpecUtils/StringAlgo.h"

#include "LightOff/AppUtils.h"
#include "LightOff/Protocol.h"
#include "LightOff/SigmoidFit.h"
#include "LightOff/BatchAnalysis.h"
#include "LightOff/ActivityAnalysis.h"
#include "LightOff/ConversionReducer.h"

using namespace std;

namespace
{
  void write_output_file( const string &out_file, const string &contents,
                          const BatchAnalysis::BatchAnalysisOptions &options,
                          vector<string> &warnings )
  {
    if( SpecUtils::is_file(out_file) && !options.overwrite_output_files )
    {
      warnings.push_back( "Not writing '" + out_file + "', as it would overwrite a file."
                         " See the '--overwrite-output-files' option to force writing." );
      return;
    }

#ifdef _WIN32
    const std::wstring wout_file = SpecUtils::convert_from_utf8_to_utf16(out_file);
    std::ofstream output( wout_file.c_str(), ios::binary | ios::out );
#else
    std::ofstream output( out_file.c_str(), ios::binary | ios::out );
#endif

    if( !output )
    {
      warnings.push_back( "Failed to open '" + out_file + "', for writing." );
      return;
    }

    output.write( contents.c_str(), contents.size() );
    if( !output )
    {
      warnings.push_back( "Failed writing '" + out_file + "'." );
      return;
    }

    cout << "Have written '" << out_file << "'" << endl;
  }//write_output_file(...)


  nlohmann::json optional_to_json( const std::optional<double> &value )
  {
    if( value.has_value() )
      return nlohmann::json( *value );
    return nlohmann::json( nullptr );
  }
}//namespace


namespace BatchAnalysis
{

BatchAnalysisOptions::BatchAnalysisOptions()
  : ActivityAnalysis::AnalysisOptions(),
    to_stdout( false ),
    overwrite_output_files( false ),
    create_csv_output( true ),
    create_json_output( false ),
    output_dir(),
    sample_names()
{
}


void add_exe_info_to_json( nlohmann::json &data )
{
  data["LightOffVersion"] = string(LightOff_VERSION);
  data["LightOffCompileDate"] = string(__DATE__);
  data["LightOffCompileDateIso"] = std::to_string( AppUtils::compile_date_as_int() );
  const auto now = chrono::time_point_cast<chrono::microseconds>( chrono::system_clock::now() );
  data["AnalysisTime"] = SpecUtils::to_iso_string( now );
  data["CurrentWorkingDirectory"] = SpecUtils::get_working_path();
}//void add_exe_info_to_json( nlohmann::json &data )


void add_options_to_json( nlohmann::json &data, const BatchAnalysisOptions &options )
{
  auto &options_obj = data["AnalysisOptions"];
  options_obj["CalibrationSlope"] = options.calibration.slope;
  options_obj["CalibrationIntercept"] = options.calibration.intercept;
  options_obj["AutoIntercept"] = options.auto_intercept;
  options_obj["FitModel"] = SigmoidFit::to_string( options.fit_model );
  options_obj["TxTargets"] = SigmoidFit::normalize_tx_targets( options.tx_targets );
  options_obj["NumCurvePoints"] = options.num_curve_points;
  options_obj["OutputDir"] = options.output_dir;
  if( !options.sample_names.empty() )
    options_obj["SampleNames"] = options.sample_names;
  options_obj["CreateCsvOutput"] = options.create_csv_output;
  options_obj["CreateJsonOutput"] = options.create_json_output;
  options_obj["OverwriteOutputFiles"] = options.overwrite_output_files;
}//void add_options_to_json(...)


void add_protocol_to_json( nlohmann::json &data, const Protocol::TemperatureProtocol &protocol )
{
  auto &protocol_obj = data["Protocol"];
  protocol_obj["Name"] = protocol.name;
  protocol_obj["Mode"] = Protocol::to_string( protocol.mode );
  protocol_obj["NumReactors"] = protocol.num_reactors;
  protocol_obj["RampTimeMinutes"] = protocol.ramp_time;
  protocol_obj["AnalysisTimeMinutes"] = protocol.analysis_time;
  protocol_obj["TotalDurationSeconds"] = protocol.total_duration_seconds();

  protocol_obj["Steps"] = nlohmann::json::array();
  for( const Protocol::TemperatureStep &step : protocol.steps )
  {
    nlohmann::json step_obj;
    step_obj["Temperature"] = step.temperature;
    step_obj["HoldTimeMinutes"] = step.hold_time;
    step_obj["ReactorId"] = step.reactor_id;
    protocol_obj["Steps"].push_back( step_obj );
  }
}//void add_protocol_to_json(...)


void add_recording_results_to_json( nlohmann::json &data,
                                    const ActivityAnalysis::RecordingAnalysis &result )
{
  data["Filepath"] = result.source_path;
  data["Filename"] = SpecUtils::filename( result.source_path );
  data["DisplayName"] = result.display_name;
  data["Success"] = result.success;
  data["NumStepsExpected"] = result.num_steps_expected;
  data["NumStepsFound"] = result.num_steps_found;
  data["NumDataPoints"] = result.series.size();
  data["RecordingDurationSeconds"] = result.recording_duration;
  data["RequiredDurationSeconds"] = result.required_duration;
  data["Warnings"] = result.warnings;

  data["Reactors"] = nlohmann::json::array();
  for( const auto &id_reactor : result.reactors )
  {
    const ActivityAnalysis::ReactorResult &reactor = id_reactor.second;
    const ConversionReducer::ReactorActivity &activity = reactor.activity;
    const SigmoidFit::SigmoidFitResult &fit = reactor.fit;

    nlohmann::json reactor_obj;
    reactor_obj["ReactorId"] = id_reactor.first;
    reactor_obj["Calibration"]["Slope"] = activity.calibration.slope;
    reactor_obj["Calibration"]["Intercept"] = activity.calibration.intercept;
    reactor_obj["Calibration"]["AutoIntercept"] = activity.auto_intercept_applied;

    reactor_obj["Points"] = nlohmann::json::array();
    for( const ConversionReducer::ActivitySample &sample : activity.samples )
    {
      nlohmann::json point;
      point["StepIndex"] = sample.step_index;
      point["Temperature"] = sample.temperature;
      point["AvgIntensity"] = sample.avg_intensity;
      point["Conversion"] = sample.conversion;
      point["DataPoints"] = sample.data_points;
      reactor_obj["Points"].push_back( point );
    }

    auto &fit_obj = reactor_obj["Fit"];
    fit_obj["Model"] = SigmoidFit::to_string( fit.m_model );
    fit_obj["Status"] = SigmoidFit::to_string( fit.m_status );
    fit_obj["Success"] = fit.fitted();
    if( !fit.m_error_message.empty() )
      fit_obj["ErrorMessage"] = fit.m_error_message;

    if( fit.fitted() )
    {
      fit_obj["GrowthRate"] = fit.m_growth_rate;
      fit_obj["InflectionTemperature"] = fit.m_inflection_temperature;
      fit_obj["Upper"] = fit.m_upper;
      fit_obj["Lower"] = fit.m_lower;
      fit_obj["ParameterUncertainties"] = fit.m_uncertainties;
      fit_obj["RSquared"] = fit.m_r_squared;
      fit_obj["SumSqResiduals"] = fit.m_sum_sq_residuals;
      fit_obj["NumIterations"] = fit.m_num_iterations;
    }//if( fit.fitted() )

    reactor_obj["TX"] = nlohmann::json::array();
    for( const SigmoidFit::TxValue &tx : reactor.tx_values )
    {
      nlohmann::json tx_obj;
      tx_obj["Label"] = tx.label;
      tx_obj["TargetPercent"] = tx.target_percent;
      tx_obj["Temperature"] = optional_to_json( tx.temperature );
      reactor_obj["TX"].push_back( tx_obj );
    }

    data["Reactors"].push_back( reactor_obj );
  }//for( const auto &id_reactor : result.reactors )
}//void add_recording_results_to_json(...)


void write_results_csv( std::ostream &out, const ActivityAnalysis::RecordingAnalysis &result )
{
  bool first_reactor = true;
  for( const auto &id_reactor : result.reactors )
  {
    ConversionReducer::write_detail_csv( out, id_reactor.second.activity, true, first_reactor );
    first_reactor = false;
  }

  out << "\r\n";
  out << "Reactor,Model,Status,Growth_Rate_b,Inflection_Temperature_C,Upper_a,Lower_d,R_Squared\r\n";
  for( const auto &id_reactor : result.reactors )
  {
    const SigmoidFit::SigmoidFitResult &fit = id_reactor.second.fit;
    out << id_reactor.first << "," << SigmoidFit::to_string(fit.m_model)
        << "," << SigmoidFit::to_string(fit.m_status);
    if( fit.fitted() )
    {
      out << std::setprecision(8) << "," << fit.m_growth_rate << "," << fit.m_inflection_temperature
          << "," << fit.m_upper << "," << fit.m_lower << "," << fit.m_r_squared;
    }else
    {
      out << ",,,,,";
    }
    out << "\r\n";
  }//for( const auto &id_reactor : result.reactors )

  out << "\r\n";
  out << "Reactor,TX,Target_%,Temperature_C\r\n";
  for( const auto &id_reactor : result.reactors )
  {
    for( const SigmoidFit::TxValue &tx : id_reactor.second.tx_values )
    {
      out << id_reactor.first << "," << tx.label << "," << std::setprecision(8) << tx.target_percent << ",";
      if( tx.temperature.has_value() )
        out << std::setprecision(8) << *tx.temperature;
      out << "\r\n";
    }
  }//for( const auto &id_reactor : result.reactors )
}//void write_results_csv(...)


string results_summary_text( const ActivityAnalysis::RecordingAnalysis &result )
{
  stringstream strm;

  const string name = result.display_name.empty() ? string("recording") : result.display_name;
  strm << "Results for '" << name << "' (" << result.num_steps_found << "/"
       << result.num_steps_expected << " steps found):\n";

  if( !result.success )
    strm << "  Could not be analyzed.\n";

  for( const auto &id_reactor : result.reactors )
  {
    const ActivityAnalysis::ReactorResult &reactor = id_reactor.second;
    const SigmoidFit::SigmoidFitResult &fit = reactor.fit;

    strm << "Reactor " << id_reactor.first << ":\n";
    strm << ConversionReducer::detail_table_text( reactor.activity );

    if( !fit.fitted() )
    {
      strm << "  Sigmoid fit failed: " << fit.m_error_message << "\n";
      continue;
    }

    strm << "  Fit (" << SigmoidFit::to_string(fit.m_model) << "): R2=" << std::fixed << std::setprecision(4)
         << fit.m_r_squared << ", b=" << std::setprecision(5) << fit.m_growth_rate
         << ", c=" << std::setprecision(2) << fit.m_inflection_temperature << " C";
    if( fit.m_model == SigmoidFit::SigmoidFitModel::Unconstrained )
      strm << ", a=" << fit.m_upper << ", d=" << fit.m_lower;
    strm << "\n";

    for( const SigmoidFit::TxValue &tx : reactor.tx_values )
    {
      strm << "  " << std::left << std::setw(8) << tx.label;
      if( tx.temperature.has_value() )
        strm << std::fixed << std::setprecision(1) << *tx.temperature << " C\n";
      else
        strm << "cannot calculate\n";
    }
  }//for( const auto &id_reactor : result.reactors )

  for( const string &warn : result.warnings )
    strm << "  Warning: " << warn << "\n";

  return strm.str();
}//results_summary_text(...)


string comparison_table_text( const vector<ActivityAnalysis::RecordingAnalysis> &results,
                              const vector<double> &tx_targets )
{
  const vector<double> targets = SigmoidFit::normalize_tx_targets( tx_targets );

  size_t name_width = 12;
  for( const ActivityAnalysis::RecordingAnalysis &result : results )
    name_width = std::max( name_width, result.display_name.size() + 2 );

  stringstream strm;
  strm << std::left << std::setw(static_cast<int>(name_width)) << "Sample"
       << std::setw(9) << "Reactor" << std::setw(10) << "R2";
  for( const double target : targets )
    strm << std::setw(10) << SigmoidFit::tx_label( target );
  strm << "\n";

  for( const ActivityAnalysis::RecordingAnalysis &result : results )
  {
    if( result.reactors.empty() )
    {
      strm << std::left << std::setw(static_cast<int>(name_width)) << result.display_name
           << "no data\n";
      continue;
    }

    for( const auto &id_reactor : result.reactors )
    {
      const ActivityAnalysis::ReactorResult &reactor = id_reactor.second;

      strm << std::left << std::setw(static_cast<int>(name_width)) << result.display_name
           << std::setw(9) << id_reactor.first;

      if( !reactor.fit.fitted() )
      {
        strm << "fit failed\n";
        continue;
      }

      strm << std::setw(10) << std::fixed << std::setprecision(4) << reactor.fit.m_r_squared;
      for( const SigmoidFit::TxValue &tx : reactor.tx_values )
      {
        if( tx.temperature.has_value() )
          strm << std::setw(10) << std::fixed << std::setprecision(1) << *tx.temperature;
        else
          strm << std::setw(10) << "-";
      }
      strm << "\n";
    }//for( const auto &id_reactor : result.reactors )
  }//for( const RecordingAnalysis &result : results )

  return strm.str();
}//comparison_table_text(...)


string suggested_output_filename( const string &input_filename, const string &suffix,
                                  const BatchAnalysisOptions &options )
{
  string leaf_name = SpecUtils::filename( input_filename );
  const string file_ext = SpecUtils::file_extension( leaf_name );
  if( !file_ext.empty() && (file_ext.size() < leaf_name.size()) )
    leaf_name = leaf_name.substr( 0, leaf_name.size() - file_ext.size() );

  return SpecUtils::append_path( options.output_dir, leaf_name + suffix );
}//suggested_output_filename(...)


BatchAnalysisResults analyze_files_in_batch( const vector<string> &files,
                                             const Protocol::TemperatureProtocol &protocol,
                                             const BatchAnalysisOptions &options )
{
  protocol.check_valid();

  if( !options.output_dir.empty() && !SpecUtils::is_directory(options.output_dir) )
    throw runtime_error( "Output directory ('" + options.output_dir + "') is not a directory." );

  if( !options.sample_names.empty() && (options.sample_names.size() != files.size()) )
    throw runtime_error( "Number of sample names (" + std::to_string(options.sample_names.size())
                         + ") does not match the number of input files ("
                         + std::to_string(files.size()) + ")" );

  const bool write_files = !options.output_dir.empty();

  BatchAnalysisResults results;
  results.all_files_read = true;

  nlohmann::json &summary_json = results.summary_json;
  add_exe_info_to_json( summary_json );
  add_options_to_json( summary_json, options );
  add_protocol_to_json( summary_json, protocol );
  summary_json["InputFiles"] = files;
  summary_json["Files"] = nlohmann::json::array();

  for( size_t file_index = 0; file_index < files.size(); ++file_index )
  {
    const string &filename = files[file_index];

    ActivityAnalysis::RecordingAnalysis result = ActivityAnalysis::analyze_file( filename, protocol, options );
    if( !options.sample_names.empty() )
    {
      const string name = SpecUtils::trim_copy( options.sample_names[file_index] );
      if( !name.empty() )
        result.display_name = name;
    }

    results.all_files_read = (results.all_files_read && result.success);

    const string leaf_name = SpecUtils::filename( filename );
    for( const string &warn : result.warnings )
      results.warnings.push_back( leaf_name + ": " + warn );

    nlohmann::json file_json;
    add_recording_results_to_json( file_json, result );
    summary_json["Files"].push_back( file_json );

    if( options.to_stdout )
      cout << "\n" << results_summary_text( result ) << endl;

    if( write_files && options.create_csv_output && result.success )
    {
      stringstream csv;
      write_results_csv( csv, result );
      write_output_file( suggested_output_filename( filename, "_conversion.csv", options ),
                         csv.str(), options, results.warnings );
    }

    if( write_files && options.create_json_output )
    {
      nlohmann::json data;
      add_exe_info_to_json( data );
      add_options_to_json( data, options );
      add_protocol_to_json( data, protocol );
      add_recording_results_to_json( data, result );

      stringstream json_strm;
      json_strm << std::setw(4) << data << std::endl;
      write_output_file( suggested_output_filename( filename, "_results.json", options ),
                         json_strm.str(), options, results.warnings );
    }//if( write_files && options.create_json_output )

    results.files.push_back( result );
  }//for( loop over files )

  if( options.to_stdout && (results.files.size() > 1) )
    cout << "\nComparison of samples:\n" << comparison_table_text( results.files, options.tx_targets ) << endl;

  // Add any encountered warnings to output summary JSON
  summary_json["Warnings"] = results.warnings;

  if( write_files && options.create_json_output )
  {
    stringstream json_strm;
    json_strm << std::setw(4) << summary_json << std::endl;
    write_output_file( SpecUtils::append_path( options.output_dir, "summary.json" ),
                       json_strm.str(), options, results.warnings );
  }

  if( !results.warnings.empty() )
    cerr << endl;
  for( const string &warn : results.warnings )
    cerr << warn << endl;

  return results;
}//analyze_files_in_batch(...)

}//namespace BatchAnalysis
