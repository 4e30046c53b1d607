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
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <boost/program_options.hpp>

#include "SpecUtils/Filesystem.h"
#include "SpecUtils/StringAlgo.h"

#include "LightOff/AppUtils.h"
#include "LightOff/Protocol.h"
#include "LightOff/SigmoidFit.h"
#include "LightOff/Calibration.h"
#include "LightOff/AscFileReader.h"
#include "LightOff/BatchAnalysis.h"
#include "LightOff/BatchCommandLine.h"

using namespace std;


namespace BatchCommandLine
{

Protocol::TemperatureProtocol make_protocol( const string &name,
                                             const vector<double> &temperatures,
                                             const vector<double> &hold_times,
                                             const vector<int> &reactors,
                                             const double ramp_time,
                                             const double analysis_time,
                                             const string &mode,
                                             const int num_reactors )
{
  Protocol::TemperatureProtocol protocol = Protocol::default_protocol();

  if( !temperatures.empty() )
  {
    protocol.name = name.empty() ? string("Custom Protocol") : name;
    protocol.steps.clear();
    for( const double temp : temperatures )
      protocol.steps.emplace_back( temp, 20.0, 1 );
  }else if( !name.empty() )
  {
    protocol.name = name;
  }

  const size_t nsteps = protocol.steps.size();

  if( !hold_times.empty() )
  {
    if( (hold_times.size() != 1) && (hold_times.size() != nsteps) )
      throw runtime_error( "Number of hold times (" + std::to_string(hold_times.size())
                           + ") must be 1, or match the number of temperature steps ("
                           + std::to_string(nsteps) + ")" );

    for( size_t i = 0; i < nsteps; ++i )
      protocol.steps[i].hold_time = (hold_times.size() == 1) ? hold_times[0] : hold_times[i];
  }//if( !hold_times.empty() )

  if( !reactors.empty() )
  {
    if( (reactors.size() != 1) && (reactors.size() != nsteps) )
      throw runtime_error( "Number of reactor ids (" + std::to_string(reactors.size())
                           + ") must be 1, or match the number of temperature steps ("
                           + std::to_string(nsteps) + ")" );

    for( size_t i = 0; i < nsteps; ++i )
      protocol.steps[i].reactor_id = (reactors.size() == 1) ? reactors[0] : reactors[i];
  }//if( !reactors.empty() )

  protocol.ramp_time = ramp_time;
  protocol.analysis_time = analysis_time;
  protocol.mode = Protocol::mode_from_string( mode );
  protocol.num_reactors = num_reactors;

  protocol.check_valid();

  return protocol;
}//make_protocol(...)


int run_batch_command( int argc, char **argv )
{
  namespace po = boost::program_options;

  unsigned term_width = AppUtils::terminal_width();
  unsigned min_description_length = ((term_width < 80u) ? term_width/2u : 40u);

  const Calibration::CalibrationCurve default_cal = Calibration::default_curve();

  bool output_stdout = false, overwrite_output_files = false;
  bool create_csv_output = true, create_json_output = false, auto_intercept = true;
  double ramp_time = 10.0, analysis_time = 10.0, slope = default_cal.slope, intercept = default_cal.intercept;
  int num_reactors = 1;
  vector<string> input_files, sample_names;
  string ini_file_path, input_dir, output_path, protocol_name, temperatures_str, hold_times_str;
  string reactors_str, mode_str, fit_model_str, tx_str;

  po::options_description cl_desc("Allowed light-off analysis options", term_width, min_description_length);
  cl_desc.add_options()
  ("help,h",  "Produce help message")
  ("ini-file,i", po::value<std::string>(&ini_file_path)->default_value(""),
   "Path to INI file that can specify command line option defaults.\n"
   "(so you dont have to re-type things all the time)\n"
   "Options are given in sections, e.g. \"[protocol]\" followed by \"ramp-time = 5\".\n"
   "If not specified, will look for \"LightOff_batch.ini\" in the current directory.")
  ("input-file", po::value<vector<std::string>>(&input_files)->multitoken(),
   "One or more FT-IR .asc recordings to analyze.  If a directory, all .asc files in it will be used."
   )
  ("input-dir", po::value<std::string>(&input_dir)->default_value(""),
   "Directory whose .asc files will all be analyzed, and compared to each other."
   )
  ("sample-name", po::value<vector<std::string>>(&sample_names)->multitoken(),
   "Name to use for each input file's sample in the outputs and comparison table, in the same"
   " order as the input files (after directories are expanded).  If not given, the filename"
   " without extension is used."
   )
  ("out-dir", po::value<string>(&output_path)->default_value(""),
   "The directory to write CSV and JSON results to; if empty, no files will be written.")
  ("csv-output", po::value<bool>(&create_csv_output)->implicit_value(true)->default_value(true),
   "Write a \"<file>_conversion.csv\" for each input file, with the conversion at each step,"
   " the fit parameters, and TX values."
   )
  ("json-output", po::value<bool>(&create_json_output)->implicit_value(true)->default_value(false),
   "Write a \"<file>_results.json\" for each input file, and a \"summary.json\" comparing all files."
   )
  ("print", po::value<bool>(&output_stdout)->implicit_value(true)->default_value(false),
   "Print results to stdout."
   )
  ("overwrite-output-files", po::value<bool>(&overwrite_output_files)->implicit_value(true)->default_value(false),
   "Allows overwriting output CSV or JSON files.  By default will not overwrite files."
   )
  ;

  po::options_description protocol_desc("Measurement protocol options", term_width, min_description_length);
  protocol_desc.add_options()
  ("protocol.name", po::value<string>(&protocol_name)->default_value(""),
   "Name of the protocol, for reporting.")
  ("protocol.temperatures", po::value<string>(&temperatures_str)->default_value(""),
   "Comma separated set-point temperatures, in Celsius, in the order they were measured.\n"
   "Defaults to 500 down to 150 in 50 C steps.")
  ("protocol.hold-times", po::value<string>(&hold_times_str)->default_value(""),
   "Hold time, in minutes, of each step; either a single value for all steps, or a comma"
   " separated value for each step.  Defaults to 20 minutes.")
  ("protocol.reactors", po::value<string>(&reactors_str)->default_value(""),
   "Reactor id of each step (semi-auto mode); either a single value, or one per step."
   "  Defaults to reactor 1.")
  ("protocol.ramp-time", po::value<double>(&ramp_time)->default_value(10.0),
   "Time, in minutes, to change between two different set-point temperatures.")
  ("protocol.analysis-time", po::value<double>(&analysis_time)->default_value(10.0),
   "Duration, in minutes, at the end of each hold, that is averaged.")
  ("protocol.mode", po::value<string>(&mode_str)->default_value("standard"),
   "Either \"standard\" (one reactor), or \"semi_auto\" (steps alternate between reactors).")
  ("protocol.num-reactors", po::value<int>(&num_reactors)->default_value(1),
   "Number of reactors, for semi-auto mode.")
  ;

  po::options_description analysis_desc("Conversion and fit options", term_width, min_description_length);
  analysis_desc.add_options()
  ("calibration.slope", po::value<double>(&slope)->default_value(default_cal.slope),
   "Slope of the linear intensity to conversion [%] calibration.")
  ("calibration.intercept", po::value<double>(&intercept)->default_value(default_cal.intercept),
   "Intercept of the intensity to conversion [%] calibration; not used if auto-intercept is on.")
  ("calibration.auto-intercept", po::value<bool>(&auto_intercept)->implicit_value(true)->default_value(true),
   "Derive the intercept, for each reactor, so its highest intensity step is 0% conversion.")
  ("fit.model", po::value<string>(&fit_model_str)->default_value("constrained"),
   "\"constrained\": 100/(1+exp(-b(T-c))) with b > 0, or \"unconstrained\": the four parameter"
   " d+(a-d)/(1+exp(-b(T-c))).")
  ("fit.tx", po::value<string>(&tx_str)->default_value("20,50,80"),
   "Comma separated conversions, in percent, to report the temperature of (e.g., T50).")
  ;

  po::options_description all_desc( term_width, min_description_length );
  all_desc.add( cl_desc ).add( protocol_desc ).add( analysis_desc );

  po::variables_map cl_vm;
  try
  {
    po::parsed_options parsed_opts
    = po::command_line_parser(argc,argv)
      .allow_unregistered()
      .options(all_desc)
      .run();

    po::store( parsed_opts, cl_vm );

    if( ini_file_path.empty() && cl_vm.count("ini-file") )
      ini_file_path = cl_vm["ini-file"].as<string>();

    if( ini_file_path.empty() && SpecUtils::is_file("LightOff_batch.ini") )
      ini_file_path = "LightOff_batch.ini";

    if( !ini_file_path.empty() )
    {
      try
      {
        ifstream input( ini_file_path.c_str() );
        if( !input )
          throw runtime_error( "Could not open config file '" + ini_file_path + "'" );

        // Values already on the command line take precedence over the INI file
        po::store( po::parse_config_file( input, all_desc, true ), cl_vm );

        std::cout << "Using settings from '" << ini_file_path << "'" << endl;
      }catch( const std::exception & e )
      {
        std::cerr << "Error reading INI file: " << e.what() << std::endl;
        return EXIT_FAILURE;
      }
    }//if( !ini_file_path.empty() )

    po::notify( cl_vm );
  }catch( std::exception &e )
  {
    std::cerr << "Command line argument error: " << e.what() << std::endl << std::endl;
    std::cout << all_desc << std::endl;
    return EXIT_FAILURE;
  }//try catch

  if( cl_vm.count("help") )
  {
    std::cout << "Available command-line options for batch light-off analysis are:\n";
    std::cout << all_desc << std::endl;
    return EXIT_SUCCESS;
  }//if( cl_vm.count("help") )

  bool successful = true;

  try
  {
    const Protocol::TemperatureProtocol protocol
          = make_protocol( protocol_name, AppUtils::parse_double_list( temperatures_str ),
                           AppUtils::parse_double_list( hold_times_str ),
                           AppUtils::parse_int_list( reactors_str ),
                           ramp_time, analysis_time, mode_str, num_reactors );

    BatchAnalysis::BatchAnalysisOptions options;
    options.calibration.slope = slope;
    options.calibration.intercept = intercept;
    options.auto_intercept = auto_intercept;
    options.fit_model = SigmoidFit::model_from_string( fit_model_str );
    options.tx_targets = AppUtils::parse_double_list( tx_str );
    options.to_stdout = output_stdout;
    options.overwrite_output_files = overwrite_output_files;
    options.create_csv_output = create_csv_output;
    options.create_json_output = create_json_output;
    options.output_dir = output_path;
    options.sample_names = sample_names;

    // Expand directories to be files
    vector<string> expanded_input_files;
    for( const string &filename : input_files )
    {
      if( SpecUtils::is_directory(filename) )
      {
        const vector<string> subfiles = AscFileReader::list_asc_files( filename );
        expanded_input_files.insert( end(expanded_input_files), begin(subfiles), end(subfiles) );
      }else
      {
        expanded_input_files.push_back( filename );
      }
    }//for( string filename : input_files )

    if( !input_dir.empty() )
    {
      if( !SpecUtils::is_directory(input_dir) )
        throw runtime_error( "Input directory ('" + input_dir + "') is not a directory." );

      const vector<string> subfiles = AscFileReader::list_asc_files( input_dir );
      if( subfiles.empty() )
        throw runtime_error( "No .asc files found in '" + input_dir + "'." );
      expanded_input_files.insert( end(expanded_input_files), begin(subfiles), end(subfiles) );
    }//if( !input_dir.empty() )

    if( expanded_input_files.empty() )
      throw runtime_error( "No input files specified; use 'input-file' or 'input-dir'." );

    if( output_path.empty() && !output_stdout )
      cerr << "Neither 'out-dir' nor 'print' was specified, so no results will be output." << endl;

    const BatchAnalysis::BatchAnalysisResults results
          = BatchAnalysis::analyze_files_in_batch( expanded_input_files, protocol, options );

    successful = results.all_files_read;
  }catch( std::exception &e )
  {
    successful = false;
    cerr << "Error performing batch analysis: " << e.what() << endl;
  }

  cout << "Done with batch processing." << endl;

  return successful ? EXIT_SUCCESS : EXIT_FAILURE;
}//int run_batch_command( int argc, char **argv )

}//namespace BatchCommandLine
