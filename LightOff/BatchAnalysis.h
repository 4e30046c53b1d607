#ifndef BatchAnalysis_h
#define BatchAnalysis_h
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
#include <ostream>

#include "nlohmann/json.hpp"

#include "LightOff/Protocol.h"
#include "LightOff/ActivityAnalysis.h"

static_assert( USE_BATCH_TOOLS, "You must have USE_BATCH_TOOLS enabled to build this code" );


/** Analyzes a number of recordings with the same protocol, writing per-file CSVs, and a JSON
 summary comparing the files.
 */
namespace BatchAnalysis
{
  struct LightOff_API BatchAnalysisOptions : public ActivityAnalysis::AnalysisOptions
  {
    /** Print per-file and summary results to stdout. */
    bool to_stdout;

    /** Allows overwriting output CSV or JSON files.  By default will not overwrite files. */
    bool overwrite_output_files;

    /** Write "<file>_conversion.csv" for each input file; requires `output_dir`. */
    bool create_csv_output;

    /** Write "<file>_results.json" for each input, and "summary.json"; requires `output_dir`. */
    bool create_json_output;

    /** If empty, no files are written. */
    std::string output_dir;

    /** Optional sample name for each input file, in the same order as the files; empty entries use
     the filename without extension.  Must be empty, or the same length as the input files.
     */
    std::vector<std::string> sample_names;

    BatchAnalysisOptions();
  };//struct BatchAnalysisOptions


  struct LightOff_API BatchAnalysisResults
  {
    std::vector<ActivityAnalysis::RecordingAnalysis> files;

    /** Warnings from every file (prefixed by the filename), and from writing outputs. */
    std::vector<std::string> warnings;

    nlohmann::json summary_json;

    /** True if every file could be read; a failed fit does not count as a failure. */
    bool all_files_read = false;
  };//struct BatchAnalysisResults


  LightOff_API void add_exe_info_to_json( nlohmann::json &data );
  LightOff_API void add_options_to_json( nlohmann::json &data, const BatchAnalysisOptions &options );
  LightOff_API void add_protocol_to_json( nlohmann::json &data, const Protocol::TemperatureProtocol &protocol );

  /** Adds the per-reactor points, fit, and TX values under "Reactors", as well as file info. */
  LightOff_API void add_recording_results_to_json( nlohmann::json &data,
                                                   const ActivityAnalysis::RecordingAnalysis &result );

  /** Writes the detail table for every reactor (with a leading "Reactor" column), a blank line,
   and then the fit parameters and TX values of every reactor.
   */
  LightOff_API void write_results_csv( std::ostream &out, const ActivityAnalysis::RecordingAnalysis &result );

  /** Human readable summary: per reactor the detail table, R2, b, c, and TX values. */
  LightOff_API std::string results_summary_text( const ActivityAnalysis::RecordingAnalysis &result );

  /** Table with a row per file and reactor, and a column per TX value, for comparing samples. */
  LightOff_API std::string comparison_table_text( const std::vector<ActivityAnalysis::RecordingAnalysis> &results,
                                                  const std::vector<double> &tx_targets );

  /** Returns the output path for \p input_filename, by replacing its extension with \p suffix,
   inside `options.output_dir`.  E.g., "/data/run1.asc" and "_conversion.csv" gives
   "<output_dir>/run1_conversion.csv".
   */
  LightOff_API std::string suggested_output_filename( const std::string &input_filename,
                                                      const std::string &suffix,
                                                      const BatchAnalysisOptions &options );

  /** Analyzes all the files, and writes/prints outputs according to \p options.

   Throws std::runtime_error if the protocol is invalid, or `output_dir` is specified but isnt a
   directory.  Problems with individual files end up in the returned warnings.
   */
  LightOff_API BatchAnalysisResults analyze_files_in_batch( const std::vector<std::string> &files,
                                                            const Protocol::TemperatureProtocol &protocol,
                                                            const BatchAnalysisOptions &options );
}//namespace BatchAnalysis

#endif //BatchAnalysis_h
