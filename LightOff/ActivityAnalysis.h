#ifndef ActivityAnalysis_h
#define ActivityAnalysis_h
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

#include "LightOff/Protocol.h"
#include "LightOff/TimeSeries.h"
#include "LightOff/SigmoidFit.h"
#include "LightOff/Calibration.h"
#include "LightOff/StepSegmenter.h"
#include "LightOff/ConversionReducer.h"


/** Runs the whole chain: recording + protocol -> step windows -> conversions per reactor ->
 sigmoid fit and TX values per reactor.
 */
namespace ActivityAnalysis
{
  struct LightOff_API AnalysisOptions
  {
    Calibration::CalibrationCurve calibration;

    /** If true, each reactor's intercept is derived so its highest intensity step is 0% conversion. */
    bool auto_intercept;

    SigmoidFit::SigmoidFitModel fit_model;

    /** Conversions, in percent, to report the temperatures for; need not be sorted or unique. */
    std::vector<double> tx_targets;

    /** Number of points in the fitted curve. */
    size_t num_curve_points;

    /** How far, in Celsius, the fitted curve extends past the lowest and highest measured temperatures. */
    double curve_padding;

    /** Defaults: default calibration, auto-intercept, constrained fit, T20/T50/T80, 300 points, 20 C. */
    AnalysisOptions();
  };//struct AnalysisOptions


  struct LightOff_API ReactorResult
  {
    ConversionReducer::ReactorActivity activity;

    /** Check `fit.fitted()` before using the TX values or fitted curve; the raw points in `activity`
     are always valid.
     */
    SigmoidFit::SigmoidFitResult fit;

    /** One entry per normalized TX target; empty if the fit failed. */
    std::vector<SigmoidFit::TxValue> tx_values;

    /** Empty if the fit failed. */
    std::vector<double> curve_temperatures;
    std::vector<double> curve_conversions;
  };//struct ReactorResult


  struct LightOff_API RecordingAnalysis
  {
    /** Path of the file analyzed; empty if a recording was passed in directly. */
    std::string source_path;

    /** Filename without extension, used to label a sample when comparing files. */
    std::string display_name;

    /** False if the recording couldn't be read; in that case see `warnings`. */
    bool success = false;

    Protocol::TemperatureProtocol protocol;
    TimeSeries series;

    std::vector<StepSegmenter::StepWindow> windows;

    /** Results keyed by reactor id. */
    std::map<int,ReactorResult> reactors;

    size_t num_steps_expected = 0;
    size_t num_steps_found = 0;

    double recording_duration = 0.0;
    double required_duration = 0.0;

    std::vector<std::string> warnings;
  };//struct RecordingAnalysis


  /** Analyzes an in-memory recording.

   Throws std::runtime_error if \p protocol, or \p series, is invalid.  Missing steps, a too-short
   recording, and failed fits are reported in `RecordingAnalysis::warnings`, not thrown.
   */
  LightOff_API RecordingAnalysis analyze_recording( const TimeSeries &series,
                                                    const Protocol::TemperatureProtocol &protocol,
                                                    const AnalysisOptions &options );

  /** Reads an ASC file and analyzes it.

   Throws std::runtime_error if the protocol is invalid; a file that can't be read gives a result
   with `success == false`.
   */
  LightOff_API RecordingAnalysis analyze_file( const std::string &filename,
                                               const Protocol::TemperatureProtocol &protocol,
                                               const AnalysisOptions &options );

  /** Analyzes several files with the same protocol and options, so samples can be compared.

   Results are in the same order as \p filenames.

   \param sample_names Optional name for each file's sample, used as `RecordingAnalysis::display_name`;
          if empty, or for an empty entry, the filename without extension is used.  Throws
          std::runtime_error if non-empty and not the same length as \p filenames.
   */
  LightOff_API std::vector<RecordingAnalysis> analyze_files( const std::vector<std::string> &filenames,
                                                             const Protocol::TemperatureProtocol &protocol,
                                                             const AnalysisOptions &options,
                                                             const std::vector<std::string> &sample_names = {} );
}//namespace ActivityAnalysis

#endif //ActivityAnalysis_h
