#ifndef SigmoidFit_h
#define SigmoidFit_h
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
#include <optional>


/** Fitting of conversion vs temperature ("light-off") curves to a logistic function.

 The canonical model has fixed asymptotes of 0% and 100%:

   conversion(T) = 100 / (1 + exp(-b*(T - c)))

 where b > 0 is the growth rate, and c is the inflection temperature (i.e., T50).

 The older four parameter model, `d + (a - d)/(1 + exp(-b*(T - c)))`, with a free upper (a) and
 lower (d) asymptote, is still available for comparing against previously reported results.
 */
namespace SigmoidFit
{
  enum class SigmoidFitModel : int
  {
    /** Two parameter (b, c) fit, with asymptotes fixed at 0 and 100, and b constrained positive. */
    Constrained,

    /** Four parameter (a, b, c, d) fit with no constraints. */
    Unconstrained
  };//enum class SigmoidFitModel

  LightOff_API const char *to_string( const SigmoidFitModel model );

  /** Accepts "constrained", or "unconstrained"/"legacy" (case insensitive); throws std::runtime_error otherwise. */
  LightOff_API SigmoidFitModel model_from_string( const std::string &str );


  enum class SigmoidFitStatus : int
  {
    NotInitialized,

    /** Mismatched input lengths, non-finite values, or fewer points than fit parameters. */
    InvalidInput,

    /** The L-M solver failed, or did not converge within its iteration limit. */
    ErrorFindingSolution,

    /** All conversions are identical, so R2 is undefined. */
    DegenerateData,

    Success
  };//enum class SigmoidFitStatus

  LightOff_API const char *to_string( const SigmoidFitStatus status );


  struct LightOff_API SigmoidFitResult
  {
    SigmoidFitModel m_model = SigmoidFitModel::Constrained;

    /** Upper asymptote, `a`; always 100 for the constrained model. */
    double m_upper = 100.0;

    /** Growth rate, `b`, in 1/Celsius. */
    double m_growth_rate = 0.0;

    /** Inflection temperature, `c`, in Celsius. */
    double m_inflection_temperature = 0.0;

    /** Lower asymptote, `d`; always 0 for the constrained model. */
    double m_lower = 0.0;

    /** One-sigma uncertainties of the fit parameters, in order {b, c} for the constrained model, or
     {a, b, c, d} for the unconstrained model.  Entries are zero if the covariance could not be
     computed.
     */
    std::vector<double> m_uncertainties;

    double m_r_squared = 0.0;

    /** Sum of squared residuals at the solution. */
    double m_sum_sq_residuals = 0.0;

    size_t m_num_points = 0;
    int m_num_iterations = 0;

    SigmoidFitStatus m_status = SigmoidFitStatus::NotInitialized;
    std::string m_error_message;

    bool fitted() const { return m_status == SigmoidFitStatus::Success; }
  };//struct SigmoidFitResult


  /** Initial growth rate used for the constrained model. */
  static const double sm_initial_growth_rate = 0.05;

  /** Lower bound for the growth rate of the constrained model. */
  static const double sm_min_growth_rate = 1.0E-6;

  /** Limit of L-M iterations before a fit is considered to have failed. */
  static const int sm_max_iterations = 5000;


  /** The constrained model, 100/(1 + exp(-b*(T - c))). */
  LightOff_API double evaluate( const double b, const double c, const double temperature );

  /** The unconstrained model, d + (a - d)/(1 + exp(-b*(T - c))). */
  LightOff_API double evaluate( const double a, const double b, const double c, const double d,
                                const double temperature );

  /** Temperature at which the constrained model reaches \p target_percent conversion:

     T = c - ln(100/target - 1)/b

   Returns no value ("cannot calculate") if target is not strictly between 0 and 100, or b is
   not positive.
   */
  LightOff_API std::optional<double> inverse_tx( const double b, const double c, const double target_percent );

  /** Evaluates whichever model \p fit was made with.

   Throws std::logic_error if \p fit is not a successful fit.
   */
  LightOff_API double evaluate( const SigmoidFitResult &fit, const double temperature );

  /** Inverse of whichever model \p fit was made with; for the unconstrained model the target must be
   strictly between d and a, and b must be non-zero.

   Throws std::logic_error if \p fit is not a successful fit.
   */
  LightOff_API std::optional<double> inverse_tx( const SigmoidFitResult &fit, const double target_percent );

  /** Least-squares fit of the chosen model to the data.

   Temperatures do not need to be sorted.  Never throws; the outcome is in
   `SigmoidFitResult::m_status`.
   */
  LightOff_API SigmoidFitResult fit_sigmoid( const std::vector<double> &temperatures,
                                             const std::vector<double> &conversions,
                                             const SigmoidFitModel model );

  /** Evaluates the fit at \p num_points evenly spaced temperatures between \p temp_min and
   \p temp_max, inclusive.

   Throws std::logic_error if \p fit is not a successful fit.
   */
  LightOff_API void fitted_curve( const SigmoidFitResult &fit,
                                  const double temp_min, const double temp_max,
                                  const size_t num_points,
                                  std::vector<double> &temperatures,
                                  std::vector<double> &conversions );


  /** A temperature at which a target conversion is reached. */
  struct LightOff_API TxValue
  {
    double target_percent;

    /** See `tx_label(...)`. */
    std::string label;

    /** No value if the target could not be reached by the fit curve. */
    std::optional<double> temperature;
  };//struct TxValue


  /** Returns the targets sorted, with duplicates removed. */
  LightOff_API std::vector<double> normalize_tx_targets( std::vector<double> targets );

  /** Label for a TX value: "T50" for an integral target, or the shortest decimal form that reads
   back as the same value for non-integral targets (e.g., "T50.4", "T50.01"), so distinct targets
   never share a label.
   */
  LightOff_API std::string tx_label( const double target_percent );


  /** Holds the data and result of the most recent fit.

   Evaluating or inverting before a successful fit is a programming error, and throws
   std::logic_error rather than return stale values.
   */
  class LightOff_API SigmoidFitter
  {
  public:
    explicit SigmoidFitter( const SigmoidFitModel model = SigmoidFitModel::Constrained );

    /** Fits the data, replacing any previous result; returns `result().fitted()`. */
    bool fit( const std::vector<double> &temperatures, const std::vector<double> &conversions );

    SigmoidFitModel model() const;
    bool has_fit() const;
    const SigmoidFitResult &result() const;

    double evaluate( const double temperature ) const;

    std::optional<double> inverse_tx( const double target_percent ) const;

    /** TX for each target, in order of increasing target; targets are normalized first. */
    std::vector<TxValue> tx_values( const std::vector<double> &targets ) const;

    /** Fitted curve from 20 C below the lowest, to 20 C above the highest, fit temperature. */
    void fitted_curve( std::vector<double> &temperatures, std::vector<double> &conversions,
                       const size_t num_points = 300 ) const;

  protected:
    void check_fit() const;

    SigmoidFitModel m_model;
    SigmoidFitResult m_result;
    std::vector<double> m_temperatures;
    std::vector<double> m_conversions;
  };//class SigmoidFitter
}//namespace SigmoidFit

#endif //SigmoidFit_h
