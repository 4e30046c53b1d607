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
#include <limits>
#include <string>
#include <vector>
#include <cstdio>
#include <cstdlib>
#include <utility>
#include <iostream>
#include <numeric>
#include <optional>
#include <algorithm>
#include <stdexcept>

#include "ceres/ceres.h"

#include "SpecUtils/StringAlgo.h"

#include "LightOff/SigmoidFit.h"

using namespace std;

namespace
{
  /** 1/(1 + exp(-z)), written so large |z| doesnt overflow exp(...), which would give NaN derivatives. */
  template<typename T>
  T logistic( const T &z )
  {
    using std::exp;

    if( z >= T(0.0) )
      return T(1.0) / (T(1.0) + exp(-z));

    const T ez = exp( z );
    return ez / (T(1.0) + ez);
  }//logistic(...)


  /** Residuals of the sigmoid model to the measured conversions.

   Parameters are {b, c} for the constrained model, and {a, b, c, d} for the unconstrained model.
   */
  struct SigmoidCostFunctor
  {
    const vector<double> m_temperatures;
    const vector<double> m_conversions;
    const SigmoidFit::SigmoidFitModel m_model;

    SigmoidCostFunctor( const vector<double> &temperatures,
                        const vector<double> &conversions,
                        const SigmoidFit::SigmoidFitModel model )
    : m_temperatures( temperatures ),
      m_conversions( conversions ),
      m_model( model )
    {
    }

    static size_t number_parameters( const SigmoidFit::SigmoidFitModel model )
    {
      switch( model )
      {
        case SigmoidFit::SigmoidFitModel::Constrained:   return 2;
        case SigmoidFit::SigmoidFitModel::Unconstrained: return 4;
      }
      return 0;
    }

    size_t number_parameters() const
    {
      return number_parameters( m_model );
    }

    size_t number_residuals() const
    {
      return m_temperatures.size();
    }

    template<typename T>
    bool operator()( T const * const *parameters, T *residuals ) const
    {
      const T * const pars = parameters[0];

      for( size_t i = 0; i < m_temperatures.size(); ++i )
      {
        const T temp( m_temperatures[i] );
        T predicted;

        switch( m_model )
        {
          case SigmoidFit::SigmoidFitModel::Constrained:
          {
            const T &b = pars[0], &c = pars[1];
            predicted = T(100.0) * logistic( b * (temp - c) );
            break;
          }

          case SigmoidFit::SigmoidFitModel::Unconstrained:
          {
            const T &a = pars[0], &b = pars[1], &c = pars[2], &d = pars[3];
            predicted = d + (a - d) * logistic( b * (temp - c) );
            break;
          }
        }//switch( m_model )

        residuals[i] = predicted - T(m_conversions[i]);
      }//for( size_t i = 0; i < m_temperatures.size(); ++i )

      return true;
    }//operator()
  };//struct SigmoidCostFunctor


  /** Returns the temperature whose conversion is closest to \p conversion. */
  double temperature_nearest_conversion( const vector<double> &temperatures,
                                         const vector<double> &conversions,
                                         const double conversion )
  {
    size_t best_index = 0;
    for( size_t i = 1; i < conversions.size(); ++i )
    {
      if( fabs(conversions[i] - conversion) < fabs(conversions[best_index] - conversion) )
        best_index = i;
    }
    return temperatures[best_index];
  }//temperature_nearest_conversion(...)
}//namespace


namespace SigmoidFit
{

const char *to_string( const SigmoidFitModel model )
{
  switch( model )
  {
    case SigmoidFitModel::Constrained:   return "constrained";
    case SigmoidFitModel::Unconstrained: return "unconstrained";
  }
  return "invalid";
}//to_string( SigmoidFitModel )


SigmoidFitModel model_from_string( const std::string &input )
{
  const string str = SpecUtils::trim_copy( input );

  if( SpecUtils::iequals_ascii( str, "constrained" ) )
    return SigmoidFitModel::Constrained;

  if( SpecUtils::iequals_ascii( str, "unconstrained" ) || SpecUtils::iequals_ascii( str, "legacy" ) )
    return SigmoidFitModel::Unconstrained;

  throw runtime_error( "Invalid sigmoid fit model '" + input + "' (must be 'constrained' or 'unconstrained')" );
}//model_from_string(...)


const char *to_string( const SigmoidFitStatus status )
{
  switch( status )
  {
    case SigmoidFitStatus::NotInitialized:       return "NotInitialized";
    case SigmoidFitStatus::InvalidInput:         return "InvalidInput";
    case SigmoidFitStatus::ErrorFindingSolution: return "ErrorFindingSolution";
    case SigmoidFitStatus::DegenerateData:       return "DegenerateData";
    case SigmoidFitStatus::Success:              return "Success";
  }
  return "invalid";
}//to_string( SigmoidFitStatus )


double evaluate( const double b, const double c, const double temperature )
{
  return 100.0 * logistic( b * (temperature - c) );
}


double evaluate( const double a, const double b, const double c, const double d,
                 const double temperature )
{
  return d + (a - d) * logistic( b * (temperature - c) );
}


std::optional<double> inverse_tx( const double b, const double c, const double target_percent )
{
  if( !std::isfinite(target_percent) || (target_percent <= 0.0) || (target_percent >= 100.0) )
    return std::nullopt;

  if( !std::isfinite(b) || (b <= 0.0) || !std::isfinite(c) )
    return std::nullopt;

  const double temp = c - std::log( 100.0/target_percent - 1.0 ) / b;
  if( !std::isfinite(temp) )
    return std::nullopt;

  return temp;
}//inverse_tx(...)


double evaluate( const SigmoidFitResult &fit, const double temperature )
{
  if( !fit.fitted() )
    throw std::logic_error( "SigmoidFit::evaluate: sigmoid has not been successfully fit" );

  switch( fit.m_model )
  {
    case SigmoidFitModel::Constrained:
      return evaluate( fit.m_growth_rate, fit.m_inflection_temperature, temperature );

    case SigmoidFitModel::Unconstrained:
      return evaluate( fit.m_upper, fit.m_growth_rate, fit.m_inflection_temperature, fit.m_lower, temperature );
  }//switch( fit.m_model )

  throw std::logic_error( "SigmoidFit::evaluate: invalid model" );
}//evaluate( const SigmoidFitResult & ... )


std::optional<double> inverse_tx( const SigmoidFitResult &fit, const double target_percent )
{
  if( !fit.fitted() )
    throw std::logic_error( "SigmoidFit::inverse_tx: sigmoid has not been successfully fit" );

  switch( fit.m_model )
  {
    case SigmoidFitModel::Constrained:
      return inverse_tx( fit.m_growth_rate, fit.m_inflection_temperature, target_percent );

    case SigmoidFitModel::Unconstrained:
    {
      const double a = fit.m_upper, b = fit.m_growth_rate;
      const double c = fit.m_inflection_temperature, d = fit.m_lower;

      if( !std::isfinite(target_percent) || (b == 0.0) || !std::isfinite(b) )
        return std::nullopt;

      //Only the open range from the lower asymptote, d, up to the upper one, a, can be reached;
      //  a fit with a <= d has no valid TX values.
      if( (target_percent <= d) || (target_percent >= a) )
        return std::nullopt;

      const double log_arg = (a - d)/(target_percent - d) - 1.0;
      if( !(log_arg > 0.0) )
        return std::nullopt;

      const double temp = c - std::log( log_arg ) / b;
      if( !std::isfinite(temp) )
        return std::nullopt;

      return temp;
    }//case SigmoidFitModel::Unconstrained:
  }//switch( fit.m_model )

  throw std::logic_error( "SigmoidFit::inverse_tx: invalid model" );
}//inverse_tx( const SigmoidFitResult & ... )


SigmoidFitResult fit_sigmoid( const vector<double> &temperatures,
                              const vector<double> &conversions,
                              const SigmoidFitModel model )
{
  SigmoidFitResult result;
  result.m_model = model;
  result.m_upper = 100.0;
  result.m_lower = 0.0;
  result.m_num_points = temperatures.size();

  const size_t num_pars = SigmoidCostFunctor::number_parameters( model );

  if( temperatures.size() != conversions.size() )
  {
    result.m_status = SigmoidFitStatus::InvalidInput;
    result.m_error_message = "Number of temperatures (" + std::to_string(temperatures.size())
                             + ") does not match number of conversions ("
                             + std::to_string(conversions.size()) + ")";
    return result;
  }//if( temperatures.size() != conversions.size() )

  if( temperatures.size() < num_pars )
  {
    result.m_status = SigmoidFitStatus::InvalidInput;
    result.m_error_message = "At least " + std::to_string(num_pars) + " points are required for a "
                             + string(to_string(model)) + " fit, but only "
                             + std::to_string(temperatures.size()) + " were given";
    return result;
  }//if( not enough points )

  for( size_t i = 0; i < temperatures.size(); ++i )
  {
    if( !std::isfinite(temperatures[i]) || !std::isfinite(conversions[i]) )
    {
      result.m_status = SigmoidFitStatus::InvalidInput;
      result.m_error_message = "Non-finite temperature or conversion at point " + std::to_string(i);
      return result;
    }
  }//for( size_t i = 0; i < temperatures.size(); ++i )

  const double mean_conversion = std::accumulate( begin(conversions), end(conversions), 0.0 )
                                 / static_cast<double>( conversions.size() );
  double ss_tot = 0.0;
  for( const double conv : conversions )
    ss_tot += (conv - mean_conversion) * (conv - mean_conversion);

  if( ss_tot <= 0.0 )
  {
    //A flat line (e.g., a slope of zero in the calibration) has no inflection to find, and R2 is
    //  undefined, so we'll call this a failure instead of reporting a meaningless fit.
    result.m_status = SigmoidFitStatus::DegenerateData;
    result.m_error_message = "All conversions are identical; can not fit a sigmoid";
    return result;
  }//if( ss_tot <= 0.0 )

  vector<double> parameters( num_pars, 0.0 );
  switch( model )
  {
    case SigmoidFitModel::Constrained:
      parameters[0] = sm_initial_growth_rate;
      parameters[1] = temperature_nearest_conversion( temperatures, conversions, 50.0 );
      break;

    case SigmoidFitModel::Unconstrained:
    {
      const double max_conv = *std::max_element( begin(conversions), end(conversions) );
      const double min_conv = *std::min_element( begin(conversions), end(conversions) );
      parameters[0] = max_conv;
      parameters[1] = 0.02;
      parameters[2] = temperature_nearest_conversion( temperatures, conversions, 0.5*(max_conv + min_conv) );
      parameters[3] = min_conv;
      break;
    }
  }//switch( model )

  double * const pars = &parameters[0];

  try
  {
    auto cost_functor = new SigmoidCostFunctor( temperatures, conversions, model );

    auto cost_function = new ceres::DynamicAutoDiffCostFunction<SigmoidCostFunctor,4>( cost_functor );
    cost_function->AddParameterBlock( static_cast<int>(num_pars) );
    cost_function->SetNumResiduals( static_cast<int>(cost_functor->number_residuals()) );

    ceres::Problem problem;
    ceres::LossFunction *lossfcn = nullptr;
    problem.AddResidualBlock( cost_function, lossfcn, pars );

    //Conversion must increase with temperature, so the constrained growth rate must stay positive
    if( model == SigmoidFitModel::Constrained )
      problem.SetParameterLowerBound( pars, 0, sm_min_growth_rate );

    ceres::Solver::Options options;
    options.linear_solver_type = ceres::DENSE_QR;
    options.minimizer_type = ceres::TRUST_REGION;
    options.trust_region_strategy_type = ceres::LEVENBERG_MARQUARDT;
    options.max_num_iterations = sm_max_iterations;
    options.max_solver_time_in_seconds = 30.0;
    options.function_tolerance = 1e-10;
    options.parameter_tolerance = 1e-10;
    options.gradient_tolerance = 1e-12;
    options.num_threads = 1;

#if( PRINT_VERBOSE_SIGMOID_FIT_INFO )
    options.minimizer_progress_to_stdout = true;
    options.logging_type = ceres::PER_MINIMIZER_ITERATION;
#else
    options.minimizer_progress_to_stdout = false;
    options.logging_type = ceres::SILENT;
#endif

    ceres::Solver::Summary summary;
    ceres::Solve( options, &problem, &summary );

#if( PRINT_VERBOSE_SIGMOID_FIT_INFO )
    std::cout << summary.FullReport() << "\n";
#endif

    result.m_num_iterations = static_cast<int>( summary.iterations.size() );

    switch( summary.termination_type )
    {
      case ceres::CONVERGENCE:
      case ceres::USER_SUCCESS:
        break;

      case ceres::NO_CONVERGENCE:
        throw runtime_error( "The L-M ceres::Solver solving failed - NO_CONVERGENCE." );

      case ceres::FAILURE:
        throw runtime_error( "The L-M ceres::Solver solving failed - FAILURE." );

      case ceres::USER_FAILURE:
        throw runtime_error( "The L-M ceres::Solver solving failed - USER_FAILURE." );
    }//switch( summary.termination_type )

    for( const double par : parameters )
    {
      if( !std::isfinite(par) )
        throw runtime_error( "Fit parameters are not finite." );
    }

    double ss_res = 0.0;
    for( size_t i = 0; i < temperatures.size(); ++i )
    {
      double predicted = 0.0;
      if( model == SigmoidFitModel::Constrained )
        predicted = evaluate( parameters[0], parameters[1], temperatures[i] );
      else
        predicted = evaluate( parameters[0], parameters[1], parameters[2], parameters[3], temperatures[i] );

      ss_res += (conversions[i] - predicted) * (conversions[i] - predicted);
    }//for( size_t i = 0; i < temperatures.size(); ++i )

    result.m_sum_sq_residuals = ss_res;
    result.m_r_squared = 1.0 - ss_res / ss_tot;

    //Parameter uncertainties are a nice-to-have; not being able to compute them isnt a failure.
    result.m_uncertainties.resize( num_pars, 0.0 );

    ceres::Covariance::Options cov_options;
    cov_options.algorithm_type = ceres::CovarianceAlgorithmType::DENSE_SVD;
    cov_options.null_space_rank = -1;
    cov_options.min_reciprocal_condition_number = 1e-14;

    ceres::Covariance covariance( cov_options );
    vector<pair<const double*, const double*> > covariance_blocks;
    covariance_blocks.push_back( make_pair( pars, pars ) );

    if( covariance.Compute( covariance_blocks, &problem ) )
    {
      vector<double> row_major_covariance( num_pars * num_pars, 0.0 );
      if( covariance.GetCovarianceBlock( pars, pars, row_major_covariance.data() ) )
      {
        //Residuals are unweighted, so scale by the residual variance, like scipy's curve_fit does.
        const size_t dof = temperatures.size() - num_pars;
        const double res_variance = dof ? (ss_res / static_cast<double>(dof)) : 0.0;

        for( size_t i = 0; i < num_pars; ++i )
        {
          const double var = row_major_covariance[i*num_pars + i] * res_variance;
          if( var > 0.0 && std::isfinite(var) )
            result.m_uncertainties[i] = std::sqrt( var );
        }
      }//if( got covariance block )
    }else
    {
#if( PRINT_VERBOSE_SIGMOID_FIT_INFO )
      cerr << "SigmoidFit::fit_sigmoid: failed to compute covariance" << endl;
#endif
    }//if( covariance.Compute(...) ) / else
  }catch( std::exception &e )
  {
    result.m_status = SigmoidFitStatus::ErrorFindingSolution;
    result.m_error_message = e.what();

    cerr << "SigmoidFit::fit_sigmoid: Failed fitting " << to_string(model)
         << " sigmoid to " << temperatures.size() << " points: " << e.what() << endl;

    return result;
  }//try / catch

  switch( model )
  {
    case SigmoidFitModel::Constrained:
      result.m_growth_rate = parameters[0];
      result.m_inflection_temperature = parameters[1];
      break;

    case SigmoidFitModel::Unconstrained:
      result.m_upper = parameters[0];
      result.m_growth_rate = parameters[1];
      result.m_inflection_temperature = parameters[2];
      result.m_lower = parameters[3];
      break;
  }//switch( model )

  result.m_status = SigmoidFitStatus::Success;

  return result;
}//fit_sigmoid(...)


void fitted_curve( const SigmoidFitResult &fit,
                   const double temp_min, const double temp_max,
                   const size_t num_points,
                   std::vector<double> &temperatures,
                   std::vector<double> &conversions )
{
  if( !fit.fitted() )
    throw std::logic_error( "SigmoidFit::fitted_curve: sigmoid has not been successfully fit" );

  temperatures.resize( num_points );
  conversions.resize( num_points );

  for( size_t i = 0; i < num_points; ++i )
  {
    const double frac = (num_points > 1) ? (static_cast<double>(i) / (num_points - 1)) : 0.0;
    temperatures[i] = temp_min + frac*(temp_max - temp_min);
    conversions[i] = evaluate( fit, temperatures[i] );
  }
}//fitted_curve(...)


vector<double> normalize_tx_targets( vector<double> targets )
{
  std::sort( begin(targets), end(targets) );
  targets.erase( std::unique( begin(targets), end(targets) ), end(targets) );
  return targets;
}//normalize_tx_targets(...)


string tx_label( const double target_percent )
{
  char buffer[64] = { '\0' };

  const bool is_integral = std::isfinite(target_percent)
                           && (fabs(target_percent) < 1.0E9)
                           && (std::floor(target_percent) == target_percent);
  if( is_integral )
  {
    snprintf( buffer, sizeof(buffer), "T%lld", static_cast<long long>(target_percent) );
    return buffer;
  }

  //Use the fewest significant digits that still read back as the same value, so distinct
  //  targets always get distinct labels (e.g., 50.01 -> "T50.01", 50.04 -> "T50.04").
  for( int precision = 1; precision <= 17; ++precision )
  {
    snprintf( buffer, sizeof(buffer), "T%.*g", precision, target_percent );
    if( std::strtod( buffer + 1, nullptr ) == target_percent )
      break;
  }

  return buffer;
}//tx_label(...)


SigmoidFitter::SigmoidFitter( const SigmoidFitModel model )
  : m_model( model ),
    m_result(),
    m_temperatures(),
    m_conversions()
{
  m_result.m_model = model;
}


bool SigmoidFitter::fit( const vector<double> &temperatures, const vector<double> &conversions )
{
  m_temperatures = temperatures;
  m_conversions = conversions;
  m_result = fit_sigmoid( temperatures, conversions, m_model );

  return m_result.fitted();
}//fit(...)


SigmoidFitModel SigmoidFitter::model() const
{
  return m_model;
}


bool SigmoidFitter::has_fit() const
{
  return m_result.fitted();
}


const SigmoidFitResult &SigmoidFitter::result() const
{
  return m_result;
}


void SigmoidFitter::check_fit() const
{
  if( !m_result.fitted() )
    throw std::logic_error( "SigmoidFitter: fit(...) must succeed before the curve can be used" );
}


double SigmoidFitter::evaluate( const double temperature ) const
{
  check_fit();
  return SigmoidFit::evaluate( m_result, temperature );
}


std::optional<double> SigmoidFitter::inverse_tx( const double target_percent ) const
{
  check_fit();
  return SigmoidFit::inverse_tx( m_result, target_percent );
}


vector<TxValue> SigmoidFitter::tx_values( const vector<double> &targets ) const
{
  check_fit();

  vector<TxValue> answer;
  for( const double target : normalize_tx_targets( targets ) )
  {
    TxValue tx;
    tx.target_percent = target;
    tx.label = tx_label( target );
    tx.temperature = SigmoidFit::inverse_tx( m_result, target );
    answer.push_back( tx );
  }

  return answer;
}//tx_values(...)


void SigmoidFitter::fitted_curve( vector<double> &temperatures, vector<double> &conversions,
                                  const size_t num_points ) const
{
  check_fit();

  const auto minmax = std::minmax_element( begin(m_temperatures), end(m_temperatures) );
  SigmoidFit::fitted_curve( m_result, *minmax.first - 20.0, *minmax.second + 20.0,
                            num_points, temperatures, conversions );
}//fitted_curve(...)

}//namespace SigmoidFit
