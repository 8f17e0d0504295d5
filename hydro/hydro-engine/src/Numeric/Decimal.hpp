// Ticket: 0001_decimal_numeric_policy

#ifndef HYDRO_ENGINE_NUMERIC_DECIMAL_HPP
#define HYDRO_ENGINE_NUMERIC_DECIMAL_HPP

#include <Eigen/Dense>
#include <boost/math/constants/constants.hpp>
#include <boost/multiprecision/cpp_dec_float.hpp>
#include <boost/multiprecision/eigen.hpp>

namespace hydro_engine
{

/**
 * @brief Base-10 floating type used for every geometric and hydrostatic value
 *
 * 28 significant decimal digits. Expression templates are disabled so that
 * Decimal behaves like a plain value type inside Eigen and std containers.
 */
using Decimal = boost::multiprecision::number<
  boost::multiprecision::cpp_dec_float<28>,
  boost::multiprecision::et_off>;

using DecimalMatrix = Eigen::Matrix<Decimal, Eigen::Dynamic, Eigen::Dynamic>;
using PresenceMask = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic>;
using Jacobian2 = Eigen::Matrix<Decimal, 2, 2>;
using Vector2 = Eigen::Matrix<Decimal, 2, 1>;

/// Number of fractional digits kept on published results
constexpr int kResultDigits = 6;

namespace Numeric
{

/**
 * @brief Round to a fixed number of fractional digits, half away from zero
 * @param value Value to quantize
 * @param digits Fractional digits to keep [0, 20]
 * @return Quantized value
 */
[[nodiscard]] Decimal quantize(const Decimal& value, int digits = kResultDigits);

[[nodiscard]] Decimal pi();

[[nodiscard]] Decimal degreesToRadians(const Decimal& degrees);

[[nodiscard]] Decimal radiansToDegrees(const Decimal& radians);

/// Conversion used when handing values to the logger
[[nodiscard]] inline double toDouble(const Decimal& value)
{
  return static_cast<double>(value);
}

}  // namespace Numeric

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_NUMERIC_DECIMAL_HPP
