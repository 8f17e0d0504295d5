// Ticket: 0003_composite_quadrature

#ifndef HYDRO_ENGINE_INTEGRATION_QUADRATURE_HPP
#define HYDRO_ENGINE_INTEGRATION_QUADRATURE_HPP

#include <span>

#include "hydro-engine/src/Numeric/Decimal.hpp"

namespace hydro_engine
{

/**
 * @brief Composite quadrature over tabulated, possibly non-uniform samples
 *
 * Abscissae must be strictly increasing. Sample counts below two integrate
 * to zero.
 */
namespace Quadrature
{

/**
 * @brief Trapezoidal rule over all intervals
 * @throws ArgumentError if x and y differ in length
 */
[[nodiscard]] Decimal trapezoid(std::span<const Decimal> x,
                                std::span<const Decimal> y);

/**
 * @brief Composite Simpson's rule with a trapezoid fallback
 *
 * Intervals are consumed left to right. Two neighbouring intervals of equal
 * width (relative difference below 1e-9) take the three-point rule
 *
 *   (h0 + h1)/6 * [(2 - h1/h0) f0 + (h0 + h1)^2/(h0 h1) f1 + (2 - h0/h1) f2]
 *
 * Any other interval takes the trapezoid, so an odd interval count finishes
 * with a trapezoid and unevenly spaced samples never overshoot.
 *
 * @throws ArgumentError if x and y differ in length
 */
[[nodiscard]] Decimal simpson(std::span<const Decimal> x,
                              std::span<const Decimal> y);

}  // namespace Quadrature

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_INTEGRATION_QUADRATURE_HPP
