// Ticket: 0002_engine_error_taxonomy

#ifndef HYDRO_ENGINE_ERRORS_HPP
#define HYDRO_ENGINE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace hydro_engine
{

/// Malformed caller input (non-positive draft, inverted range, too few points)
class ArgumentError final : public std::invalid_argument
{
public:
  explicit ArgumentError(const std::string& message)
    : std::invalid_argument(message)
  {
  }
};

/// Geometry cannot support integration at all
class GeometryIncompleteError final : public std::runtime_error
{
public:
  explicit GeometryIncompleteError(const std::string& message)
    : std::runtime_error(message)
  {
  }
};

/// Geometry is valid but the requested condition has nothing to integrate
class InvalidOperationError final : public std::runtime_error
{
public:
  explicit InvalidOperationError(const std::string& message)
    : std::runtime_error(message)
  {
  }
};

class NotFoundError final : public std::runtime_error
{
public:
  explicit NotFoundError(const std::string& message)
    : std::runtime_error(message)
  {
  }
};

/// Raised when a sweep observes a stop request between iterations
class OperationCancelledError final : public std::runtime_error
{
public:
  explicit OperationCancelledError(const std::string& message)
    : std::runtime_error(message)
  {
  }
};

/**
 * @brief Internal consistency failure of the integration
 *
 * Raised when a result violates a physical invariant that holds for every
 * valid hull (e.g. displacement decreasing with draft). Indicates a defect,
 * never a legitimate outcome.
 */
class NumericalDefectError final : public std::logic_error
{
public:
  explicit NumericalDefectError(const std::string& message)
    : std::logic_error(message)
  {
  }
};

}  // namespace hydro_engine

#endif  // HYDRO_ENGINE_ERRORS_HPP
