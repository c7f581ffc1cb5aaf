/**
 * @file Errors.hpp
 * @brief Exception types and the precondition macro.
 *
 * Every failure the library reports is one of the three exceptions
 * below. NEURON_CHECK raises them and can be compiled out with
 * NEURON_DISABLE_ERROR_CHECKS.
 */
#ifndef NEURON_ERRORS_HPP
#define NEURON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace neuron
{

/**
 * @brief Invalid argument: shape mismatch, bad topology, empty batch,
 * null collaborator.
 */
class validation_error : public std::invalid_argument
{
public:
    explicit validation_error(const std::string& message)
        : std::invalid_argument("Validation Error: " + message) {}
};

/**
 * @brief Index or view outside its tensor, or a size that overflows.
 */
class bounds_error : public std::out_of_range
{
public:
    explicit bounds_error(const std::string& message)
        : std::out_of_range("Bounds Error: " + message) {}
};

/**
 * @brief USM allocation failure on the SYCL device.
 */
class device_error : public std::runtime_error
{
public:
    explicit device_error(const std::string& message)
        : std::runtime_error("Device Error: " + message) {}
};

} // namespace neuron

/**
 * @brief Throw @p exception_type with @p message when @p condition holds.
 *
 *   NEURON_CHECK(batch.empty(), validation_error, "batch is empty");
 */
#ifndef NEURON_DISABLE_ERROR_CHECKS
  #define NEURON_CHECK(condition, exception_type, message) \
   do \
   { \
      if (condition) \
      { \
         throw exception_type(message); \
      } \
   } while(0)
#else
  #define NEURON_CHECK(condition, exception_type, message) ((void)0)
#endif

#endif // NEURON_ERRORS_HPP
