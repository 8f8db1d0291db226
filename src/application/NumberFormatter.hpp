/**
 * @file NumberFormatter.hpp
 * @brief Display formatting for evaluator results.
 */

#pragma once

#include <string>

namespace logicchat::application {

/**
 * @brief Renders a number the way replies show it.
 *
 * Integral values print without a fractional part ("4", not "4.0"); other
 * values use the shortest decimal text that reads back to the same double.
 */
std::string FormatNumber(double value);

} // namespace logicchat::application
