#pragma once

#include <string>
#include <utility>

namespace charge_monitor
{

/**
 * @struct OperationResult
 * @brief Outcome of a best-effort side effect (delivery, persistence).
 *
 * Failures carry a human-readable reason for logging; they are never thrown.
 */
struct OperationResult
{
  bool ok{true};
  std::string reason;

  static OperationResult success() { return OperationResult{}; }
  static OperationResult failure(std::string why) { return OperationResult{false, std::move(why)}; }
};

}  // namespace charge_monitor
