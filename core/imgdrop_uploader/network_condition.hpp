// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_NETWORK_CONDITION_HPP
#define IMGDROP_NETWORK_CONDITION_HPP

#include <memory>
#include <string>
#include <vector>

#include "error_classifier.hpp"

namespace imgdrop {
namespace uploader {

enum class NetworkCondition { GOOD, DEGRADED, POOR, OFFLINE };

std::string networkConditionToString(NetworkCondition condition);

/**
 * Host connectivity capability. Injected so tests can simulate an offline host.
 */
class IConnectivityProbe {
public:
  virtual ~IConnectivityProbe() = default;
  virtual bool isOnline() const = 0;
};

/**
 * Reports online when any non-loopback interface is up and running (getifaddrs).
 */
class InterfaceConnectivityProbe : public IConnectivityProbe {
public:
  bool isOnline() const override;
};

/**
 * Aggregates the error categories seen during one operation into a coarse
 * NetworkCondition. The caller owns the history and decides how long it is.
 *
 *   timeouts >= 2 or temporaries >= 3  -> POOR
 *   timeouts == 1 or temporaries >= 1  -> DEGRADED
 *   host reports no connectivity       -> OFFLINE
 *   otherwise                          -> GOOD
 */
class NetworkConditionEstimator {
public:
  explicit NetworkConditionEstimator(std::shared_ptr<IConnectivityProbe> probe = nullptr);

  NetworkCondition estimate(const std::vector<ErrorCategory>& recent_categories) const;

private:
  std::shared_ptr<IConnectivityProbe> probe_;
};

}  // namespace uploader
}  // namespace imgdrop

#endif  // IMGDROP_NETWORK_CONDITION_HPP
