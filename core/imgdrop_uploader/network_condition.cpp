// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "network_condition.hpp"

#include <ifaddrs.h>
#include <net/if.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#define IMGDROP_LOG_COMPONENT "network"
#include <imgdrop_log_macros.hpp>

namespace imgdrop {
namespace uploader {

std::string networkConditionToString(NetworkCondition condition) {
  switch (condition) {
    case NetworkCondition::GOOD:
      return "good";
    case NetworkCondition::DEGRADED:
      return "degraded";
    case NetworkCondition::POOR:
      return "poor";
    case NetworkCondition::OFFLINE:
      return "offline";
  }
  return "unknown";
}

bool InterfaceConnectivityProbe::isOnline() const {
  struct ifaddrs* interfaces = nullptr;
  if (getifaddrs(&interfaces) != 0) {
    // Cannot tell; do not block uploads on a failed query
    IMGDROP_LOG_WARN_THROTTLE(
      60, "Interface query failed" << ::imgdrop::logging::kv("error", std::string(std::strerror(errno)))
    );
    return true;
  }

  bool online = false;
  for (struct ifaddrs* ifa = interfaces; ifa != nullptr; ifa = ifa->ifa_next) {
    const unsigned int flags = ifa->ifa_flags;
    if ((flags & IFF_UP) && (flags & IFF_RUNNING) && !(flags & IFF_LOOPBACK)) {
      online = true;
      break;
    }
  }
  freeifaddrs(interfaces);
  return online;
}

NetworkConditionEstimator::NetworkConditionEstimator(std::shared_ptr<IConnectivityProbe> probe)
    : probe_(probe ? std::move(probe) : std::make_shared<InterfaceConnectivityProbe>()) {}

NetworkCondition NetworkConditionEstimator::estimate(
  const std::vector<ErrorCategory>& recent_categories
) const {
  const auto timeout_count =
    std::count(recent_categories.begin(), recent_categories.end(), ErrorCategory::TIMEOUT);
  const auto temporary_count =
    std::count(recent_categories.begin(), recent_categories.end(), ErrorCategory::TEMPORARY);

  if (timeout_count >= 2 || temporary_count >= 3) {
    return NetworkCondition::POOR;
  }
  if (timeout_count == 1 || temporary_count >= 1) {
    return NetworkCondition::DEGRADED;
  }
  if (!probe_->isOnline()) {
    return NetworkCondition::OFFLINE;
  }
  return NetworkCondition::GOOD;
}

}  // namespace uploader
}  // namespace imgdrop
