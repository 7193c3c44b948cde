// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef IMGDROP_CLI_CONSOLE_NOTIFIER_HPP
#define IMGDROP_CLI_CONSOLE_NOTIFIER_HPP

#include <mutex>
#include <ostream>

#include <notification_coalescer.hpp>

namespace imgdrop {
namespace cli {

/**
 * Prints coalesced upload notifications as "[Title] message" lines.
 */
class ConsoleNotifier : public uploader::INotificationSink {
public:
  explicit ConsoleNotifier(std::ostream& out)
      : out_(out) {}

  uploader::DeliveryStatus deliver(const uploader::Notification& notification) override;

private:
  std::ostream& out_;
  std::mutex mutex_;
};

}  // namespace cli
}  // namespace imgdrop

#endif  // IMGDROP_CLI_CONSOLE_NOTIFIER_HPP
