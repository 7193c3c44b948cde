// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "console_notifier.hpp"

namespace imgdrop {
namespace cli {

uploader::DeliveryStatus ConsoleNotifier::deliver(const uploader::Notification& notification) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!out_) {
    return uploader::DeliveryStatus::FAILED;
  }

  out_ << "[" << notification.title << "] " << notification.message;
  if (!notification.image_url.empty()) {
    out_ << " " << notification.image_url;
  }
  out_ << std::endl;
  return uploader::DeliveryStatus::DELIVERED;
}

}  // namespace cli
}  // namespace imgdrop
