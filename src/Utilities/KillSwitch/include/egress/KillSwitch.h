/**
 * Copyright (c) 2024 Peking University and Peking University
 * Changsha Institute for Computing and Digital Economy
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as
 * published by the Free Software Foundation, either version 3 of the
 * License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <absl/base/thread_annotations.h>
#include <absl/synchronization/mutex.h>
#include <absl/synchronization/notification.h>
#include <absl/time/time.h>

#include <functional>
#include <memory>
#include <vector>

namespace egress {

/**
 * One-shot broadcast signal. The switch starts armed and is broken by the
 * first Trigger(). Every later Trigger() is a no-op. Any number of watchers
 * may observe the transition, whether they started watching before or after
 * it happened.
 */
class KillSwitch {
  struct State {
    absl::Mutex mtx;
    bool triggered ABSL_GUARDED_BY(mtx){false};
    std::vector<std::function<void()>> callbacks ABSL_GUARDED_BY(mtx);
    absl::Notification notification;
  };

 public:
  class Watcher {
   public:
    // Blocks until the switch is triggered.
    void Wait() const;

    // Returns false if the switch is still armed after timeout.
    bool WaitFor(absl::Duration timeout) const;

    [[nodiscard]] bool Fired() const;

   private:
    friend class KillSwitch;
    explicit Watcher(std::shared_ptr<const State> state)
        : m_state_(std::move(state)) {}

    std::shared_ptr<const State> m_state_;
  };

  KillSwitch();
  ~KillSwitch() = default;

  KillSwitch(const KillSwitch&) = delete;
  KillSwitch(KillSwitch&&) = delete;
  KillSwitch& operator=(const KillSwitch&) = delete;
  KillSwitch& operator=(KillSwitch&&) = delete;

  // Thread-safe and never blocks on watchers. Returns true only for the call
  // which broke the switch.
  bool Trigger();

  [[nodiscard]] bool IsTriggered() const;

  [[nodiscard]] Watcher Watch() const;

  // cb is invoked exactly once: by the triggering thread, or immediately on
  // the calling thread if the switch has already been triggered.
  void OnTrigger(std::function<void()> cb);

 private:
  std::shared_ptr<State> m_state_;
};

}  // namespace egress
