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

#include "egress/KillSwitch.h"

namespace egress {

void KillSwitch::Watcher::Wait() const {
  m_state_->notification.WaitForNotification();
}

bool KillSwitch::Watcher::WaitFor(absl::Duration timeout) const {
  return m_state_->notification.WaitForNotificationWithTimeout(timeout);
}

bool KillSwitch::Watcher::Fired() const {
  return m_state_->notification.HasBeenNotified();
}

KillSwitch::KillSwitch() : m_state_(std::make_shared<State>()) {}

bool KillSwitch::Trigger() {
  std::vector<std::function<void()>> callbacks;
  {
    absl::MutexLock lk(&m_state_->mtx);
    if (m_state_->triggered) return false;
    m_state_->triggered = true;
    callbacks.swap(m_state_->callbacks);
  }

  // absl::Notification must be notified at most once, which is guaranteed
  // by the triggered flag above.
  m_state_->notification.Notify();

  for (auto& cb : callbacks) cb();
  return true;
}

bool KillSwitch::IsTriggered() const {
  absl::MutexLock lk(&m_state_->mtx);
  return m_state_->triggered;
}

KillSwitch::Watcher KillSwitch::Watch() const { return Watcher(m_state_); }

void KillSwitch::OnTrigger(std::function<void()> cb) {
  {
    absl::MutexLock lk(&m_state_->mtx);
    if (!m_state_->triggered) {
      m_state_->callbacks.emplace_back(std::move(cb));
      return;
    }
  }

  cb();
}

}  // namespace egress
