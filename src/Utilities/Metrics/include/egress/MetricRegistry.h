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

#include <map>
#include <string>
#include <vector>

#include "egress/PublicHeader.h"
#include "protos/Metrics.pb.h"

namespace egress {

using MetricFamily = egress::grpc::MetricFamily;
using MetricLabels = std::map<std::string, std::string>;

class MetricGatherer {
 public:
  virtual ~MetricGatherer() = default;

  virtual EgressExpected<std::vector<MetricFamily>> Gather() = 0;
};

/**
 * Process-wide registry of counters and gauges. Families are gathered in
 * name order, the samples of a family in label order.
 */
class MetricRegistry : public MetricGatherer {
 public:
  MetricRegistry() = default;
  ~MetricRegistry() override = default;

  MetricRegistry(const MetricRegistry&) = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;

  EgressExpected<void> RegisterCounter(const std::string& name,
                                       const std::string& help);
  EgressExpected<void> RegisterGauge(const std::string& name,
                                     const std::string& help);

  EgressExpected<void> IncCounter(const std::string& name,
                                  const MetricLabels& labels,
                                  double delta = 1);
  EgressExpected<void> SetGauge(const std::string& name,
                                const MetricLabels& labels, double value);

  EgressExpected<std::vector<MetricFamily>> Gather() override;

 private:
  struct Family {
    std::string help;
    egress::grpc::MetricType type;
    std::map<MetricLabels, double> samples;
  };

  EgressExpected<void> Register_(const std::string& name,
                                 const std::string& help,
                                 egress::grpc::MetricType type);

  absl::Mutex m_mtx_;
  std::map<std::string, Family> m_families_ ABSL_GUARDED_BY(m_mtx_);
};

struct RenderedMetrics {
  std::string text;
  size_t entries{0};
};

// Writes one family in the Prometheus text exposition format (0.0.4).
// Returns the number of sample lines written. On failure out may hold a
// partially written family.
EgressExpected<size_t> MetricFamilyToText(const MetricFamily& family,
                                          std::string* out);

// Concatenates all families in enumeration order. The first family which
// fails to serialize aborts the whole render.
EgressExpected<RenderedMetrics> RenderMetrics(
    const std::vector<MetricFamily>& families);

}  // namespace egress
