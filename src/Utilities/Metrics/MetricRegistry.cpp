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

#include "egress/MetricRegistry.h"

#include <cmath>

#include "egress/Logger.h"

namespace egress {

namespace {

using egress::grpc::Metric;
using egress::grpc::MetricType;

std::string_view MetricTypeStr(MetricType type) {
  switch (type) {
  case MetricType::COUNTER:
    return "counter";
  case MetricType::GAUGE:
    return "gauge";
  case MetricType::SUMMARY:
    return "summary";
  case MetricType::HISTOGRAM:
    return "histogram";
  default:
    return "untyped";
  }
}

std::string FormatFloat(double v) {
  if (std::isnan(v)) return "NaN";
  if (std::isinf(v)) return v > 0 ? "+Inf" : "-Inf";
  return fmt::format("{}", v);
}

std::string EscapeString(std::string_view s, bool escape_quote) {
  std::string escaped;
  escaped.reserve(s.size());
  for (char c : s) {
    if (c == '\\') {
      escaped += "\\\\";
    } else if (c == '\n') {
      escaped += "\\n";
    } else if (c == '"' && escape_quote) {
      escaped += "\\\"";
    } else {
      escaped += c;
    }
  }
  return escaped;
}

// Writes one sample line. extra_name/extra_value append a synthetic label
// such as quantile or le.
void WriteSample(std::string* out, std::string_view name,
                 std::string_view suffix, const Metric& metric,
                 std::string_view extra_name, std::string_view extra_value,
                 std::string_view value) {
  out->append(name);
  out->append(suffix);

  bool has_label = metric.label_size() > 0 || !extra_name.empty();
  if (has_label) {
    out->push_back('{');
    bool first = true;
    for (const auto& label : metric.label()) {
      if (!first) out->push_back(',');
      first = false;
      fmt::format_to(std::back_inserter(*out), "{}=\"{}\"", label.name(),
                     EscapeString(label.value(), true));
    }
    if (!extra_name.empty()) {
      if (!first) out->push_back(',');
      fmt::format_to(std::back_inserter(*out), "{}=\"{}\"", extra_name,
                     extra_value);
    }
    out->push_back('}');
  }

  out->push_back(' ');
  out->append(value);
  if (metric.timestamp_ms() != 0)
    fmt::format_to(std::back_inserter(*out), " {}", metric.timestamp_ms());
  out->push_back('\n');
}

}  // namespace

EgressExpected<size_t> MetricFamilyToText(const MetricFamily& family,
                                          std::string* out) {
  const std::string& name = family.name();
  if (name.empty())
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_METRICS,
                                         "MetricFamily has no name"));
  if (family.metric_size() == 0)
    return std::unexpected(FormatRichErr(
        EgressErrCode::ERR_METRICS, "MetricFamily {} has no metrics", name));

  if (!family.help().empty())
    fmt::format_to(std::back_inserter(*out), "# HELP {} {}\n", name,
                   EscapeString(family.help(), false));
  fmt::format_to(std::back_inserter(*out), "# TYPE {} {}\n", name,
                 MetricTypeStr(family.type()));

  size_t entries = 0;
  for (const Metric& metric : family.metric()) {
    switch (family.type()) {
    case MetricType::COUNTER:
      if (!metric.has_counter())
        return std::unexpected(FormatRichErr(
            EgressErrCode::ERR_METRICS, "Expected counter in metric of {}",
            name));
      WriteSample(out, name, "", metric, "", "",
                  FormatFloat(metric.counter().value()));
      entries++;
      break;

    case MetricType::GAUGE:
      if (!metric.has_gauge())
        return std::unexpected(FormatRichErr(
            EgressErrCode::ERR_METRICS, "Expected gauge in metric of {}",
            name));
      WriteSample(out, name, "", metric, "", "",
                  FormatFloat(metric.gauge().value()));
      entries++;
      break;

    case MetricType::UNTYPED:
      if (!metric.has_untyped())
        return std::unexpected(FormatRichErr(
            EgressErrCode::ERR_METRICS, "Expected untyped in metric of {}",
            name));
      WriteSample(out, name, "", metric, "", "",
                  FormatFloat(metric.untyped().value()));
      entries++;
      break;

    case MetricType::SUMMARY: {
      if (!metric.has_summary())
        return std::unexpected(FormatRichErr(
            EgressErrCode::ERR_METRICS, "Expected summary in metric of {}",
            name));
      const auto& summary = metric.summary();
      for (const auto& q : summary.quantile()) {
        WriteSample(out, name, "", metric, "quantile",
                    FormatFloat(q.quantile()), FormatFloat(q.value()));
        entries++;
      }
      WriteSample(out, name, "_sum", metric, "", "",
                  FormatFloat(summary.sample_sum()));
      WriteSample(out, name, "_count", metric, "", "",
                  std::to_string(summary.sample_count()));
      entries += 2;
      break;
    }

    case MetricType::HISTOGRAM: {
      if (!metric.has_histogram())
        return std::unexpected(FormatRichErr(
            EgressErrCode::ERR_METRICS, "Expected histogram in metric of {}",
            name));
      const auto& histogram = metric.histogram();
      bool inf_seen = false;
      for (const auto& b : histogram.bucket()) {
        WriteSample(out, name, "_bucket", metric, "le",
                    FormatFloat(b.upper_bound()),
                    std::to_string(b.cumulative_count()));
        entries++;
        if (std::isinf(b.upper_bound()) && b.upper_bound() > 0)
          inf_seen = true;
      }
      if (!inf_seen) {
        WriteSample(out, name, "_bucket", metric, "le", "+Inf",
                    std::to_string(histogram.sample_count()));
        entries++;
      }
      WriteSample(out, name, "_sum", metric, "", "",
                  FormatFloat(histogram.sample_sum()));
      WriteSample(out, name, "_count", metric, "", "",
                  std::to_string(histogram.sample_count()));
      entries += 2;
      break;
    }

    default:
      return std::unexpected(
          FormatRichErr(EgressErrCode::ERR_METRICS,
                        "Unknown metric type {} of {}",
                        static_cast<int>(family.type()), name));
    }
  }

  return entries;
}

EgressExpected<RenderedMetrics> RenderMetrics(
    const std::vector<MetricFamily>& families) {
  RenderedMetrics rendered;
  for (const auto& family : families) {
    auto written = MetricFamilyToText(family, &rendered.text);
    if (!written) {
      EGRESS_ERROR("Error writing metric family {}: {}", family.name(),
                   written.error().description());
      return std::unexpected(written.error());
    }
    rendered.entries += written.value();
  }

  return rendered;
}

EgressExpected<void> MetricRegistry::Register_(const std::string& name,
                                               const std::string& help,
                                               MetricType type) {
  if (name.empty())
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_INVALID_PARAM,
                                         "Empty metric name"));

  absl::MutexLock lk(&m_mtx_);
  auto [it, inserted] = m_families_.try_emplace(name);
  if (!inserted) {
    if (it->second.type != type)
      return std::unexpected(
          FormatRichErr(EgressErrCode::ERR_INVALID_PARAM,
                        "Metric {} is already registered as {}", name,
                        MetricTypeStr(it->second.type)));
    return {};
  }

  it->second.help = help;
  it->second.type = type;
  return {};
}

EgressExpected<void> MetricRegistry::RegisterCounter(const std::string& name,
                                                     const std::string& help) {
  return Register_(name, help, MetricType::COUNTER);
}

EgressExpected<void> MetricRegistry::RegisterGauge(const std::string& name,
                                                   const std::string& help) {
  return Register_(name, help, MetricType::GAUGE);
}

EgressExpected<void> MetricRegistry::IncCounter(const std::string& name,
                                                const MetricLabels& labels,
                                                double delta) {
  if (delta < 0)
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_INVALID_PARAM,
                                         "Counter {} cannot decrease", name));

  absl::MutexLock lk(&m_mtx_);
  auto it = m_families_.find(name);
  if (it == m_families_.end() || it->second.type != MetricType::COUNTER)
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_INVALID_PARAM,
                                         "Counter {} is not registered", name));

  it->second.samples[labels] += delta;
  return {};
}

EgressExpected<void> MetricRegistry::SetGauge(const std::string& name,
                                              const MetricLabels& labels,
                                              double value) {
  absl::MutexLock lk(&m_mtx_);
  auto it = m_families_.find(name);
  if (it == m_families_.end() || it->second.type != MetricType::GAUGE)
    return std::unexpected(FormatRichErr(EgressErrCode::ERR_INVALID_PARAM,
                                         "Gauge {} is not registered", name));

  it->second.samples[labels] = value;
  return {};
}

EgressExpected<std::vector<MetricFamily>> MetricRegistry::Gather() {
  std::vector<MetricFamily> families;

  absl::MutexLock lk(&m_mtx_);
  for (const auto& [name, family] : m_families_) {
    // Families without samples are not exposed.
    if (family.samples.empty()) continue;

    MetricFamily& mf = families.emplace_back();
    mf.set_name(name);
    mf.set_help(family.help);
    mf.set_type(family.type);
    for (const auto& [labels, value] : family.samples) {
      Metric* metric = mf.add_metric();
      for (const auto& [label_name, label_value] : labels) {
        auto* pair = metric->add_label();
        pair->set_name(label_name);
        pair->set_value(label_value);
      }
      if (family.type == MetricType::COUNTER)
        metric->mutable_counter()->set_value(value);
      else
        metric->mutable_gauge()->set_value(value);
    }
  }

  return families;
}

}  // namespace egress
