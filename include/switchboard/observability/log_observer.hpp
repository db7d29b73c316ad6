#pragma once

#include "switchboard/observability/observer.hpp"

namespace switchboard::observability {

class LogObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
};

} // namespace switchboard::observability
