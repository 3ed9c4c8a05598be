#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

#include "meter/sensor/sensor_driver.h"

namespace meter::tests {

// Observations shared with the test after the driver is handed to a gate.
struct SensorStats final {
  std::atomic<int> init_calls{0};
  std::atomic<int> measure_calls{0};
  std::atomic<int> in_flight{0};
  std::atomic<int> max_in_flight{0};
};

// Returns queued readings in order (the last one repeats), or fails on demand.
class ScriptedSensor final : public sensor::SensorDriver {
 public:
  explicit ScriptedSensor(std::shared_ptr<SensorStats> stats) : stats_(std::move(stats)) {}

  const char* name() const override { return "scripted"; }

  Status init() override {
    ++stats_->init_calls;
    if (fail_init) return Status::IoError("no device", 19);
    return Status::Ok();
  }

  Status measure(Measurement& out) override {
    const int now = ++stats_->in_flight;
    int seen = stats_->max_in_flight.load();
    while (now > seen && !stats_->max_in_flight.compare_exchange_weak(seen, now)) {
    }
    ++stats_->measure_calls;

    if (read_delay.count() > 0) std::this_thread::sleep_for(read_delay);

    Status st = Status::Ok();
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (fail_next_ > 0) {
        --fail_next_;
        st = Status::IoError("bus fault", 5);
      } else if (!readings_.empty()) {
        out = readings_.front();
        if (readings_.size() > 1) readings_.erase(readings_.begin());
      }
    }

    --stats_->in_flight;
    return st;
  }

  void push(Measurement m) {
    std::lock_guard<std::mutex> lock(mu_);
    readings_.push_back(m);
  }

  void fail_next_reads(int n) {
    std::lock_guard<std::mutex> lock(mu_);
    fail_next_ = n;
  }

  bool fail_init{false};
  std::chrono::milliseconds read_delay{0};

 private:
  std::shared_ptr<SensorStats> stats_;
  std::mutex mu_;
  std::vector<Measurement> readings_;
  int fail_next_{0};
};

inline Measurement reading(double t, double p, double h) {
  Measurement m{};
  m.temperature_c = t;
  m.pressure_pa = p;
  m.humidity_pct = h;
  return m;
}

}  // namespace meter::tests
