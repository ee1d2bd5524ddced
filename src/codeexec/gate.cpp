#include <codeexec/gate.h>

#include <algorithm>

#include <spdlog/spdlog.h>

AdmissionGate::AdmissionGate(int capacity) :
    capacity_(std::max(capacity, 1)), in_use_(0), peak_in_use_(0) {}

bool AdmissionGate::Acquire(Clock::time_point deadline) {
  std::unique_lock lck(mtx_);
  if (!cv_.wait_until(lck, deadline, [this]{ return in_use_ < capacity_; })) {
    spdlog::info("Admission timed out: in_use={} capacity={}", in_use_, capacity_);
    return false;
  }
  peak_in_use_ = std::max(peak_in_use_, ++in_use_);
  spdlog::debug("Admission granted: in_use={} capacity={}", in_use_, capacity_);
  return true;
}

bool AdmissionGate::TryAcquire() {
  std::lock_guard lck(mtx_);
  if (in_use_ >= capacity_) return false;
  peak_in_use_ = std::max(peak_in_use_, ++in_use_);
  return true;
}

void AdmissionGate::Release() {
  {
    std::lock_guard lck(mtx_);
    if (in_use_ > 0) in_use_--;
  }
  cv_.notify_one();
}

int AdmissionGate::InUse() {
  std::lock_guard lck(mtx_);
  return in_use_;
}

int AdmissionGate::Available() {
  std::lock_guard lck(mtx_);
  return capacity_ - in_use_;
}

int AdmissionGate::PeakInUse() {
  std::lock_guard lck(mtx_);
  return peak_in_use_;
}
