#ifndef INCLUDE_CODEEXEC_GATE_H_
#define INCLUDE_CODEEXEC_GATE_H_

#include <chrono>
#include <mutex>
#include <condition_variable>

// Bounded counter of running sandboxes. Waiters are not ordered.
class AdmissionGate {
  std::mutex mtx_;
  std::condition_variable cv_;
  int capacity_;
  int in_use_;
  int peak_in_use_;
 public:
  using Clock = std::chrono::steady_clock;

  explicit AdmissionGate(int capacity);
  AdmissionGate(const AdmissionGate&) = delete;
  AdmissionGate& operator=(const AdmissionGate&) = delete;

  // return false if no slot became available before deadline
  bool Acquire(Clock::time_point deadline);
  bool TryAcquire();
  void Release();

  int Capacity() const { return capacity_; }
  int InUse();
  int Available();
  int PeakInUse();
};

class AdmissionSlot {
  AdmissionGate* gate_;
 public:
  AdmissionSlot(AdmissionGate& gate, AdmissionGate::Clock::time_point deadline) :
      gate_(gate.Acquire(deadline) ? &gate : nullptr) {}
  AdmissionSlot(const AdmissionSlot&) = delete;
  AdmissionSlot& operator=(const AdmissionSlot&) = delete;
  ~AdmissionSlot() {
    if (gate_) gate_->Release();
  }
  bool Acquired() const { return gate_ != nullptr; }
};

#endif  // INCLUDE_CODEEXEC_GATE_H_
