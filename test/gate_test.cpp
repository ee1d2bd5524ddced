#include <atomic>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <codeexec/gate.h>

using namespace std::chrono_literals;

TEST(AdmissionGate, CapacityAtLeastOne) {
  AdmissionGate gate(0);
  EXPECT_EQ(gate.Capacity(), 1);
  EXPECT_EQ(gate.Available(), 1);
}

TEST(AdmissionGate, TryAcquireStopsAtCapacity) {
  AdmissionGate gate(2);
  EXPECT_TRUE(gate.TryAcquire());
  EXPECT_TRUE(gate.TryAcquire());
  EXPECT_FALSE(gate.TryAcquire());
  EXPECT_EQ(gate.InUse(), 2);
  EXPECT_EQ(gate.Available(), 0);
  gate.Release();
  EXPECT_TRUE(gate.TryAcquire());
  gate.Release();
  gate.Release();
  EXPECT_EQ(gate.InUse(), 0);
  EXPECT_EQ(gate.PeakInUse(), 2);
}

TEST(AdmissionGate, AcquireTimesOutWhenFull) {
  AdmissionGate gate(1);
  ASSERT_TRUE(gate.TryAcquire());
  auto start = AdmissionGate::Clock::now();
  EXPECT_FALSE(gate.Acquire(start + 100ms));
  EXPECT_GE(AdmissionGate::Clock::now() - start, 100ms);
  EXPECT_EQ(gate.InUse(), 1);
  gate.Release();
}

TEST(AdmissionGate, ReleaseWakesWaiter) {
  AdmissionGate gate(1);
  ASSERT_TRUE(gate.TryAcquire());
  std::thread releaser([&] {
    std::this_thread::sleep_for(50ms);
    gate.Release();
  });
  EXPECT_TRUE(gate.Acquire(AdmissionGate::Clock::now() + 5s));
  releaser.join();
  gate.Release();
  EXPECT_EQ(gate.InUse(), 0);
}

TEST(AdmissionGate, SlotReleasesOnScopeExit) {
  AdmissionGate gate(1);
  {
    AdmissionSlot slot(gate, AdmissionGate::Clock::now());
    EXPECT_TRUE(slot.Acquired());
    AdmissionSlot second(gate, AdmissionGate::Clock::now() + 10ms);
    EXPECT_FALSE(second.Acquired());
    EXPECT_EQ(gate.InUse(), 1);
  }
  EXPECT_EQ(gate.InUse(), 0);
}

TEST(AdmissionGate, BurstNeverExceedsCapacity) {
  constexpr int kCapacity = 3, kThreads = 12;
  AdmissionGate gate(kCapacity);
  std::atomic_int running = 0, max_running = 0, rejected = 0;
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; i++) {
    threads.emplace_back([&] {
      AdmissionSlot slot(gate, AdmissionGate::Clock::now() + 10s);
      if (!slot.Acquired()) {
        rejected++;
        return;
      }
      int now = ++running;
      for (int cur = max_running; now > cur && !max_running.compare_exchange_weak(cur, now);) {}
      std::this_thread::sleep_for(20ms);
      running--;
    });
  }
  for (auto& i : threads) i.join();
  EXPECT_EQ(rejected, 0);
  EXPECT_LE(max_running, kCapacity);
  EXPECT_LE(gate.PeakInUse(), kCapacity);
  EXPECT_EQ(gate.InUse(), 0);
}
