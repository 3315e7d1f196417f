#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>

// Process-wide exclusive section around inference. Waiters are admitted in
// ticket order, so no caller is starved while others keep arriving.
class InferenceGate {
public:
  class Lease {
  public:
    explicit Lease(InferenceGate& gate) : gate_(&gate) { gate_->acquire(); }
    ~Lease() { if(gate_) gate_->release(); }
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

  private:
    InferenceGate* gate_;
  };

  void acquire();
  void release();

  // Holders of the gate; never more than one, never negative.
  std::size_t active() const;
  std::size_t waiting() const;

private:
  mutable std::mutex m_;
  std::condition_variable cv_;
  uint64_t next_ticket_ = 0;
  uint64_t now_serving_ = 0;
  std::size_t active_ = 0;
  std::size_t waiting_ = 0;
};
