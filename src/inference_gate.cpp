#include "inference_gate.hpp"

void InferenceGate::acquire() {
  std::unique_lock<std::mutex> lock(m_);
  const uint64_t ticket = next_ticket_++;
  ++waiting_;
  cv_.wait(lock, [&]{ return now_serving_ == ticket; });
  --waiting_;
  ++active_;
}

void InferenceGate::release() {
  {
    std::lock_guard<std::mutex> lock(m_);
    if(active_ == 0) return;
    --active_;
    ++now_serving_;
  }
  cv_.notify_all();
}

std::size_t InferenceGate::active() const {
  std::lock_guard<std::mutex> lock(m_);
  return active_;
}

std::size_t InferenceGate::waiting() const {
  std::lock_guard<std::mutex> lock(m_);
  return waiting_;
}
