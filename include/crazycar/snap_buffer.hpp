#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>

namespace crazycar {

// Single-producer latest-only buffer. Readers only ever see the newest value.
template <class T>
class LatestBuffer {
public:
  void publish(const T& v) {
    {
      std::lock_guard<std::mutex> lk(m_);
      data_ = v;
    }
    seq_.fetch_add(1, std::memory_order_release);
  }

  // Try to consume if sequence advanced past cursor.
  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    const auto s = seq_.load(std::memory_order_acquire);
    if (s == cursor) return false;
    std::lock_guard<std::mutex> lk(m_);
    out = data_;
    cursor = s;
    return true;
  }

  std::uint64_t sequence() const { return seq_.load(std::memory_order_acquire); }

private:
  mutable std::mutex m_;
  T data_{};
  std::atomic<std::uint64_t> seq_{0};
};

using SnapshotBuffer = LatestBuffer<struct SimSnapshot>;

} // namespace crazycar
