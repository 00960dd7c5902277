// common/ring.h
#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <thread>
#include <vector>

// Single-Producer Single-Consumer ring buffer carrying whole tick payloads
// between pipeline threads. The producer calls close() after its last push;
// the consumer then drains what is left and sees end-of-stream.
// NOTE: Not multi-producer/consumer safe.
template <typename T>
class SpscRing
{
public:
  explicit SpscRing(size_t capacity)
      : cap_(round_up_pow2(capacity < 4 ? 4 : capacity)), mask_(cap_ - 1), buf_(cap_) {}

  bool push(T &&v)
  {
    size_t h = head_.load(std::memory_order_relaxed);
    size_t n = (h + 1) & mask_;
    if (n == tail_.load(std::memory_order_acquire))
      return false; // full
    buf_[h] = std::move(v);
    head_.store(n, std::memory_order_release);
    return true;
  }

  // Blocks (with backoff) until there is room.
  void push_wait(T &&v)
  {
    while (!push(std::move(v)))
      std::this_thread::sleep_for(std::chrono::microseconds(50));
  }

  std::optional<T> pop()
  {
    size_t t = tail_.load(std::memory_order_relaxed);
    if (t == head_.load(std::memory_order_acquire))
      return std::nullopt; // empty
    T v = std::move(buf_[t]);
    tail_.store((t + 1) & mask_, std::memory_order_release);
    return v;
  }

  // Blocks until an item arrives; nullopt once closed and drained.
  std::optional<T> pop_wait()
  {
    for (;;)
    {
      if (auto v = pop())
        return v;
      if (closed_.load(std::memory_order_acquire))
        return pop(); // a push may have landed before close()
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }

  void close() { closed_.store(true, std::memory_order_release); }

  [[nodiscard]] size_t size() const
  {
    size_t h = head_.load(std::memory_order_acquire);
    size_t t = tail_.load(std::memory_order_acquire);
    return (h - t) & mask_;
  }

private:
  static size_t round_up_pow2(size_t x)
  {
    size_t p = 1;
    while (p < x)
      p <<= 1;
    return p;
  }

  // Padding to mitigate false sharing between head/tail on different cores.
  alignas(64) std::atomic<size_t> head_{0};
  alignas(64) std::atomic<size_t> tail_{0};
  std::atomic<bool> closed_{false};
  size_t cap_;
  size_t mask_;
  std::vector<T> buf_;
};
