#pragma once

#include <atomic>
#include <bit>
#include <concepts>
#include <cstddef>
#include <memory>
#include <new>
#include <optional>
#include <thread>

namespace stagehand {

inline constexpr std::size_t kCacheLineSize =
#ifdef __cpp_lib_hardware_interference_size
    std::hardware_destructive_interference_size;
#else
    64;
#endif

template <typename T>
concept QueueElement = std::movable<T> && std::destructible<T>;

// Bounded multi-producer / single-consumer ring. push() never blocks: a full
// ring reports false and the caller decides whether to drop or retry.
template <QueueElement T>
class BoundedMPSCQueue {
public:
  explicit BoundedMPSCQueue(std::size_t capacity)
      : capacity_(std::bit_ceil(capacity < 2 ? std::size_t{2} : capacity)),
        mask_(capacity_ - 1),
        slots_(std::make_unique<Slot[]>(capacity_)) {
    for (std::size_t i = 0; i < capacity_; ++i)
      slots_[i].seq.store(i, std::memory_order_relaxed);
  }

  ~BoundedMPSCQueue() {
    while (try_pop().has_value())
      ;
  }

  BoundedMPSCQueue(const BoundedMPSCQueue&) = delete;
  BoundedMPSCQueue& operator=(const BoundedMPSCQueue&) = delete;
  BoundedMPSCQueue(BoundedMPSCQueue&&) = delete;
  BoundedMPSCQueue& operator=(BoundedMPSCQueue&&) = delete;

  [[nodiscard]] auto push(T value) noexcept -> bool {
    auto pos = head_.load(std::memory_order_relaxed);
    for (;;) {
      auto& slot = slots_[pos & mask_];
      auto seq = slot.seq.load(std::memory_order_acquire);
      auto diff =
          static_cast<std::ptrdiff_t>(seq) - static_cast<std::ptrdiff_t>(pos);

      if (diff == 0) {
        if (head_.compare_exchange_weak(pos, pos + 1,
                                        std::memory_order_acq_rel,
                                        std::memory_order_relaxed)) {
          std::construct_at(slot.ptr(), std::move(value));
          slot.seq.store(pos + 1, std::memory_order_release);
          return true;
        }
      } else if (diff < 0) {
        return false;
      } else {
        pos = head_.load(std::memory_order_relaxed);
      }
    }
  }

  [[nodiscard]] auto try_pop() noexcept -> std::optional<T> {
    auto pos = tail_.load(std::memory_order_relaxed);
    auto& slot = slots_[pos & mask_];
    auto seq = slot.seq.load(std::memory_order_acquire);

    if (seq == pos + 1) {
      T value = std::move(*slot.ptr());
      std::destroy_at(slot.ptr());
      slot.seq.store(pos + capacity_, std::memory_order_release);
      tail_.store(pos + 1, std::memory_order_relaxed);
      return value;
    }
    return std::nullopt;
  }

  [[nodiscard]] auto empty() const noexcept -> bool {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return head_.load(std::memory_order_acquire) -
           tail_.load(std::memory_order_acquire);
  }

  [[nodiscard]] auto capacity() const noexcept -> std::size_t {
    return capacity_;
  }

private:
  struct Slot {
    std::atomic<std::size_t> seq;
    alignas(T) std::byte storage[sizeof(T)];

    auto ptr() noexcept -> T* {
      return std::launder(reinterpret_cast<T*>(storage));
    }
  };

  std::size_t capacity_;
  std::size_t mask_;
  std::unique_ptr<Slot[]> slots_;
  alignas(kCacheLineSize) std::atomic<std::size_t> head_{0};
  alignas(kCacheLineSize) std::atomic<std::size_t> tail_{0};
};

}  // namespace stagehand
