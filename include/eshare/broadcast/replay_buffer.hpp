#ifndef ESHARE_BROADCAST_REPLAY_BUFFER_HPP
#define ESHARE_BROADCAST_REPLAY_BUFFER_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "../allocator.hpp"
#include "../errors.hpp"
#include "policies.hpp"

namespace eshare {

// =============================================================================
// Replay Buffer
// =============================================================================
//
// Ring of retained values addressed by a global, ever increasing emission
// index, plus one cursor per subscriber. Layout of the live window:
//
//   head                  buffer_end                 queue_end
//    |  values ...            |  suspended emitters ...  |
//
//   head       = min(min_collector_index, replay_index)
//   replay     = [replay_index, buffer_end)   handed to new cursors
//
// Values stay until the slowest cursor has taken them and they dropped out
// of the replay window. Emitters that found the buffer full wait in the queue
// with their value; as cursors advance they are promoted into the buffer in
// FIFO order and reported back for resumption.
//
// Not synchronized: the owning broadcast holds its lock around every call.
// Waiter is any nullable handle type (shared_ptr in practice).

template <typename T, typename Waiter> class replay_buffer {
public:
  using index_type = std::int64_t;
  using cursor_id = std::size_t;

  struct pending_emit {
    T value;
    Waiter waiter;
  };

  // monostate: empty slot, or an emitter that was cancelled in the queue.
  using entry = std::variant<std::monostate, T, pending_emit>;

  replay_buffer(std::size_t replay, std::size_t capacity,
                overflow_policy overflow,
                std::pmr::memory_resource *resource = mi_resource())
      : replay_(static_cast<index_type>(replay)),
        capacity_(static_cast<index_type>(capacity)), overflow_(overflow),
        ring_(resource) {
    if (capacity < replay)
      throw configuration_error(
          "capacity cannot be smaller than replay, but was " +
          std::to_string(capacity) + " < " + std::to_string(replay));
  }

  // ===========================================================================
  // Emission
  // ===========================================================================

  // Store value without suspending. False means the emitter has to wait
  // (SUSPEND with a full buffer and a lagging cursor).
  bool try_emit(const T &value) {
    if (n_cursors_ == 0)
      return try_emit_no_cursors(value);

    if (buffer_size_ >= capacity_ && min_collector_index_ <= replay_index_) {
      switch (overflow_) {
      case overflow_policy::suspend:
        return false;
      case overflow_policy::drop_latest:
        return true;
      case overflow_policy::drop_oldest:
        break;
      }
    }

    enqueue(entry{std::in_place_index<1>, value});
    ++buffer_size_;
    if (buffer_size_ > capacity_)
      drop_oldest();
    if (replay_size() > replay_)
      update_buffer(replay_index_ + 1, min_collector_index_, buffer_end(),
                    queue_end());
    return true;
  }

  // Queue a suspended emission behind the buffer. Returns its index, used
  // to withdraw it on cancellation.
  index_type enqueue_emitter(const T &value, Waiter w,
                             std::vector<Waiter> &resumes) {
    index_type index = head() + total_size();
    enqueue(entry{std::in_place_index<2>, pending_emit{value, std::move(w)}});
    ++queue_size_;
    // Without a buffer a parked cursor can rendezvous with this emitter.
    if (capacity_ == 0)
      collect_ready(resumes);
    return index;
  }

  // Withdraw a queued emission whose emitter was cancelled. False when it
  // was promoted into the buffer already.
  bool cancel_emitter(index_type index, const Waiter &w) {
    if (index < head() || index >= queue_end())
      return false;
    auto &slot = at(index);
    auto *pending = std::get_if<pending_emit>(&slot);
    if (!pending || pending->waiter != w)
      return false;
    slot = std::monostate{};
    cleanup_tail();
    return true;
  }

  // ===========================================================================
  // Cursors
  // ===========================================================================

  cursor_id allocate_cursor() {
    cursor_id id = 0;
    for (; id < cursors_.size(); ++id) {
      if (cursors_[id].index < 0)
        break;
    }
    if (id == cursors_.size())
      cursors_.emplace_back();
    cursors_[id].index = new_cursor_index();
    cursors_[id].waiter = Waiter{};
    ++n_cursors_;
    return id;
  }

  void free_cursor(cursor_id id, std::vector<Waiter> &resumes) {
    auto &c = cursors_[id];
    index_type old_index = c.index;
    c.index = -1;
    c.waiter = Waiter{};
    --n_cursors_;
    update_collector_index(old_index, resumes);
  }

  // Next value for the cursor, advancing it; nullopt when caught up or when
  // the cursor stepped over a cancelled emitter.
  std::optional<T> try_take(cursor_id id, std::vector<Waiter> &resumes) {
    auto &c = cursors_[id];
    index_type index = try_peek(c);
    if (index < 0)
      return std::nullopt;
    index_type old_index = c.index;
    std::optional<T> value = peeked_value(index);
    c.index = index + 1;
    update_collector_index(old_index, resumes);
    return value;
  }

  bool can_take(cursor_id id) const { return try_peek(cursors_[id]) >= 0; }

  // Remember w as the cursor's waiter; false when a value is available.
  bool park(cursor_id id, Waiter w) {
    auto &c = cursors_[id];
    if (try_peek(c) >= 0)
      return false;
    c.waiter = std::move(w);
    return true;
  }

  void unpark(cursor_id id) { cursors_[id].waiter = Waiter{}; }

  // Hand out every parked cursor that can take a value now.
  void collect_ready(std::vector<Waiter> &resumes) {
    for (auto &c : cursors_) {
      if (c.index < 0 || !c.waiter)
        continue;
      if (try_peek(c) < 0)
        continue;
      resumes.push_back(std::move(c.waiter));
      c.waiter = Waiter{};
    }
  }

  // Hand out every parked cursor regardless of data (close / shutdown).
  void collect_parked(std::vector<Waiter> &resumes) {
    for (auto &c : cursors_) {
      if (c.index < 0 || !c.waiter)
        continue;
      resumes.push_back(std::move(c.waiter));
      c.waiter = Waiter{};
    }
  }

  // ===========================================================================
  // Replay
  // ===========================================================================

  // New cursors start empty; values still owed to existing cursors stay.
  void reset_replay() {
    update_buffer(buffer_end(), min_collector_index_, buffer_end(),
                  queue_end());
  }

  std::vector<T> replay_cache() const {
    std::vector<T> result;
    index_type n = replay_size();
    result.reserve(static_cast<std::size_t>(n));
    for (index_type i = 0; i < n; ++i)
      result.push_back(std::get<1>(at(replay_index_ + i)));
    return result;
  }

  // Most recent replayed value, if any.
  const T *last_value() const {
    if (replay_size() == 0)
      return nullptr;
    return &std::get<1>(at(buffer_end() - 1));
  }

  std::size_t cursor_count() const noexcept { return n_cursors_; }
  std::size_t size() const noexcept {
    return static_cast<std::size_t>(buffer_size_);
  }
  std::size_t queued() const noexcept {
    return static_cast<std::size_t>(queue_size_);
  }
  std::size_t replay_capacity() const noexcept {
    return static_cast<std::size_t>(replay_);
  }
  std::size_t capacity() const noexcept {
    return static_cast<std::size_t>(capacity_);
  }
  overflow_policy overflow() const noexcept { return overflow_; }

private:
  struct cursor {
    index_type index{-1};
    Waiter waiter{};
  };

  index_type head() const noexcept {
    return std::min(min_collector_index_, replay_index_);
  }
  index_type replay_size() const noexcept {
    return head() + buffer_size_ - replay_index_;
  }
  index_type total_size() const noexcept { return buffer_size_ + queue_size_; }
  index_type buffer_end() const noexcept { return head() + buffer_size_; }
  index_type queue_end() const noexcept { return buffer_end() + queue_size_; }

  entry &at(index_type index) {
    return ring_[static_cast<std::size_t>(index) & (ring_.size() - 1)];
  }
  const entry &at(index_type index) const {
    return ring_[static_cast<std::size_t>(index) & (ring_.size() - 1)];
  }

  // Append behind everything stored; caller bumps buffer_size_ or
  // queue_size_.
  void enqueue(entry item) {
    auto cur = static_cast<std::size_t>(total_size());
    if (ring_.empty())
      grow(2);
    else if (cur >= ring_.size())
      grow(ring_.size() * 2);
    at(head() + total_size()) = std::move(item);
  }

  void grow(std::size_t new_size) {
    std::pmr::vector<entry> next(new_size, ring_.get_allocator());
    index_type h = head();
    for (index_type i = 0; i < total_size(); ++i)
      next[static_cast<std::size_t>(h + i) & (new_size - 1)] =
          std::move(at(h + i));
    ring_.swap(next);
  }

  bool try_emit_no_cursors(const T &value) {
    if (replay_ == 0)
      return true; // nobody to replay to, forget it
    enqueue(entry{std::in_place_index<1>, value});
    ++buffer_size_;
    if (buffer_size_ > replay_)
      drop_oldest();
    min_collector_index_ = head() + buffer_size_;
    return true;
  }

  void drop_oldest() {
    index_type new_head = head() + 1;
    at(head()) = std::monostate{};
    --buffer_size_;
    if (replay_index_ < new_head)
      replay_index_ = new_head;
    if (min_collector_index_ < new_head) {
      // Lagging cursors silently skip the dropped value.
      for (auto &c : cursors_) {
        if (c.index >= 0 && c.index < new_head)
          c.index = new_head;
      }
      min_collector_index_ = new_head;
    }
  }

  index_type new_cursor_index() {
    index_type index = replay_index_;
    if (index < min_collector_index_)
      min_collector_index_ = index;
    return index;
  }

  index_type try_peek(const cursor &c) const {
    index_type index = c.index;
    if (index < buffer_end())
      return index;
    if (capacity_ > 0)
      return -1; // with a buffer, never read into the emitter queue
    // Synchronous buffer: rendezvous with the first queued emitter only.
    if (index > head())
      return -1;
    if (queue_size_ == 0)
      return -1;
    return index;
  }

  // Empty for a cancelled emitter the cursor steps over.
  std::optional<T> peeked_value(index_type index) const {
    const auto &slot = at(index);
    if (auto *pending = std::get_if<pending_emit>(&slot))
      return pending->value;
    if (auto *value = std::get_if<T>(&slot))
      return *value;
    return std::nullopt;
  }

  // A cursor moved away from old_index (took a value or left). Recompute the
  // slowest cursor, promote queued emitters into freed room and trim the
  // replay window.
  void update_collector_index(index_type old_index,
                              std::vector<Waiter> &resumes) {
    if (old_index > min_collector_index_)
      return; // was not the slowest one
    index_type h = head();
    index_type new_min = h + buffer_size_;
    // A synchronous buffer lets the cursor move past the first emitter.
    if (capacity_ == 0 && queue_size_ > 0)
      ++new_min;
    for (const auto &c : cursors_) {
      if (c.index >= 0 && c.index < new_min)
        new_min = c.index;
    }
    if (new_min <= min_collector_index_)
      return;

    index_type new_buffer_end = buffer_end();
    index_type max_resume =
        n_cursors_ > 0
            ? std::min(queue_size_, capacity_ - (new_buffer_end - new_min))
            : queue_size_; // nobody left to wait for: release everyone
    index_type new_queue_end = new_buffer_end + queue_size_;
    if (max_resume > 0) {
      index_type resumed = 0;
      for (index_type i = new_buffer_end; i < new_queue_end; ++i) {
        auto *pending = std::get_if<pending_emit>(&at(i));
        if (!pending)
          continue;
        Waiter w = std::move(pending->waiter);
        T value = std::move(pending->value);
        at(i) = std::monostate{};
        at(new_buffer_end) = entry{std::in_place_index<1>, std::move(value)};
        ++new_buffer_end;
        resumes.push_back(std::move(w));
        if (++resumed >= max_resume)
          break;
      }
    }

    index_type new_buffer_size = new_buffer_end - h;
    if (n_cursors_ == 0)
      new_min = new_buffer_end;
    index_type new_replay_index =
        std::max(replay_index_,
                 new_buffer_end - std::min(replay_, new_buffer_size));
    // Synchronous buffer whose first queued emitter was cancelled.
    if (capacity_ == 0 && new_replay_index < new_queue_end &&
        std::holds_alternative<std::monostate>(at(new_replay_index))) {
      ++new_buffer_end;
      ++new_replay_index;
    }
    update_buffer(new_replay_index, new_min, new_buffer_end, new_queue_end);
    cleanup_tail();
    if (max_resume > 0)
      collect_ready(resumes);
  }

  void update_buffer(index_type new_replay_index, index_type new_min,
                     index_type new_buffer_end, index_type new_queue_end) {
    index_type new_head = std::min(new_min, new_replay_index);
    for (index_type i = head(); i < new_head; ++i)
      at(i) = std::monostate{};
    replay_index_ = new_replay_index;
    min_collector_index_ = new_min;
    buffer_size_ = new_buffer_end - new_head;
    queue_size_ = new_queue_end - new_buffer_end;
  }

  // Drop cancelled emitters from the end of the queue.
  void cleanup_tail() {
    // A synchronous buffer keeps its single queued entry for the rendezvous.
    if (capacity_ == 0 && queue_size_ <= 1)
      return;
    while (queue_size_ > 0 && std::holds_alternative<std::monostate>(
                                  at(head() + total_size() - 1))) {
      --queue_size_;
    }
  }

  index_type replay_;
  index_type capacity_;
  overflow_policy overflow_;

  std::pmr::vector<entry> ring_;
  index_type replay_index_{0};
  index_type min_collector_index_{0};
  index_type buffer_size_{0};
  index_type queue_size_{0};

  std::vector<cursor> cursors_;
  std::size_t n_cursors_{0};
};

} // namespace eshare

#endif // ESHARE_BROADCAST_REPLAY_BUFFER_HPP
