#include "shepherd/progress_channel.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace shepherd {

namespace internal {

struct SubscriberQueue {
  std::deque<ProgressSnapshot> pending;
  std::size_t dropped = 0;
  bool closed = false;
};

struct ProgressState {
  explicit ProgressState(std::size_t queue_capacity) : capacity(queue_capacity) {}

  std::size_t capacity;
  mutable std::mutex mutex;
  std::condition_variable ready;
  std::vector<std::shared_ptr<SubscriberQueue>> subscribers;
  ProgressSnapshot last;
  bool finished = false;

  // Caller holds `mutex`.
  void push(SubscriberQueue& queue, const ProgressSnapshot& snapshot) const {
    while (queue.pending.size() >= capacity) {
      queue.pending.pop_front();
      ++queue.dropped;
    }
    queue.pending.push_back(snapshot);
  }
};

}  // namespace internal

namespace {

double clamp_percent(double percent, double floor) {
  return std::clamp(std::max(percent, floor), 0.0, 100.0);
}

std::optional<ProgressSnapshot> pop_front(internal::SubscriberQueue& queue) {
  if (queue.pending.empty()) {
    return std::nullopt;
  }
  ProgressSnapshot snapshot = std::move(queue.pending.front());
  queue.pending.pop_front();
  return snapshot;
}

}  // namespace

ProgressSubscription::ProgressSubscription(std::shared_ptr<internal::ProgressState> state,
                                           std::shared_ptr<internal::SubscriberQueue> queue)
    : state_(std::move(state)), queue_(std::move(queue)) {}

ProgressSubscription& ProgressSubscription::operator=(ProgressSubscription&& other) noexcept {
  if (this != &other) {
    unsubscribe();
    state_ = std::move(other.state_);
    queue_ = std::move(other.queue_);
  }
  return *this;
}

ProgressSubscription::~ProgressSubscription() { unsubscribe(); }

void ProgressSubscription::unsubscribe() noexcept {
  if (!state_) {
    return;
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  std::erase(state_->subscribers, queue_);
}

std::optional<ProgressSnapshot> ProgressSubscription::next() {
  std::unique_lock<std::mutex> lock(state_->mutex);
  state_->ready.wait(lock, [&] { return !queue_->pending.empty() || queue_->closed; });
  return pop_front(*queue_);
}

std::optional<ProgressSnapshot> ProgressSubscription::next_for(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(state_->mutex);
  state_->ready.wait_for(lock, timeout,
                         [&] { return !queue_->pending.empty() || queue_->closed; });
  return pop_front(*queue_);
}

std::optional<ProgressSnapshot> ProgressSubscription::try_next() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return pop_front(*queue_);
}

bool ProgressSubscription::ended() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return queue_->closed && queue_->pending.empty();
}

std::size_t ProgressSubscription::dropped() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return queue_->dropped;
}

ProgressChannel::ProgressChannel(std::size_t capacity)
    : state_(std::make_shared<internal::ProgressState>(std::max<std::size_t>(capacity, 1))) {}

std::size_t ProgressChannel::capacity() const noexcept { return state_->capacity; }

ProgressSubscription ProgressChannel::subscribe() {
  auto queue = std::make_shared<internal::SubscriberQueue>();
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (state_->finished) {
    queue->pending.push_back(state_->last);
    queue->closed = true;
  } else {
    state_->subscribers.push_back(queue);
  }
  return {state_, std::move(queue)};
}

void ProgressChannel::publish(ProgressSnapshot snapshot) {
  if (snapshot.terminal()) {
    finish(std::move(snapshot));
    return;
  }
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->finished) {
      return;
    }
    snapshot.percent = clamp_percent(snapshot.percent, state_->last.percent);
    for (auto& queue : state_->subscribers) {
      state_->push(*queue, snapshot);
    }
    state_->last = std::move(snapshot);
  }
  state_->ready.notify_all();
}

bool ProgressChannel::finish(ProgressSnapshot terminal) {
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->finished) {
      return false;
    }
    if (!terminal.terminal()) {
      terminal.kind = ProgressSnapshot::Kind::completed;
    }
    terminal.percent = clamp_percent(terminal.percent, state_->last.percent);
    for (auto& queue : state_->subscribers) {
      state_->push(*queue, terminal);
      queue->closed = true;
    }
    state_->subscribers.clear();
    state_->last = std::move(terminal);
    state_->finished = true;
  }
  state_->ready.notify_all();
  return true;
}

bool ProgressChannel::finished() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->finished;
}

ProgressSnapshot ProgressChannel::last() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->last;
}

}  // namespace shepherd
