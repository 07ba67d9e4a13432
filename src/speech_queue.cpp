#include "phon/speech_queue.hpp"

#include "log.hpp"

#include <exception>
#include <stdexcept>

namespace phon {

std::string to_string(UtteranceState state) {
  switch (state) {
    case UtteranceState::Queued: return "queued";
    case UtteranceState::Playing: return "playing";
    case UtteranceState::Completed: return "completed";
    case UtteranceState::Cancelled: return "cancelled";
    case UtteranceState::Failed: return "failed";
  }
  return "queued";
}

SpeechQueue::SpeechQueue(Synthesizer& synth)
    : synth_(synth), route_(std::make_shared<CompletionRoute>()) {
  route_->queue = this;
  worker_ = std::thread([this]() { worker_loop(); });
}

SpeechQueue::~SpeechQueue() {
  shutdown();
  // A synthesizer may still hold completions; they must not reach this object.
  std::lock_guard<std::mutex> guard(route_->mutex);
  route_->queue = nullptr;
}

UtteranceHandle SpeechQueue::enqueue(Utterance utterance) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (stopping_) {
    throw std::logic_error("SpeechQueue::enqueue after shutdown");
  }
  if (utterance.priority == UtterancePriority::Interrupt) {
    cancel_queued_locked();
  }
  Entry entry;
  entry.id = next_id_++;
  entry.request = std::move(utterance.request);
  const UtteranceHandle handle{entry.id};
  states_[entry.id] = UtteranceState::Queued;
  queue_.push_back(std::move(entry));
  log::debug("speech", "enqueue id=" + std::to_string(handle.id));

  if (utterance.priority == UtterancePriority::Interrupt && playing_.has_value() &&
      is_playing_locked(playing_->id)) {
    // The new entry is already queued, so the worker cannot start anything
    // older than it once the stop completes.
    stop_playing(lock);
  }
  work_cv_.notify_all();
  return handle;
}

void SpeechQueue::cancel(UtteranceHandle handle) {
  std::unique_lock<std::mutex> lock(mutex_);
  auto state_it = states_.find(handle.id);
  if (state_it == states_.end() || is_terminal(state_it->second)) {
    return;
  }
  if (state_it->second == UtteranceState::Queued) {
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
      if (it->id == handle.id) {
        queue_.erase(it);
        break;
      }
    }
    finish_locked(handle.id, UtteranceState::Cancelled);
    log::debug("speech", "cancel queued id=" + std::to_string(handle.id));
    idle_cv_.notify_all();
    return;
  }
  if (playing_.has_value() && playing_->id == handle.id) {
    log::debug("speech", "cancel playing id=" + std::to_string(handle.id));
    stop_playing(lock);
  }
}

void SpeechQueue::cancel_all() {
  std::unique_lock<std::mutex> lock(mutex_);
  cancel_queued_locked();
  if (playing_.has_value() && is_playing_locked(playing_->id)) {
    stop_playing(lock);
  }
  idle_cv_.notify_all();
}

UtteranceState SpeechQueue::state(UtteranceHandle handle) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = states_.find(handle.id);
  if (it == states_.end()) {
    throw std::invalid_argument("SpeechQueue: unknown utterance handle " +
                                std::to_string(handle.id));
  }
  return it->second;
}

std::vector<SpeechFailure> SpeechQueue::take_failures() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SpeechFailure> out;
  out.swap(failures_);
  return out;
}

bool SpeechQueue::idle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_locked();
}

bool SpeechQueue::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_cv_.wait_for(lock, timeout, [this]() { return idle_locked(); });
}

void SpeechQueue::shutdown() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (stopping_) {
    lock.unlock();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
      worker_.join();
    }
    return;
  }
  cancel_queued_locked();
  if (playing_.has_value() && is_playing_locked(playing_->id)) {
    stop_playing(lock);
  }
  stopping_ = true;
  work_cv_.notify_all();
  idle_cv_.notify_all();
  lock.unlock();
  if (worker_.joinable()) {
    worker_.join();
  }
}

bool SpeechQueue::idle_locked() const {
  return queue_.empty() && !playing_.has_value() && !launching_ && !stop_in_flight_;
}

bool SpeechQueue::is_playing_locked(std::uint64_t id) const {
  auto it = states_.find(id);
  return it != states_.end() && it->second == UtteranceState::Playing;
}

// Records a terminal state and forgets the oldest ones past the window.
void SpeechQueue::finish_locked(std::uint64_t id, UtteranceState state) {
  states_[id] = state;
  finished_.push_back(id);
  while (finished_.size() > kRetainedStates) {
    states_.erase(finished_.front());
    finished_.pop_front();
  }
}

void SpeechQueue::cancel_queued_locked() {
  for (const auto& entry : queue_) {
    finish_locked(entry.id, UtteranceState::Cancelled);
  }
  if (!queue_.empty()) {
    log::debug("speech", "cancelled " + std::to_string(queue_.size()) + " queued");
  }
  queue_.clear();
}

void SpeechQueue::stop_synth() noexcept {
  try {
    synth_.stop();
  } catch (const std::exception& ex) {
    log::warn("speech", std::string("synthesizer stop failed: ") + ex.what());
  }
}

// Requires `lock` held and playing_ in state Playing.
void SpeechQueue::stop_playing(std::unique_lock<std::mutex>& lock) {
  const std::uint64_t id = playing_->id;
  finish_locked(id, UtteranceState::Cancelled);
  if (launching_) {
    stop_after_launch_ = true;
    return;
  }
  if (stop_in_flight_) {
    return;
  }
  stop_in_flight_ = true;
  lock.unlock();
  stop_synth();
  lock.lock();
  release_after_stop(id);
}

// Requires the lock held.
void SpeechQueue::release_after_stop(std::uint64_t id) {
  stop_in_flight_ = false;
  if (playing_.has_value() && playing_->id == id) {
    playing_.reset();
  }
  work_cv_.notify_all();
  idle_cv_.notify_all();
}

void SpeechQueue::on_complete(std::uint64_t id, bool ok, const std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!is_playing_locked(id)) {
    // Late report for a cancelled utterance.
    return;
  }
  if (ok) {
    finish_locked(id, UtteranceState::Completed);
    log::debug("speech", "completed id=" + std::to_string(id));
  } else {
    finish_locked(id, UtteranceState::Failed);
    SpeechFailure failure;
    failure.handle = UtteranceHandle{id};
    if (playing_.has_value() && playing_->id == id) {
      failure.request = playing_->request;
    }
    failure.error = error;
    failures_.push_back(std::move(failure));
    log::warn("speech", "synthesis failed id=" + std::to_string(id) + ": " + error);
  }
  if (playing_.has_value() && playing_->id == id) {
    playing_.reset();
  }
  work_cv_.notify_all();
  idle_cv_.notify_all();
}

void SpeechQueue::worker_loop() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    work_cv_.wait(lock, [this]() {
      return stopping_ || (!playing_.has_value() && !queue_.empty() && !stop_in_flight_);
    });
    if (stopping_) {
      return;
    }

    playing_ = std::move(queue_.front());
    queue_.pop_front();
    const std::uint64_t id = playing_->id;
    const SpeechRequest request = playing_->request;
    states_[id] = UtteranceState::Playing;
    launching_ = true;
    log::debug("speech", "play id=" + std::to_string(id));
    lock.unlock();

    std::string launch_error;
    bool launched = true;
    try {
      auto route = route_;
      synth_.speak(request, [route, id](bool ok, const std::string& error) {
        std::lock_guard<std::mutex> guard(route->mutex);
        if (route->queue) {
          route->queue->on_complete(id, ok, error);
        }
      });
    } catch (const std::exception& ex) {
      launched = false;
      launch_error = ex.what();
    }

    lock.lock();
    launching_ = false;
    if (!launched) {
      stop_after_launch_ = false;
      if (is_playing_locked(id)) {
        finish_locked(id, UtteranceState::Failed);
        failures_.push_back(SpeechFailure{UtteranceHandle{id}, request, launch_error});
        log::warn("speech", "synthesis failed id=" + std::to_string(id) + ": " + launch_error);
      }
      if (playing_.has_value() && playing_->id == id) {
        playing_.reset();
      }
      idle_cv_.notify_all();
      continue;
    }
    if (stop_after_launch_) {
      stop_after_launch_ = false;
      stop_in_flight_ = true;
      lock.unlock();
      stop_synth();
      lock.lock();
      release_after_stop(id);
    }
    idle_cv_.notify_all();
  }
}

} // namespace phon
