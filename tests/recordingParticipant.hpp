#ifndef RECORDINGPARTICIPANT_HPP
#define RECORDINGPARTICIPANT_HPP

#include "participant.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Participant that keeps every delivered event, for inspection in tests.
class RecordingParticipant : public Participant {
public:
  void deliver(const Event& event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
  }

  std::vector<Event> events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
  }

  size_t count(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = 0;
    for (const auto& event : events_) {
      if (type == typeOf(event)) {
        ++n;
      }
    }
    return n;
  }

  bool received(const std::string& type) const { return count(type) > 0; }

  // Most recent event of type T, or a default T when none arrived.
  template <typename T>
  T last() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
      if (const T* found = std::get_if<T>(&*it)) {
        return *found;
      }
    }
    return T();
  }

  template <typename T>
  bool has() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& event : events_) {
      if (std::holds_alternative<T>(event)) {
        return true;
      }
    }
    return false;
  }

private:
  mutable std::mutex mutex_;
  std::vector<Event> events_;
};

typedef std::shared_ptr<RecordingParticipant> RecorderPtr;

inline RecorderPtr makeRecorder() {
  return std::make_shared<RecordingParticipant>();
}

#endif // RECORDINGPARTICIPANT_HPP
