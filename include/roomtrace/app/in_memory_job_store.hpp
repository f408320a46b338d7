#pragma once

#include <roomtrace/app/job_store.hpp>
#include <cstddef>
#include <mutex>
#include <unordered_map>

namespace roomtrace::app {

/// Mutex-guarded IJobStore for a single process (tests, CLI, demos).
class InMemoryJobStore : public IJobStore {
 public:
  InMemoryJobStore() = default;

  [[nodiscard]] std::expected<bool, StoreError> create_if_absent(
      const roomtrace::core::Job& job) override;

  [[nodiscard]] std::expected<std::optional<JobRecord>, StoreError> load(
      const roomtrace::core::JobId& id) const override;

  [[nodiscard]] std::expected<bool, StoreError> compare_and_set(
      const roomtrace::core::JobId& id,
      roomtrace::core::JobState expected_state,
      std::uint32_t expected_attempt,
      const roomtrace::core::Job& next,
      std::shared_ptr<const roomtrace::core::DetectionResult> result) override;

  [[nodiscard]] std::expected<std::vector<roomtrace::core::Job>, StoreError>
  list_in_state(roomtrace::core::JobState state) const override;

  /// Make the next `count` operations fail with StoreError::Unavailable.
  void fail_next(std::size_t count);

  [[nodiscard]] std::size_t size() const;

 private:
  bool consume_failure() const;

  mutable std::mutex mutex_;
  std::unordered_map<roomtrace::core::JobId, JobRecord> records_;
  mutable std::size_t pending_failures_{0};
};

}  // namespace roomtrace::app
