#include <roomtrace/app/in_memory_job_store.hpp>
#include <algorithm>
#include <utility>

namespace roomtrace::app {

namespace rc = roomtrace::core;

bool InMemoryJobStore::consume_failure() const {
  if (pending_failures_ == 0) return false;
  --pending_failures_;
  return true;
}

std::expected<bool, StoreError> InMemoryJobStore::create_if_absent(const rc::Job& job) {
  std::lock_guard lock(mutex_);
  if (consume_failure()) return std::unexpected(StoreError::Unavailable);
  const auto [it, inserted] = records_.try_emplace(job.id, JobRecord{job, nullptr});
  return inserted;
}

std::expected<std::optional<JobRecord>, StoreError> InMemoryJobStore::load(
    const rc::JobId& id) const {
  std::lock_guard lock(mutex_);
  if (consume_failure()) return std::unexpected(StoreError::Unavailable);
  const auto it = records_.find(id);
  if (it == records_.end()) return std::optional<JobRecord>{};
  return std::optional<JobRecord>{it->second};
}

std::expected<bool, StoreError> InMemoryJobStore::compare_and_set(
    const rc::JobId& id,
    rc::JobState expected_state,
    std::uint32_t expected_attempt,
    const rc::Job& next,
    std::shared_ptr<const rc::DetectionResult> result) {
  std::lock_guard lock(mutex_);
  if (consume_failure()) return std::unexpected(StoreError::Unavailable);
  const auto it = records_.find(id);
  if (it == records_.end()) return false;
  const rc::Job& current = it->second.job;
  if (current.state != expected_state || current.attempt != expected_attempt) {
    return false;
  }
  it->second.job = next;
  it->second.result = std::move(result);
  return true;
}

std::expected<std::vector<rc::Job>, StoreError> InMemoryJobStore::list_in_state(
    rc::JobState state) const {
  std::lock_guard lock(mutex_);
  if (consume_failure()) return std::unexpected(StoreError::Unavailable);
  std::vector<rc::Job> jobs;
  for (const auto& [id, record] : records_) {
    if (record.job.state == state) jobs.push_back(record.job);
  }
  std::sort(jobs.begin(), jobs.end(),
            [](const rc::Job& a, const rc::Job& b) { return a.id < b.id; });
  return jobs;
}

void InMemoryJobStore::fail_next(std::size_t count) {
  std::lock_guard lock(mutex_);
  pending_failures_ = count;
}

std::size_t InMemoryJobStore::size() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

}  // namespace roomtrace::app
