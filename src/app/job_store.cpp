#include <roomtrace/app/job_store.hpp>

namespace roomtrace::app {

std::string_view to_string(StoreError error) noexcept {
  switch (error) {
    case StoreError::Unavailable:
      return "store unavailable";
  }
  return "unknown store error";
}

}  // namespace roomtrace::app
