#include <roomtrace/app/image_source.hpp>
#include <roomtrace/core/logger.hpp>
#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

namespace roomtrace::app {

std::string_view to_string(FetchError error) noexcept {
  switch (error) {
    case FetchError::NotFound:
      return "image not found";
    case FetchError::Unavailable:
      return "image source unavailable";
  }
  return "unknown fetch error";
}

FileImageSource::FileImageSource(std::filesystem::path root) : root_(std::move(root)) {}

namespace {

// References are relative keys under the root; no absolute paths, no "..".
bool stays_under_root(const std::filesystem::path& ref) {
  if (ref.empty() || ref.has_root_path()) return false;
  for (const auto& part : ref) {
    if (part == "..") return false;
  }
  return true;
}

}  // namespace

std::expected<std::vector<std::byte>, FetchError> FileImageSource::fetch(
    const std::string& image_ref) const {
  const std::filesystem::path ref(image_ref);
  if (!stays_under_root(ref)) {
    ROOMTRACE_LOG_WARN("file image source: rejecting reference " + image_ref);
    return std::unexpected(FetchError::NotFound);
  }
  const std::filesystem::path path = root_ / ref;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::unexpected(FetchError::NotFound);
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    ROOMTRACE_LOG_WARN("file image source: cannot open " + path.string());
    return std::unexpected(FetchError::Unavailable);
  }
  std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return std::unexpected(FetchError::Unavailable);
  }
  std::vector<std::byte> bytes(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    bytes[i] = static_cast<std::byte>(raw[i]);
  }
  return bytes;
}

void InMemoryImageSource::put(const std::string& image_ref, std::vector<std::byte> bytes) {
  std::lock_guard lock(mutex_);
  images_[image_ref] = std::move(bytes);
}

std::expected<std::vector<std::byte>, FetchError> InMemoryImageSource::fetch(
    const std::string& image_ref) const {
  std::lock_guard lock(mutex_);
  const auto it = images_.find(image_ref);
  if (it == images_.end()) {
    return std::unexpected(FetchError::NotFound);
  }
  return it->second;
}

}  // namespace roomtrace::app
