#pragma once

#include <cstddef>
#include <expected>
#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace roomtrace::app {

enum class FetchError {
  NotFound,
  Unavailable,
};

[[nodiscard]] std::string_view to_string(FetchError error) noexcept;

/// Resolves an image reference to its encoded bytes.
class IImageSource {
 public:
  virtual ~IImageSource() = default;

  [[nodiscard]] virtual std::expected<std::vector<std::byte>, FetchError> fetch(
      const std::string& image_ref) const = 0;
};

/// Reads references as paths relative to a root directory.
class FileImageSource : public IImageSource {
 public:
  explicit FileImageSource(std::filesystem::path root);

  [[nodiscard]] std::expected<std::vector<std::byte>, FetchError> fetch(
      const std::string& image_ref) const override;

  [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

 private:
  std::filesystem::path root_;
};

/// Serves bytes registered with put(); thread-safe.
class InMemoryImageSource : public IImageSource {
 public:
  void put(const std::string& image_ref, std::vector<std::byte> bytes);

  [[nodiscard]] std::expected<std::vector<std::byte>, FetchError> fetch(
      const std::string& image_ref) const override;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::vector<std::byte>> images_;
};

}  // namespace roomtrace::app
