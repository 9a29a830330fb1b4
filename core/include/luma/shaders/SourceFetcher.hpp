#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace luma {

// Fetches shader text by path. Implementations must tolerate concurrent
// fetch() calls: the vertex and fragment include chains run in parallel.
class SourceFetcher {
public:
  virtual ~SourceFetcher() = default;

  // Returns false with a short reason in `err` when `path` cannot be read.
  virtual bool fetch(const std::string& path, std::string& out, std::string& err) = 0;
};

// Reads files below `root` (prepended verbatim, so give it a trailing '/').
class FileSourceFetcher : public SourceFetcher {
public:
  explicit FileSourceFetcher(std::string root = "");

  bool fetch(const std::string& path, std::string& out, std::string& err) override;

private:
  std::string root_;
};

// Serves sources registered with add(). Counts fetches per path.
class MemorySourceFetcher : public SourceFetcher {
public:
  void add(const std::string& path, std::string text);

  bool fetch(const std::string& path, std::string& out, std::string& err) override;

  std::size_t fetchCount(const std::string& path) const;

private:
  mutable std::mutex mtx_;
  std::unordered_map<std::string, std::string> files_;
  std::unordered_map<std::string, std::size_t> fetches_;
};

} // namespace luma
