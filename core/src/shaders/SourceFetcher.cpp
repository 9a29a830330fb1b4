#include "luma/shaders/SourceFetcher.hpp"
#include <fstream>
#include <sstream>
#include <utility>

namespace luma {

FileSourceFetcher::FileSourceFetcher(std::string root) : root_(std::move(root)) {}

bool FileSourceFetcher::fetch(const std::string& path, std::string& out, std::string& err) {
  std::string full = root_ + path;
  std::ifstream in(full, std::ios::binary);
  if (!in) {
    err = "cannot open " + full;
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    err = "read error on " + full;
    return false;
  }
  out = ss.str();
  return true;
}

void MemorySourceFetcher::add(const std::string& path, std::string text) {
  std::lock_guard<std::mutex> lock(mtx_);
  files_[path] = std::move(text);
}

bool MemorySourceFetcher::fetch(const std::string& path, std::string& out, std::string& err) {
  std::lock_guard<std::mutex> lock(mtx_);
  fetches_[path]++;
  auto it = files_.find(path);
  if (it == files_.end()) {
    err = "no source registered for " + path;
    return false;
  }
  out = it->second;
  return true;
}

std::size_t MemorySourceFetcher::fetchCount(const std::string& path) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = fetches_.find(path);
  return it == fetches_.end() ? 0 : it->second;
}

} // namespace luma
