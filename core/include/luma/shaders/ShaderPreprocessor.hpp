#pragma once
#include "luma/gl/GlDriver.hpp"
#include "luma/program/ProgramError.hpp"
#include "luma/shaders/SourceFetcher.hpp"
#include <future>
#include <string>
#include <unordered_set>
#include <vector>

namespace luma {

// Snapshot of the extensions a context reports. Taken on the GL thread so
// preprocessing can run elsewhere.
class ExtensionSet {
public:
  ExtensionSet() = default;
  explicit ExtensionSet(const std::vector<std::string>& names);

  static ExtensionSet fromDriver(GlDriver& driver);

  void add(const std::string& name);

  // Matches with or without the "GL_" prefix.
  bool has(const std::string& name) const;

private:
  std::unordered_set<std::string> names_;
};

struct PreprocessResult {
  bool ok{true};
  ProgramError err{};
  std::string source;
};

// "shaders/lib/a.glsl" -> "shaders/lib/"; "a.glsl" -> "".
std::string includeDirectory(const std::string& path);

// Join `rel` onto the directory of `base` and fold "." / ".." segments.
std::string resolveIncludePath(const std::string& base, const std::string& rel);

// Replace each HAS_EXTENSION(name) with 1 or 0.
std::string expandExtensionMacros(const std::string& source, const ExtensionSet& extensions);

// Textual GLSL preprocessing run before compilation:
//   #include "relative/path"   replaced in place, recursively
//   HAS_EXTENSION(name)        replaced by 1 / 0
// Nothing is cached; every call fetches every include again.
class ShaderPreprocessor {
public:
  ShaderPreprocessor(SourceFetcher& fetcher, ExtensionSet extensions);

  // `basePath` is where `source` lives: a file URI, or a directory ending
  // in '/' for sources that have no file of their own.
  PreprocessResult preprocess(const std::string& basePath, const std::string& source) const;

  // Fetch `uri`, then preprocess it relative to itself.
  PreprocessResult load(const std::string& uri) const;

  // Same as above on a worker thread. The fetcher must outlive the future.
  std::future<PreprocessResult> preprocessAsync(std::string basePath, std::string source) const;
  std::future<PreprocessResult> loadAsync(std::string uri) const;

private:
  SourceFetcher* fetcher_;
  ExtensionSet extensions_;
};

} // namespace luma
