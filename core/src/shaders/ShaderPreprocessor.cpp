#include "luma/shaders/ShaderPreprocessor.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <utility>

namespace luma {

// -------------------- ExtensionSet --------------------

ExtensionSet::ExtensionSet(const std::vector<std::string>& names) {
  for (const auto& n : names) add(n);
}

ExtensionSet ExtensionSet::fromDriver(GlDriver& driver) {
  return ExtensionSet(driver.extensions());
}

void ExtensionSet::add(const std::string& name) {
  names_.insert(name);
}

bool ExtensionSet::has(const std::string& name) const {
  if (names_.count(name)) return true;
  if (names_.count("GL_" + name)) return true;
  if (name.compare(0, 3, "GL_") == 0 && names_.count(name.substr(3))) return true;
  return false;
}

// -------------------- Paths --------------------

static std::string normalizePath(const std::string& path) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (true) {
    std::size_t slash = path.find('/', pos);
    std::string seg = path.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);

    if (seg == "." || (seg.empty() && pos != 0 && slash != std::string::npos)) {
      // drop; `a//b` is `a/b`, a leading or trailing '/' is kept
    } else if (seg == "..") {
      if (!out.empty() && !out.back().empty() && out.back() != "..") {
        out.pop_back();
      } else {
        out.push_back(seg);
      }
    } else {
      out.push_back(std::move(seg));
    }

    if (slash == std::string::npos) break;
    pos = slash + 1;
  }

  std::string joined;
  for (std::size_t i = 0; i < out.size(); i++) {
    if (i) joined += '/';
    joined += out[i];
  }
  return joined;
}

std::string includeDirectory(const std::string& path) {
  std::size_t last = path.rfind('/');
  if (last == std::string::npos) return "";
  return path.substr(0, last + 1);
}

std::string resolveIncludePath(const std::string& base, const std::string& rel) {
  return normalizePath(includeDirectory(base) + rel);
}

// -------------------- HAS_EXTENSION --------------------

static bool isIdentChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

static bool isExtensionNameChar(char c) {
  return isIdentChar(c) || c == '-';
}

static std::size_t skipBlanks(const std::string& s, std::size_t i) {
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) i++;
  return i;
}

std::string expandExtensionMacros(const std::string& source, const ExtensionSet& extensions) {
  static const std::string kMacro = "HAS_EXTENSION";

  std::string out;
  out.reserve(source.size());
  std::size_t pos = 0;

  while (true) {
    std::size_t hit = source.find(kMacro, pos);
    if (hit == std::string::npos) {
      out.append(source, pos, std::string::npos);
      break;
    }
    std::size_t after = hit + kMacro.size();

    // Parse "( name )" with optional blanks.
    bool matched = (hit == 0 || !isIdentChar(source[hit - 1]));
    std::size_t nameBegin = 0, nameEnd = 0, close = 0;
    if (matched) {
      std::size_t i = skipBlanks(source, after);
      matched = i < source.size() && source[i] == '(';
      if (matched) {
        nameBegin = skipBlanks(source, i + 1);
        nameEnd = nameBegin;
        while (nameEnd < source.size() && isExtensionNameChar(source[nameEnd])) nameEnd++;
        close = skipBlanks(source, nameEnd);
        matched = nameEnd > nameBegin && close < source.size() && source[close] == ')';
      }
    }

    if (!matched) {
      out.append(source, pos, after - pos);
      pos = after;
      continue;
    }

    out.append(source, pos, hit - pos);
    out += extensions.has(source.substr(nameBegin, nameEnd - nameBegin)) ? "1" : "0";
    pos = close + 1;
  }
  return out;
}

// -------------------- #include --------------------

// Paths currently being expanded, outermost first. Owned by one
// preprocess() call; never shared between chains.
using InFlight = std::vector<std::string>;

static bool parseIncludeLine(const std::string& line, std::string& target) {
  static const std::string kDirective = "#include";

  std::size_t i = skipBlanks(line, 0);
  if (line.compare(i, kDirective.size(), kDirective) != 0) return false;
  i = skipBlanks(line, i + kDirective.size());
  if (i >= line.size() || line[i] != '"') return false;
  std::size_t end = line.find('"', i + 1);
  if (end == std::string::npos || end == i + 1) return false;
  target = line.substr(i + 1, end - i - 1);
  return true;
}

static std::string describeChain(const InFlight& chain, const std::string& path) {
  std::string s;
  for (const auto& p : chain) {
    s += p;
    s += " -> ";
  }
  return s + path;
}

static bool expandIncludes(SourceFetcher& fetcher, const std::string& base,
                           const std::string& source, InFlight& inFlight,
                           std::string& out, ProgramError& err) {
  std::size_t pos = 0;
  while (true) {
    std::size_t eol = source.find('\n', pos);
    bool last = (eol == std::string::npos);
    std::string line = source.substr(pos, last ? std::string::npos : eol - pos);

    std::string target;
    if (parseIncludeLine(line, target)) {
      std::string path = resolveIncludePath(base, target);

      if (std::find(inFlight.begin(), inFlight.end(), path) != inFlight.end()) {
        err.code = ProgramErrc::RecursiveInclude;
        err.message = "recursive include: " + describeChain(inFlight, path);
        err.path = path;
        return false;
      }

      std::string text, why;
      if (!fetcher.fetch(path, text, why)) {
        err.code = ProgramErrc::IncludeLoad;
        err.message = "failed to load include " + path + ": " + why;
        err.path = path;
        return false;
      }

      inFlight.push_back(path);
      bool ok = expandIncludes(fetcher, path, text, inFlight, out, err);
      inFlight.pop_back();
      if (!ok) return false;

      if (!last && (out.empty() || out.back() != '\n')) out += '\n';
    } else {
      out += line;
      if (!last) out += '\n';
    }

    if (last) break;
    pos = eol + 1;
  }
  return true;
}

// -------------------- ShaderPreprocessor --------------------

ShaderPreprocessor::ShaderPreprocessor(SourceFetcher& fetcher, ExtensionSet extensions)
  : fetcher_(&fetcher), extensions_(std::move(extensions)) {}

PreprocessResult ShaderPreprocessor::preprocess(const std::string& basePath,
                                                const std::string& source) const {
  PreprocessResult r;

  InFlight inFlight;
  if (!basePath.empty() && basePath.back() != '/') {
    inFlight.push_back(normalizePath(basePath));
  }

  std::string expanded;
  if (!expandIncludes(*fetcher_, basePath, source, inFlight, expanded, r.err)) {
    std::fprintf(stderr, "ShaderPreprocessor: %s\n", r.err.message.c_str());
    r.ok = false;
    return r;
  }

  r.source = expandExtensionMacros(expanded, extensions_);
  return r;
}

PreprocessResult ShaderPreprocessor::load(const std::string& uri) const {
  std::string text, why;
  if (!fetcher_->fetch(uri, text, why)) {
    PreprocessResult r;
    r.ok = false;
    r.err.code = ProgramErrc::IncludeLoad;
    r.err.message = "failed to load shader " + uri + ": " + why;
    r.err.path = uri;
    std::fprintf(stderr, "ShaderPreprocessor: %s\n", r.err.message.c_str());
    return r;
  }
  return preprocess(uri, text);
}

std::future<PreprocessResult> ShaderPreprocessor::preprocessAsync(std::string basePath,
                                                                  std::string source) const {
  ShaderPreprocessor self = *this;
  return std::async(std::launch::async,
                    [self, basePath = std::move(basePath), source = std::move(source)]() {
                      return self.preprocess(basePath, source);
                    });
}

std::future<PreprocessResult> ShaderPreprocessor::loadAsync(std::string uri) const {
  ShaderPreprocessor self = *this;
  return std::async(std::launch::async, [self, uri = std::move(uri)]() {
    return self.load(uri);
  });
}

} // namespace luma
