// D2.1 — #include expansion: relative resolution, cycles, load failures, no caching.

#include "luma/shaders/ShaderPreprocessor.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireEq(const std::string& got, const std::string& want, const char* msg) {
  if (got != want) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n  got:  [%s]\n  want: [%s]\n",
                 msg, got.c_str(), want.c_str());
    std::exit(1);
  }
}

static void testPaths() {
  std::printf("  sub-test: path helpers\n");
  requireEq(luma::includeDirectory("shaders/lib/a.glsl"), "shaders/lib/", "dir of nested file");
  requireEq(luma::includeDirectory("a.glsl"), "", "dir of bare file");
  requireEq(luma::includeDirectory("shaders/"), "shaders/", "dir of a directory");

  requireEq(luma::resolveIncludePath("shaders/main.glsl", "lib/a.glsl"),
            "shaders/lib/a.glsl", "relative to the including file");
  requireEq(luma::resolveIncludePath("shaders/lib/a.glsl", "../common/b.glsl"),
            "shaders/common/b.glsl", "parent segment folded");
  requireEq(luma::resolveIncludePath("shaders/lib/a.glsl", "./b.glsl"),
            "shaders/lib/b.glsl", "dot segment dropped");
  requireEq(luma::resolveIncludePath("shaders/", "x.glsl"), "shaders/x.glsl", "directory base");
  requireEq(luma::resolveIncludePath("a.glsl", "../x.glsl"), "../x.glsl", "leading parent kept");

  // Doubled slashes collapse before parent segments fold.
  requireEq(luma::resolveIncludePath("a//b.glsl", "../x.glsl"), "x.glsl", "empty segment dropped");
  requireEq(luma::resolveIncludePath("shaders//lib/a.glsl", "b.glsl"),
            "shaders/lib/b.glsl", "doubled slash in base");
  requireEq(luma::resolveIncludePath("shaders/main.glsl", "lib//../c.glsl"),
            "shaders/c.glsl", "doubled slash in include");
  requireEq(luma::resolveIncludePath("/shaders/main.glsl", "lib/a.glsl"),
            "/shaders/lib/a.glsl", "leading slash kept");
  std::printf("    PASS\n");
}

static void testNested() {
  std::printf("  sub-test: nested relative includes\n");
  luma::MemorySourceFetcher files;
  files.add("shaders/lib/a.glsl", "// a\n#include \"../common/b.glsl\"\nfloat a() { return b(); }\n");
  files.add("shaders/common/b.glsl", "float b() { return 1.0; }\n");

  luma::ShaderPreprocessor pp(files, luma::ExtensionSet());
  luma::PreprocessResult r = pp.preprocess(
      "shaders/main.glsl",
      "#version 330 core\n#include \"lib/a.glsl\"\nvoid main() {}\n");

  requireTrue(r.ok, "preprocess ok");
  requireEq(r.source,
            "#version 330 core\n"
            "// a\n"
            "float b() { return 1.0; }\n"
            "float a() { return b(); }\n"
            "void main() {}\n",
            "includes spliced in place");
  std::printf("    PASS\n");
}

static void testDirectivePlacement() {
  std::printf("  sub-test: directive placement\n");
  luma::MemorySourceFetcher files;
  files.add("x.glsl", "float x;");

  luma::ShaderPreprocessor pp(files, luma::ExtensionSet());

  // Leading blanks allowed; no trailing newline in the chunk.
  luma::PreprocessResult r = pp.preprocess("", "  #include \"x.glsl\"\nvoid main() {}");
  requireTrue(r.ok, "indented include ok");
  requireEq(r.source, "float x;\nvoid main() {}", "indented include expanded");

  // Commented-out and angle-bracket forms pass through untouched.
  r = pp.preprocess("", "// #include \"x.glsl\"\n#include <x.glsl>\n");
  requireTrue(r.ok, "non-directives ok");
  requireEq(r.source, "// #include \"x.glsl\"\n#include <x.glsl>\n", "left as is");
  requireTrue(files.fetchCount("x.glsl") == 1, "only the real directive fetched");
  std::printf("    PASS\n");
}

static void testDiamond() {
  std::printf("  sub-test: diamond includes are not cycles\n");
  luma::MemorySourceFetcher files;
  files.add("left.glsl", "#include \"common.glsl\"\nfloat left;\n");
  files.add("right.glsl", "#include \"common.glsl\"\nfloat right;\n");
  files.add("common.glsl", "float common;\n");

  luma::ShaderPreprocessor pp(files, luma::ExtensionSet());
  luma::PreprocessResult r = pp.preprocess(
      "main.glsl", "#include \"left.glsl\"\n#include \"right.glsl\"\n");

  requireTrue(r.ok, "diamond ok");
  requireEq(r.source, "float common;\nfloat left;\nfloat common;\nfloat right;\n",
            "shared chunk included twice");
  requireTrue(files.fetchCount("common.glsl") == 2, "shared chunk fetched per include");
  std::printf("    PASS\n");
}

static void testCycles() {
  std::printf("  sub-test: include cycles\n");
  {
    luma::MemorySourceFetcher files;
    files.add("a.glsl", "#include \"main.glsl\"\n");
    luma::ShaderPreprocessor pp(files, luma::ExtensionSet());

    luma::PreprocessResult r = pp.preprocess("main.glsl", "#include \"a.glsl\"\n");
    requireTrue(!r.ok, "cycle back to root fails");
    requireTrue(r.err.code == luma::ProgramErrc::RecursiveInclude, "RecursiveInclude code");
    requireEq(r.err.message, "recursive include: main.glsl -> a.glsl -> main.glsl", "chain");
    requireEq(r.err.path, "main.glsl", "path is the repeated file");
    requireTrue(files.fetchCount("main.glsl") == 0, "cycle detected before fetching");
  }
  {
    luma::MemorySourceFetcher files;
    files.add("shaders/a.glsl", "#include \"b.glsl\"\n");
    files.add("shaders/b.glsl", "#include \"./a.glsl\"\n");
    luma::ShaderPreprocessor pp(files, luma::ExtensionSet());

    luma::PreprocessResult r = pp.preprocess("shaders/", "#include \"a.glsl\"\n");
    requireTrue(!r.ok, "a <-> b fails");
    requireTrue(r.err.code == luma::ProgramErrc::RecursiveInclude, "RecursiveInclude code");
    requireEq(r.err.message,
              "recursive include: shaders/a.glsl -> shaders/b.glsl -> shaders/a.glsl",
              "chain uses resolved paths");
  }
  {
    luma::MemorySourceFetcher files;
    files.add("shaders/a.glsl", "#include \"lib//../b.glsl\"\n");
    files.add("shaders/b.glsl", "#include \"a.glsl\"\n");
    luma::ShaderPreprocessor pp(files, luma::ExtensionSet());

    luma::PreprocessResult r = pp.preprocess("shaders//main.glsl", "#include \"a.glsl\"\n");
    requireTrue(!r.ok, "cycle through a doubled slash fails");
    requireTrue(r.err.code == luma::ProgramErrc::RecursiveInclude, "RecursiveInclude code");
    requireEq(r.err.path, "shaders/a.glsl", "repeated file normalized");
  }
  {
    luma::MemorySourceFetcher files;
    files.add("self.glsl", "float s;\n#include \"self.glsl\"\n");
    luma::ShaderPreprocessor pp(files, luma::ExtensionSet());

    luma::PreprocessResult r = pp.load("self.glsl");
    requireTrue(!r.ok, "self include fails");
    requireTrue(r.err.code == luma::ProgramErrc::RecursiveInclude, "RecursiveInclude code");
    requireTrue(r.source.empty(), "no partial output");
  }
  std::printf("    PASS\n");
}

static void testLoadFailures() {
  std::printf("  sub-test: load failures\n");
  luma::MemorySourceFetcher files;
  files.add("shaders/main.glsl", "#include \"lib/missing.glsl\"\nvoid main() {}\n");
  luma::ShaderPreprocessor pp(files, luma::ExtensionSet());

  luma::PreprocessResult r = pp.load("shaders/main.glsl");
  requireTrue(!r.ok, "missing include fails");
  requireTrue(r.err.code == luma::ProgramErrc::IncludeLoad, "IncludeLoad code");
  requireEq(r.err.path, "shaders/lib/missing.glsl", "path is the resolved include");
  requireTrue(r.err.message.find("failed to load include shaders/lib/missing.glsl") == 0,
              "message names the include");

  r = pp.load("shaders/nope.glsl");
  requireTrue(!r.ok, "missing shader fails");
  requireTrue(r.err.code == luma::ProgramErrc::IncludeLoad, "IncludeLoad code for the shader");
  requireEq(r.err.path, "shaders/nope.glsl", "path is the shader URI");
  std::printf("    PASS\n");
}

static void testNoCaching() {
  std::printf("  sub-test: every preprocess fetches again\n");
  luma::MemorySourceFetcher files;
  files.add("lib.glsl", "float v = 1.0;\n");
  luma::ShaderPreprocessor pp(files, luma::ExtensionSet());

  const std::string src = "#include \"lib.glsl\"\n";
  requireEq(pp.preprocess("", src).source, "float v = 1.0;\n", "first expansion");
  requireTrue(files.fetchCount("lib.glsl") == 1, "fetched once");

  // Edited on "disk": the next build sees the new text.
  files.add("lib.glsl", "float v = 2.0;\n");
  requireEq(pp.preprocess("", src).source, "float v = 2.0;\n", "second expansion sees edit");
  requireTrue(files.fetchCount("lib.glsl") == 2, "fetched again");
  std::printf("    PASS\n");
}

static void testAsync() {
  std::printf("  sub-test: async variants\n");
  luma::MemorySourceFetcher files;
  files.add("dir/a.vs.glsl", "#include \"inc.glsl\"\nvoid main() {}\n");
  files.add("dir/inc.glsl", "float inc;\n");
  luma::ShaderPreprocessor pp(files, luma::ExtensionSet());

  auto loaded = pp.loadAsync("dir/a.vs.glsl");
  auto direct = pp.preprocessAsync("dir/", "#include \"inc.glsl\"\n");

  luma::PreprocessResult a = loaded.get();
  luma::PreprocessResult b = direct.get();
  requireTrue(a.ok && b.ok, "both ok");
  requireEq(a.source, "float inc;\nvoid main() {}\n", "loadAsync result");
  requireEq(b.source, "float inc;\n", "preprocessAsync result");
  std::printf("    PASS\n");
}

int main() {
  std::printf("D2.1 include_resolve\n");
  testPaths();
  testNested();
  testDirectivePlacement();
  testDiamond();
  testCycles();
  testLoadFailures();
  testNoCaching();
  testAsync();
  std::printf("D2.1 include_resolve: ALL PASS\n");
  return 0;
}
