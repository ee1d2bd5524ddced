#include "languages.h"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "paths.h"

namespace {

constexpr ExecutionStatus kSuccess = ExecutionStatus::SUCCESS;

bool WriteSource(Sandbox& box, const fs::path& relative, const std::string& content, std::string& message) {
  if (box.WriteFile(relative, content)) return true;
  message = fmt::format("failed to write {}", relative.c_str());
  return false;
}

std::string XmlEscape(const std::string& str) {
  std::string ret;
  for (char ch : str) {
    switch (ch) {
      case '&': ret += "&amp;"; break;
      case '<': ret += "&lt;"; break;
      case '>': ret += "&gt;"; break;
      case '"': ret += "&quot;"; break;
      default: ret += ch;
    }
  }
  return ret;
}

// string literal contents in Package.swift
std::string SwiftEscape(const std::string& str) {
  std::string ret;
  for (char ch : str) {
    if (ch == '\\' || ch == '"') ret += '\\';
    ret += ch;
  }
  return ret;
}

bool RejectDependencies(const ExecutionRequest& req, std::string& message) {
  if (req.dependencies.empty()) return false;
  message = fmt::format("{} does not support dependencies", req.language);
  return true;
}

class PythonExecutor : public LanguageExecutor {
 public:
  std::string Language() const override { return "python"; }

  ExecutionStatus Prepare(const ExecutionRequest& req, Sandbox& box, StatsSampler& sampler,
                          RunSpec& spec, std::string& message) const override {
    if (!WriteSource(box, "source.py", req.code, message)) return ExecutionStatus::SETUP_ERROR;
    if (req.dependencies.empty()) {
      spec = {{"/usr/bin/env", "python3", "source.py"}, RunEnvs(req)};
      return kSuccess;
    }
    if (auto st = RunPrepareStep(box, sampler, {"/usr/bin/env", "python3", "-m", "venv", "venv"}, false, message);
        st != kSuccess) {
      return st;
    }
    std::vector<std::string> install = {"./venv/bin/pip", "install", "--quiet", "--no-cache-dir"};
    for (auto& i : req.dependencies) install.push_back(PipRequirement(i));
    if (auto st = RunPrepareStep(box, sampler, install, false, message); st != kSuccess) return st;
    spec = {{"./venv/bin/python", "source.py"}, RunEnvs(req)};
    return kSuccess;
  }

  std::vector<std::string> OutOfMemoryMarkers() const override { return {"MemoryError"}; }
};

class JavaScriptExecutor : public LanguageExecutor {
 public:
  std::string Language() const override { return "javascript"; }

  ExecutionStatus Prepare(const ExecutionRequest& req, Sandbox& box, StatsSampler& sampler,
                          RunSpec& spec, std::string& message) const override {
    if (!WriteSource(box, "source.js", req.code, message) ||
        !WriteSource(box, "package.json", PackageJsonContent(false), message)) {
      return ExecutionStatus::SETUP_ERROR;
    }
    if (!req.dependencies.empty()) {
      std::vector<std::string> install = {"/usr/bin/env", "npm", "install", "--no-audit", "--no-fund"};
      for (auto& i : req.dependencies) install.push_back(NpmPackageSpec(i));
      if (auto st = RunPrepareStep(box, sampler, install, false, message); st != kSuccess) return st;
    }
    spec = {{"/usr/bin/env", "node", "source.js"}, RunEnvs(req)};
    return kSuccess;
  }

  std::vector<std::string> OutOfMemoryMarkers() const override {
    return {"JavaScript heap out of memory"};
  }
};

class TypeScriptExecutor : public LanguageExecutor {
 public:
  std::string Language() const override { return "typescript"; }

  ExecutionStatus Prepare(const ExecutionRequest& req, Sandbox& box, StatsSampler& sampler,
                          RunSpec& spec, std::string& message) const override {
    if (!WriteSource(box, "src/index.ts", req.code, message) ||
        !WriteSource(box, "package.json", PackageJsonContent(true), message) ||
        !WriteSource(box, "tsconfig.json", TsconfigContent(), message)) {
      return ExecutionStatus::SETUP_ERROR;
    }
    std::vector<std::string> install = {"/usr/bin/env", "npm", "install", "--no-audit", "--no-fund", "typescript"};
    for (auto& i : req.dependencies) install.push_back(NpmPackageSpec(i));
    if (auto st = RunPrepareStep(box, sampler, install, false, message); st != kSuccess) return st;
    if (auto st = RunPrepareStep(box, sampler, {"/usr/bin/env", "npx", "tsc"}, true, message); st != kSuccess) {
      return st;
    }
    spec = {{"/usr/bin/env", "node", "dist/index.js"}, RunEnvs(req)};
    return kSuccess;
  }

  std::vector<std::string> OutOfMemoryMarkers() const override {
    return {"JavaScript heap out of memory"};
  }
};

class GoExecutor : public LanguageExecutor {
 public:
  std::string Language() const override { return "go"; }

  ExecutionStatus Prepare(const ExecutionRequest& req, Sandbox& box, StatsSampler& sampler,
                          RunSpec& spec, std::string& message) const override {
    if (!WriteSource(box, "main.go", req.code, message) ||
        !WriteSource(box, "go.mod", GoModContent(req.dependencies), message)) {
      return ExecutionStatus::SETUP_ERROR;
    }
    if (!req.dependencies.empty()) {
      if (auto st = RunPrepareStep(box, sampler, {"/usr/bin/env", "go", "mod", "tidy"}, false, message);
          st != kSuccess) {
        return st;
      }
    }
    if (auto st = RunPrepareStep(box, sampler, {"/usr/bin/env", "go", "build", "-o", "code-execution"}, true,
                                 message); st != kSuccess) {
      return st;
    }
    spec = {{"./code-execution"}, RunEnvs(req)};
    return kSuccess;
  }

  std::vector<std::string> OutOfMemoryMarkers() const override {
    return {"fatal error: runtime: out of memory"};
  }
};

class RustExecutor : public LanguageExecutor {
 public:
  std::string Language() const override { return "rust"; }

  ExecutionStatus Prepare(const ExecutionRequest& req, Sandbox& box, StatsSampler& sampler,
                          RunSpec& spec, std::string& message) const override {
    if (!WriteSource(box, "src/main.rs", req.code, message) ||
        !WriteSource(box, "Cargo.toml", CargoTomlContent(req.dependencies), message)) {
      return ExecutionStatus::SETUP_ERROR;
    }
    // fetching separately tells a registry failure apart from a compile error
    if (!req.dependencies.empty()) {
      if (auto st = RunPrepareStep(box, sampler, {"/usr/bin/env", "cargo", "fetch", "--quiet"}, false, message);
          st != kSuccess) {
        return st;
      }
    }
    if (auto st = RunPrepareStep(box, sampler, {"/usr/bin/env", "cargo", "build", "--release", "--quiet"}, true,
                                 message); st != kSuccess) {
      return st;
    }
    spec = {{"./target/release/code-execution"}, RunEnvs(req)};
    return kSuccess;
  }

  std::vector<std::string> OutOfMemoryMarkers() const override { return {"memory allocation of"}; }
};

class CppExecutor : public LanguageExecutor {
 public:
  std::string Language() const override { return "cpp"; }

  ExecutionStatus Prepare(const ExecutionRequest& req, Sandbox& box, StatsSampler& sampler,
                          RunSpec& spec, std::string& message) const override {
    if (RejectDependencies(req, message)) return ExecutionStatus::SETUP_ERROR;
    if (!WriteSource(box, "source.cpp", req.code, message)) return ExecutionStatus::SETUP_ERROR;
    if (auto st = RunPrepareStep(box, sampler,
            {"/usr/bin/env", "g++", "-std=c++17", "-O2", "-o", "prog", "source.cpp"}, true, message);
        st != kSuccess) {
      return st;
    }
    spec = {{"./prog"}, RunEnvs(req)};
    return kSuccess;
  }

  std::vector<std::string> OutOfMemoryMarkers() const override { return {"std::bad_alloc"}; }
};

class JavaExecutor : public LanguageExecutor {
 public:
  std::string Language() const override { return "java"; }

  ExecutionStatus Prepare(const ExecutionRequest& req, Sandbox& box, StatsSampler& sampler,
                          RunSpec& spec, std::string& message) const override {
    if (!WriteSource(box, "Main.java", req.code, message)) return ExecutionStatus::SETUP_ERROR;
    if (req.dependencies.empty()) {
      if (auto st = RunPrepareStep(box, sampler, {"/usr/bin/env", "javac", "-d", "classes", "Main.java"}, true,
                                   message); st != kSuccess) {
        return st;
      }
      spec = {{"/usr/bin/env", "java", "-cp", "classes", "Main"}, RunEnvs(req)};
      return kSuccess;
    }
    for (auto& i : req.dependencies) {
      std::string group, artifact;
      if (!SplitMavenCoordinate(i.name, group, artifact) || i.version.empty()) {
        message = fmt::format("java dependency {} must be groupId:artifactId with a version", i.name);
        return ExecutionStatus::SETUP_ERROR;
      }
    }
    if (!WriteSource(box, "pom.xml", PomXmlContent(req.dependencies), message)) {
      return ExecutionStatus::SETUP_ERROR;
    }
    // java resolves user.home from passwd, which has no entry for the sandbox uid
    std::string repo = "-Dmaven.repo.local=" + SandboxWorkdir(-1, true) + "/.m2/repository";
    if (auto st = RunPrepareStep(box, sampler, {"/usr/bin/env", "mvn", "--batch-mode", "--quiet", repo,
            "dependency:copy-dependencies", "-DoutputDirectory=deps"}, false, message); st != kSuccess) {
      return st;
    }
    // the wildcard is expanded by javac and java themselves
    if (auto st = RunPrepareStep(box, sampler,
            {"/usr/bin/env", "javac", "-cp", "deps/*", "-d", "classes", "Main.java"}, true, message);
        st != kSuccess) {
      return st;
    }
    spec = {{"/usr/bin/env", "java", "-cp", "classes:deps/*", "Main"}, RunEnvs(req)};
    return kSuccess;
  }

  std::vector<std::string> OutOfMemoryMarkers() const override { return {"java.lang.OutOfMemoryError"}; }
};

class SwiftExecutor : public LanguageExecutor {
 public:
  std::string Language() const override { return "swift"; }

  ExecutionStatus Prepare(const ExecutionRequest& req, Sandbox& box, StatsSampler& sampler,
                          RunSpec& spec, std::string& message) const override {
    for (auto& i : req.dependencies) {
      if (i.source.empty()) {
        message = fmt::format("swift dependency {} needs a package url", i.name);
        return ExecutionStatus::SETUP_ERROR;
      }
    }
    if (!WriteSource(box, "Sources/main.swift", req.code, message) ||
        !WriteSource(box, "Package.swift", PackageSwiftContent(req.dependencies), message)) {
      return ExecutionStatus::SETUP_ERROR;
    }
    if (!req.dependencies.empty()) {
      if (auto st = RunPrepareStep(box, sampler, {"/usr/bin/env", "swift", "package", "resolve"}, false, message);
          st != kSuccess) {
        return st;
      }
    }
    if (auto st = RunPrepareStep(box, sampler, {"/usr/bin/env", "swift", "build", "-c", "release"}, true,
                                 message); st != kSuccess) {
      return st;
    }
    spec = {{"./.build/release/code-execution"}, RunEnvs(req)};
    return kSuccess;
  }

  std::vector<std::string> OutOfMemoryMarkers() const override { return {"Could not allocate memory"}; }
};

class PhpExecutor : public LanguageExecutor {
 public:
  std::string Language() const override { return "php"; }

  ExecutionStatus Prepare(const ExecutionRequest& req, Sandbox& box, StatsSampler& sampler,
                          RunSpec& spec, std::string& message) const override {
    if (!WriteSource(box, "source.php", req.code, message)) return ExecutionStatus::SETUP_ERROR;
    if (!req.dependencies.empty()) {
      if (!WriteSource(box, "composer.json", ComposerJsonContent(req.dependencies), message)) {
        return ExecutionStatus::SETUP_ERROR;
      }
      if (auto st = RunPrepareStep(box, sampler,
              {"/usr/bin/env", "composer", "update", "--no-interaction", "--no-progress"}, false, message);
          st != kSuccess) {
        return st;
      }
    }
    if (auto st = RunPrepareStep(box, sampler, {"/usr/bin/env", "php", "-l", "source.php"}, true, message);
        st != kSuccess) {
      return st;
    }
    spec = {{"/usr/bin/env", "php", "source.php"}, RunEnvs(req)};
    return kSuccess;
  }

  std::vector<std::string> OutOfMemoryMarkers() const override { return {"Allowed memory size of"}; }
};

} // namespace

std::string PipRequirement(const Dependency& dep) {
  if (!dep.source.empty()) return dep.name + '@' + dep.source;
  if (!dep.version.empty()) return dep.name + "==" + dep.version;
  return dep.name;
}

std::string NpmPackageSpec(const Dependency& dep) {
  if (!dep.source.empty()) return dep.name + '@' + dep.source;
  if (!dep.version.empty()) return dep.name + '@' + dep.version;
  return dep.name;
}

std::string PackageJsonContent(bool es_module) {
  nlohmann::json pkg = {
    {"name", "code-execution"},
    {"version", "1.0.0"},
    {"private", true},
  };
  if (es_module) pkg["type"] = "module";
  return pkg.dump(2) + '\n';
}

std::string TsconfigContent() {
  nlohmann::json tsconfig = {
    {"compilerOptions", {
      {"target", "ES2022"},
      {"module", "ESNext"},
      {"moduleResolution", "node"},
      {"esModuleInterop", true},
      {"strict", true},
      {"skipLibCheck", true},
      {"outDir", "./dist"},
      {"rootDir", "./src"},
    }},
    {"include", {"src/**/*"}},
    {"exclude", {"node_modules"}},
  };
  return tsconfig.dump(2) + '\n';
}

std::string GoModContent(const std::vector<Dependency>& deps) {
  std::string ret = "module code-execution\n\ngo 1.21\n";
  std::string require;
  for (auto& i : deps) {
    std::string version = i.source;
    if (version.empty() && !i.version.empty()) {
      version = i.version[0] == 'v' ? i.version : 'v' + i.version;
    }
    // unversioned modules are resolved by go mod tidy from the imports
    if (version.empty()) continue;
    require += fmt::format("\t{} {}\n", i.name, version);
  }
  if (!require.empty()) ret += "\nrequire (\n" + require + ")\n";
  return ret;
}

std::string CargoTomlContent(const std::vector<Dependency>& deps) {
  std::string ret =
      "[package]\n"
      "name = \"code-execution\"\n"
      "version = \"0.1.0\"\n"
      "edition = \"2021\"\n"
      "\n"
      "[dependencies]\n";
  for (auto& i : deps) {
    if (!i.source.empty()) {
      ret += fmt::format("{} = {{ git = \"{}\" }}\n", i.name, i.source);
    } else {
      ret += fmt::format("{} = \"{}\"\n", i.name, i.version.empty() ? "*" : i.version);
    }
  }
  return ret;
}

std::string ComposerJsonContent(const std::vector<Dependency>& deps) {
  nlohmann::json require = nlohmann::json::object();
  for (auto& i : deps) {
    if (!i.source.empty()) {
      require[i.name] = "dev-master#" + i.source;
    } else {
      require[i.name] = i.version.empty() ? "*" : i.version;
    }
  }
  nlohmann::json composer = {
    {"name", "code-execution/app"},
    {"type", "project"},
    {"require", require},
  };
  return composer.dump(2) + '\n';
}

bool SplitMavenCoordinate(const std::string& name, std::string& group, std::string& artifact) {
  size_t pos = name.find(':');
  if (pos == std::string::npos) return false;
  group = name.substr(0, pos);
  artifact = name.substr(pos + 1);
  return !group.empty() && !artifact.empty() && artifact.find(':') == std::string::npos;
}

std::string PomXmlContent(const std::vector<Dependency>& deps) {
  std::string dependencies, repositories;
  for (auto& i : deps) {
    std::string group, artifact;
    if (!SplitMavenCoordinate(i.name, group, artifact)) continue;
    dependencies += fmt::format(
        "    <dependency>\n"
        "      <groupId>{}</groupId>\n"
        "      <artifactId>{}</artifactId>\n"
        "      <version>{}</version>\n"
        "    </dependency>\n",
        XmlEscape(group), XmlEscape(artifact), XmlEscape(i.version));
    // a source is an extra repository to resolve from
    if (!i.source.empty()) {
      repositories += fmt::format(
          "    <repository>\n"
          "      <id>source-{}</id>\n"
          "      <url>{}</url>\n"
          "    </repository>\n",
          XmlEscape(artifact), XmlEscape(i.source));
    }
  }
  std::string ret =
      "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
      "<project xmlns=\"http://maven.apache.org/POM/4.0.0\">\n"
      "  <modelVersion>4.0.0</modelVersion>\n"
      "  <groupId>code.execution</groupId>\n"
      "  <artifactId>code-execution</artifactId>\n"
      "  <version>1.0-SNAPSHOT</version>\n"
      "  <properties>\n"
      "    <project.build.sourceEncoding>UTF-8</project.build.sourceEncoding>\n"
      "  </properties>\n";
  ret += "  <dependencies>\n" + dependencies + "  </dependencies>\n";
  if (!repositories.empty()) ret += "  <repositories>\n" + repositories + "  </repositories>\n";
  ret += "</project>\n";
  return ret;
}

std::string SwiftPackageIdentity(const std::string& url) {
  std::string ret = url;
  while (!ret.empty() && ret.back() == '/') ret.pop_back();
  if (size_t pos = ret.find_last_of("/:"); pos != std::string::npos) ret = ret.substr(pos + 1);
  if (ret.size() > 4 && ret.compare(ret.size() - 4, 4, ".git") == 0) ret.resize(ret.size() - 4);
  std::transform(ret.begin(), ret.end(), ret.begin(), [](unsigned char ch) { return std::tolower(ch); });
  return ret;
}

std::string PackageSwiftContent(const std::vector<Dependency>& deps) {
  std::string packages, products;
  for (auto& i : deps) {
    if (i.source.empty()) continue;
    std::string url = SwiftEscape(i.source);
    if (i.version.empty()) {
      packages += fmt::format("        .package(url: \"{}\", \"0.0.0\"..<\"10000.0.0\"),\n", url);
    } else {
      packages += fmt::format("        .package(url: \"{}\", from: \"{}\"),\n", url, SwiftEscape(i.version));
    }
    products += fmt::format("                .product(name: \"{}\", package: \"{}\"),\n",
                            SwiftEscape(i.name), SwiftEscape(SwiftPackageIdentity(i.source)));
  }
  return fmt::format(
      "// swift-tools-version:5.5\n"
      "import PackageDescription\n"
      "\n"
      "let package = Package(\n"
      "    name: \"code-execution\",\n"
      "    dependencies: [\n"
      "{}"
      "    ],\n"
      "    targets: [\n"
      "        .executableTarget(\n"
      "            name: \"code-execution\",\n"
      "            dependencies: [\n"
      "{}"
      "            ],\n"
      "            path: \"Sources\"\n"
      "        )\n"
      "    ]\n"
      ")\n",
      packages, products);
}

void RegisterDefaultExecutors(ExecutorRegistry& registry) {
  registry.Register(std::make_unique<PythonExecutor>());
  registry.Register(std::make_unique<JavaScriptExecutor>());
  registry.Register(std::make_unique<TypeScriptExecutor>());
  registry.Register(std::make_unique<GoExecutor>());
  registry.Register(std::make_unique<RustExecutor>());
  registry.Register(std::make_unique<CppExecutor>());
  registry.Register(std::make_unique<JavaExecutor>());
  registry.Register(std::make_unique<PhpExecutor>());
  registry.Register(std::make_unique<SwiftExecutor>());
  spdlog::info("Registered executors: {}", registry.Languages().size());
}
