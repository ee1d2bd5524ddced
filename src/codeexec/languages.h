#ifndef CODEEXEC_LANGUAGES_H_
#define CODEEXEC_LANGUAGES_H_

#include <string>
#include <vector>

#include <codeexec/executor.h>
#include "sandbox.h"

// compiler and installer output kept in ExecutionResult
extern const size_t kMaxMessageLength;

// environment of install/compile steps: HOME and every tool cache point into the workdir
std::vector<std::string> StepEnvs();
// environment of the user program; request variables override the defaults
std::vector<std::string> RunEnvs(const ExecutionRequest&);

// Run one preparation step in the sandbox. A failed compile step is RUNTIME_ERROR
// (message holds the diagnostics); every other failure is SETUP_ERROR.
ExecutionStatus RunPrepareStep(Sandbox&, StatsSampler&, const std::vector<std::string>& command,
                               bool compile, std::string& message);

// manifest and package-spec builders
std::string PipRequirement(const Dependency&);
std::string NpmPackageSpec(const Dependency&);
std::string PackageJsonContent(bool es_module);
std::string TsconfigContent();
std::string GoModContent(const std::vector<Dependency>&);
std::string CargoTomlContent(const std::vector<Dependency>&);
std::string ComposerJsonContent(const std::vector<Dependency>&);
// java dependencies are named groupId:artifactId
bool SplitMavenCoordinate(const std::string& name, std::string& group, std::string& artifact);
std::string PomXmlContent(const std::vector<Dependency>&);
// lowercased last path component of a package url, without .git
std::string SwiftPackageIdentity(const std::string& url);
std::string PackageSwiftContent(const std::vector<Dependency>&);

#endif  // CODEEXEC_LANGUAGES_H_
