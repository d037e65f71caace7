#ifndef INCLUDE_GRADEBOX_CONFIG_H_
#define INCLUDE_GRADEBOX_CONFIG_H_

#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// container engine executable, looked up in PATH
extern std::string kContainerEngine;
// directory passed to `<engine> build`
extern fs::path kBuildContext;
// per-run command directories are created here
extern fs::path kTempRoot;
// hard memory ceiling of each container
extern long kMemoryLimitMiB;
// number of threads doing blocking engine calls
extern int kWorkers;

// in-container constants shared with the runner
extern const char kCommandFileName[];
extern const char kContainerInputDir[];

#endif  // INCLUDE_GRADEBOX_CONFIG_H_
