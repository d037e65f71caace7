#include <gradebox/config.h>

std::string kContainerEngine = "docker";
fs::path kBuildContext = fs::path(GRADEBOX_DATA_DIR) / "sandbox";
fs::path kTempRoot = "/tmp/gradebox";
long kMemoryLimitMiB = 100;
int kWorkers = 4;

const char kCommandFileName[] = "command";
const char kContainerInputDir[] = "/input";
