#ifndef INCLUDE_GRADEBOX_SANDBOX_H_
#define INCLUDE_GRADEBOX_SANDBOX_H_

#include <string>
#include <vector>
#include <future>
#include <optional>

#include "command.h"
#include "result.h"
#include "worker_pool.h"

// Runs untrusted code in disposable containers of one image built at startup.
// The image ID and version table never change after construction, so the
//   const methods may be called from any thread.
class Sandbox {
  WorkerPool& pool_;
  std::string image_id_;
  std::vector<std::string> versions_;

  // encode, run and decode on a worker
  template <class Decode>
  auto Run_(Command, Decode) const;
 public:
  // Builds the image and queries the versions; blocks until both are done.
  // Throws SandboxError; the program must not serve without a Sandbox.
  explicit Sandbox(WorkerPool& pool);
  // Use an already built image; still queries the versions.
  Sandbox(WorkerPool& pool, std::string image_id);

  // The futures throw SandboxError on sandboxing failures. A program that
  //   fails to compile yields InvalidProgram instead.
  std::future<TestResponse> Test(const TestCommand&) const;
  // nullopt if the judger is valid, otherwise the reason it is not
  std::future<std::optional<std::string>> ValidateJudger(const std::string& judger) const;

  const std::string& ImageId() const { return image_id_; }
  // indexed by language ordinal
  const std::vector<std::string>& Versions() const { return versions_; }
};

#endif  // INCLUDE_GRADEBOX_SANDBOX_H_
