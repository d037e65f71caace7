#ifndef GRADEBOX_PROCESS_H_
#define GRADEBOX_PROCESS_H_

#include <string>
#include <vector>
#include <functional>
#include <sys/types.h>

// A child process with stdin from /dev/null and piped stdout/stderr.
// All pipes are close-on-exec, so concurrently spawned children never
//   inherit each other's pipe ends.
class Subprocess {
  pid_t pid_;
  int out_fd_, err_fd_;
  bool waited_;
 public:
  // throws SandboxError if the program cannot be started
  Subprocess(const std::vector<std::string>& argv, bool merge_stderr);
  ~Subprocess(); // kills and reaps the child if Wait() was not called
  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  pid_t Pid() const { return pid_; }
  int StdoutFd() const { return out_fd_; }
  int StderrFd() const { return err_fd_; } // -1 if merged
  // returns the raw wait status
  int Wait();
};

struct ProcessOutput {
  int status;
  std::string out, err;
};

// Run to completion, collecting stdout and stderr separately
ProcessOutput RunAndCapture(const std::vector<std::string>& argv);

// Run to completion with stderr merged into stdout, calling on_line for every
//   line (without the newline); returns the raw wait status
int RunAndStreamLines(const std::vector<std::string>& argv,
                      const std::function<void(const std::string&)>& on_line);

bool IsSuccess(int status);
std::string DescribeStatus(int status);

#endif  // GRADEBOX_PROCESS_H_
