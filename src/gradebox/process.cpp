#include "process.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <gradebox/error.h>
#include "utils.h"

namespace {

void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

// false on EOF
bool ReadSome(int fd, std::string& buf) {
  char tmp[65536];
  while (true) {
    ssize_t n = read(fd, tmp, sizeof(tmp));
    if (n > 0) {
      buf.append(tmp, n);
      return true;
    }
    if (n == 0) return false;
    if (errno == EINTR) continue;
    throw SandboxError("reading child output", strerror(errno));
  }
}

} // namespace

Subprocess::Subprocess(const std::vector<std::string>& argv, bool merge_stderr) :
    pid_(-1), out_fd_(-1), err_fd_(-1), waited_(false) {
  std::vector<char*> args;
  for (auto& i : argv) args.push_back(const_cast<char*>(i.c_str()));
  args.push_back(nullptr);

  int outpipe[2], errpipe[2] = {-1, -1}, execpipe[2];
  if (pipe2(outpipe, O_CLOEXEC) < 0) {
    throw SandboxError("creating pipe", strerror(errno));
  }
  if ((!merge_stderr && pipe2(errpipe, O_CLOEXEC) < 0) || pipe2(execpipe, O_CLOEXEC) < 0) {
    int err = errno;
    close(outpipe[0]);
    close(outpipe[1]);
    if (errpipe[0] >= 0) {
      close(errpipe[0]);
      close(errpipe[1]);
    }
    throw SandboxError("creating pipe", strerror(err));
  }
  spdlog::debug("Spawning {}", fmt::format("{}", argv));
  pid_ = fork();
  if (pid_ == 0) {
    int null_fd = open("/dev/null", O_RDONLY);
    if (null_fd < 0 || dup2(null_fd, 0) < 0 || dup2(outpipe[1], 1) < 0 ||
        dup2(merge_stderr ? outpipe[1] : errpipe[1], 2) < 0) {
      int err = errno;
      IGNORE_RETURN(write(execpipe[1], &err, sizeof(err)));
      _exit(127);
    }
    execvp(args[0], args.data());
    int err = errno;
    IGNORE_RETURN(write(execpipe[1], &err, sizeof(err)));
    _exit(127);
  }
  int fork_errno = errno;
  close(outpipe[1]);
  if (!merge_stderr) close(errpipe[1]);
  close(execpipe[1]);
  out_fd_ = outpipe[0];
  err_fd_ = errpipe[0];
  if (pid_ < 0) {
    close(execpipe[0]);
    CloseFd(out_fd_);
    CloseFd(err_fd_);
    throw SandboxError("forking", strerror(fork_errno));
  }
  // the exec pipe reaches EOF on successful exec because of O_CLOEXEC
  int exec_errno = 0;
  ssize_t n;
  while ((n = read(execpipe[0], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR);
  close(execpipe[0]);
  if (n > 0) {
    Wait();
    CloseFd(out_fd_);
    CloseFd(err_fd_);
    throw SandboxError("running " + argv[0], strerror(exec_errno));
  }
}

Subprocess::~Subprocess() {
  CloseFd(out_fd_);
  CloseFd(err_fd_);
  if (pid_ > 0 && !waited_) {
    spdlog::warn("Killing unfinished child pid={}", pid_);
    kill(pid_, SIGKILL);
    Wait();
  }
}

int Subprocess::Wait() {
  int status = 0;
  while (waitpid(pid_, &status, 0) < 0) {
    if (errno != EINTR) throw SandboxError("waiting for child", strerror(errno));
  }
  waited_ = true;
  return status;
}

ProcessOutput RunAndCapture(const std::vector<std::string>& argv) {
  Subprocess proc(argv, false);
  ProcessOutput ret{};
  struct pollfd fds[2] = {{proc.StdoutFd(), POLLIN, 0}, {proc.StderrFd(), POLLIN, 0}};
  std::string* bufs[2] = {&ret.out, &ret.err};
  int open_fds = 2;
  while (open_fds) {
    if (poll(fds, 2, -1) < 0) {
      if (errno == EINTR) continue;
      throw SandboxError("polling child output", strerror(errno));
    }
    for (int i = 0; i < 2; i++) {
      if (fds[i].fd < 0 || !fds[i].revents) continue;
      if (!ReadSome(fds[i].fd, *bufs[i])) {
        // negative fds are ignored by poll
        fds[i].fd = -1;
        open_fds--;
      }
    }
  }
  ret.status = proc.Wait();
  return ret;
}

int RunAndStreamLines(const std::vector<std::string>& argv,
                      const std::function<void(const std::string&)>& on_line) {
  Subprocess proc(argv, true);
  std::string buf;
  bool more = true;
  while (more) {
    more = ReadSome(proc.StdoutFd(), buf);
    size_t start = 0;
    for (size_t pos; (pos = buf.find('\n', start)) != std::string::npos; start = pos + 1) {
      on_line(buf.substr(start, pos - start));
    }
    buf.erase(0, start);
  }
  if (!buf.empty()) on_line(buf);
  return proc.Wait();
}

bool IsSuccess(int status) {
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

std::string DescribeStatus(int status) {
  if (WIFEXITED(status)) return fmt::format("exit status {}", WEXITSTATUS(status));
  if (WIFSIGNALED(status)) return fmt::format("killed by signal {}", WTERMSIG(status));
  return fmt::format("wait status {}", status);
}
