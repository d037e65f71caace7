#ifndef INCLUDE_GRADEBOX_ERROR_H_
#define INCLUDE_GRADEBOX_ERROR_H_

#include <string>
#include <exception>
#include <stdexcept>

// Failure of the sandboxing machinery itself (engine, filesystem, malformed
//   runner output). A program that fails to compile is not one of these.
class SandboxError : public std::runtime_error {
 public:
  explicit SandboxError(const std::string& msg) : std::runtime_error(msg) {}
  // "while <context>: <cause>"
  SandboxError(const std::string& context, const std::string& cause);
};

// Log the error under a random ID and return the message to show to the user.
std::string ReportInternalError(const std::exception&);

#endif  // INCLUDE_GRADEBOX_ERROR_H_
