#ifndef GRADEBOX_IMAGE_H_
#define GRADEBOX_IMAGE_H_

#include <string>
#include <optional>

// Build the sandbox image from kBuildContext and return its ID. Blocks until
//   the build finishes; throws SandboxError if the build fails or never
//   reports an image ID.
std::string BuildImage();

// Image ID announced by one line of `<engine> build` output, if any
std::optional<std::string> MatchBuiltImage(const std::string& line);

#endif  // GRADEBOX_IMAGE_H_
