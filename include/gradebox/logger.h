#ifndef INCLUDE_GRADEBOX_LOGGER_H_
#define INCLUDE_GRADEBOX_LOGGER_H_

// Keep console sinks usable in children forked while another thread logs.
// Call once from the main thread before any worker starts.
void InitLogger();

#endif  // INCLUDE_GRADEBOX_LOGGER_H_
