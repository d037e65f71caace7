#include <gradebox/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/details/console_globals.h>

namespace {

// All console sinks of the default logger share this mutex; a child forked
//   while another thread holds it would deadlock on its first log line.
void Prepare() {
  spdlog::details::console_mutex::mutex().lock();
}

void Parent() {
  spdlog::details::console_mutex::mutex().unlock();
}

void Child() {
  spdlog::details::console_mutex::mutex().unlock();
}

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger pthread_atfork");
  pthread_atfork(Prepare, Parent, Child);
}
