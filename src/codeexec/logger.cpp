#include <codeexec/logger.h>

#include <pthread.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ansicolor_sink.h>

namespace {

using ansicolor_sink = spdlog::sinks::ansicolor_sink<spdlog::details::console_mutex>;

// The console mutex is process-global; a fork while another thread holds it
// would leave the sandbox helper child deadlocked on its first log line.
template <bool kLock> void ForEachConsoleSink() {
  for (auto& i : spdlog::default_logger()->sinks()) {
    if (auto ptr = dynamic_cast<ansicolor_sink*>(i.get())) {
      if constexpr (kLock) {
        ptr->mutex_.lock();
      } else {
        ptr->mutex_.unlock();
      }
    }
  }
}

void BeforeFork() { ForEachConsoleSink<true>(); }
void AfterFork() { ForEachConsoleSink<false>(); }

} // namespace

void InitLogger() {
  spdlog::debug("Setup logger fork handlers");
  pthread_atfork(BeforeFork, AfterFork, AfterFork);
}
