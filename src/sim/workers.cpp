#include <rb/sim/workers.hpp>

#include <exception>  // std::exception_ptr, std::current_exception
#include <utility>    // std::move
#include <vector>

namespace rb {
namespace sim {

void run_workers(std::size_t n, const WorkerTask& task) {
  run_workers(n, task, [](std::function<void()> f) { return std::thread(std::move(f)); });
}

void run_workers(std::size_t n, const WorkerTask& task, const ThreadSpawner& spawn) {
  std::vector<std::exception_ptr> errors(n);
  std::vector<std::thread> threads;
  threads.reserve(n);

  try {
    for (std::size_t k = 0; k < n; ++k) {
      threads.push_back(spawn([&task, &errors, k]() {
        try {
          task(k);
        } catch (...) {
          errors[k] = std::current_exception();
        }
      }));
    }
  } catch (...) {
    // Échec de création : on joint ceux déjà partis avant de propager.
    for (auto& t : threads) {
      if (t.joinable()) t.join();
    }
    throw;
  }

  for (auto& t : threads) t.join();
  for (const auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }
}

} // namespace sim
} // namespace rb
