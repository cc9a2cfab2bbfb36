#ifndef THREAD_UTILS_HPP
#define THREAD_UTILS_HPP
#include <thread>

/**
 * @brief Owns a thread and joins it when leaving scope.
 *
 * Used for helper threads that must never outlive the function which
 * started them, even when that function exits through an exception.
 */
class ThreadGuard {
  public:
    ThreadGuard() = default;
    explicit ThreadGuard(std::thread&& t) : t_(std::move(t)) {}
    ThreadGuard(const ThreadGuard&) = delete;
    ThreadGuard& operator=(const ThreadGuard&) = delete;
    ~ThreadGuard() { join(); }

    void join() {
        if (t_.joinable())
            t_.join();
    }

  private:
    std::thread t_;
};

#endif // THREAD_UTILS_HPP
