#pragma once

#include <portiona/core/logging.hpp>
#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace portiona::core {

enum class ModelState : std::uint8_t {
  Uninitialized,
  Ready,
  Unavailable,
};

/// Lazily constructed inference backend, created once for the process lifetime.
///
/// get() runs the factory on first use; concurrent first callers block on the
/// same initialization instead of starting their own. A factory that throws or
/// returns nullptr leaves the model Unavailable: get() then returns nullptr
/// without retrying until reinitialize() is called.
///
/// Backend must provide warmup(); it is called once after construction.
template <typename Backend>
class LazyModel {
 public:
  using Factory = std::function<std::unique_ptr<Backend>()>;

  LazyModel(std::string name, Factory factory)
      : name_(std::move(name)), factory_(std::move(factory)) {}

  LazyModel(const LazyModel&) = delete;
  LazyModel& operator=(const LazyModel&) = delete;

  /// Backend, or nullptr when unavailable. The pointer stays valid until
  /// reinitialize() or destruction.
  [[nodiscard]] Backend* get() {
    const ModelState state = state_.load(std::memory_order_acquire);
    if (state == ModelState::Ready) return backend_.get();
    if (state == ModelState::Unavailable) return nullptr;

    std::lock_guard lock(init_mutex_);
    if (state_.load(std::memory_order_relaxed) == ModelState::Uninitialized) {
      initialize_locked();
    }
    return state_.load(std::memory_order_relaxed) == ModelState::Ready ? backend_.get()
                                                                       : nullptr;
  }

  /// Drops the current backend and runs the factory again.
  /// Callers must not hold a pointer from get() across this call.
  bool reinitialize() {
    std::lock_guard lock(init_mutex_);
    state_.store(ModelState::Uninitialized, std::memory_order_release);
    backend_.reset();
    initialize_locked();
    return state_.load(std::memory_order_relaxed) == ModelState::Ready;
  }

  [[nodiscard]] ModelState state() const noexcept {
    return state_.load(std::memory_order_acquire);
  }

  [[nodiscard]] const std::string& name() const noexcept { return name_; }

 private:
  void initialize_locked() {
    try {
      auto backend = factory_ ? factory_() : nullptr;
      if (!backend) {
        logging::logger()->info("{}: no backend configured", name_);
        state_.store(ModelState::Unavailable, std::memory_order_release);
        return;
      }
      backend->warmup();
      backend_ = std::move(backend);
      logging::logger()->info("{}: model ready", name_);
      state_.store(ModelState::Ready, std::memory_order_release);
    } catch (const std::exception& e) {
      logging::logger()->error("{}: model initialization failed: {}", name_, e.what());
      backend_.reset();
      state_.store(ModelState::Unavailable, std::memory_order_release);
    }
  }

  std::string name_;
  Factory factory_;
  std::mutex init_mutex_;
  std::atomic<ModelState> state_{ModelState::Uninitialized};
  std::unique_ptr<Backend> backend_;
};

}  // namespace portiona::core
