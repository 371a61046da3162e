#pragma once

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace panel_sync {

enum class ComputedState { Empty, Loading, Success, Error };

// One cache key as a renderer sees it: a value, a load in progress, a failure,
// or nothing requested yet.
template <typename T> class Computed {
public:
  static Computed success(T value) {
    return Computed(Storage(std::in_place_index<2>, std::move(value)));
  }
  static Computed loading() {
    return Computed(Storage(std::in_place_index<1>));
  }
  static Computed error(std::exception_ptr error) {
    return Computed(Storage(std::in_place_index<3>, Failed{std::move(error)}));
  }
  static Computed empty() { return Computed(Storage(std::in_place_index<0>)); }

  ComputedState state() const {
    return static_cast<ComputedState>(v_.index());
  }
  bool is_present() const { return state() == ComputedState::Success; }
  bool is_loading() const { return state() == ComputedState::Loading; }
  bool is_error() const { return state() == ComputedState::Error; }
  bool is_empty() const { return state() == ComputedState::Empty; }

  template <typename F>
  auto map(F &&fn) const -> Computed<std::invoke_result_t<F, const T &>> {
    using R = std::invoke_result_t<F, const T &>;
    switch (state()) {
    case ComputedState::Success:
      try {
        return Computed<R>::success(std::invoke(fn, std::get<2>(v_)));
      } catch (...) {
        return Computed<R>::error(std::current_exception());
      }
    case ComputedState::Loading:
      return Computed<R>::loading();
    case ComputedState::Error:
      return Computed<R>::error(error_ptr());
    case ComputedState::Empty:
      break;
    }
    return Computed<R>::empty();
  }

  Computed on_loading(T fallback) const {
    return is_loading() ? success(std::move(fallback)) : *this;
  }
  Computed on_error(T fallback) const {
    return is_error() ? success(std::move(fallback)) : *this;
  }

  T value_or(T fallback) const {
    if (const T *v = std::get_if<2>(&v_))
      return *v;
    return fallback;
  }
  std::optional<T> to_optional() const {
    if (const T *v = std::get_if<2>(&v_))
      return *v;
    return std::nullopt;
  }

  std::exception_ptr error_ptr() const {
    if (const auto *f = std::get_if<3>(&v_))
      return f->error;
    return nullptr;
  }
  std::optional<std::string> error_message() const {
    const auto err = error_ptr();
    if (!err)
      return std::nullopt;
    try {
      std::rethrow_exception(err);
    } catch (const std::exception &e) {
      return std::string(e.what());
    } catch (...) {
      return std::string("unknown error");
    }
  }

private:
  struct Pending {};
  struct Failed {
    std::exception_ptr error;
  };
  // Alternative order matches ComputedState.
  using Storage = std::variant<std::monostate, Pending, T, Failed>;

  explicit Computed(Storage v) : v_(std::move(v)) {}

  Storage v_;
};

} // namespace panel_sync
