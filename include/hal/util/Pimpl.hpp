#pragma once

#include <memory>
#include <type_traits>
#include <utility>

namespace hal::util {

/**
 * An implementation of the pImpl pattern (https://herbsutter.com/gotw/_101/). Used to keep heavy
 * third-party headers such as spdlog out of our public headers.
 *
 * @param T the underlying type. MUST have its constructor(s) and destructor
 *    declared and defined!
 */
template<typename T>
class Pimpl {
public:
  template<typename... Args>
  explicit Pimpl(Args &&...args) : pimpl_(std::make_unique<T>(std::forward<Args>(args)...)) { }

  ~Pimpl() = default;

  Pimpl(const Pimpl &)            = delete;
  Pimpl &operator=(const Pimpl &) = delete;

  Pimpl(Pimpl &&) noexcept            = default;
  Pimpl &operator=(Pimpl &&) noexcept = default;

  inline T *operator->() noexcept { return pimpl_.get(); }
  inline T &operator*() noexcept { return *pimpl_.get(); }

  inline const T *operator->() const noexcept { return pimpl_.get(); }
  inline const T &operator*() const noexcept { return *pimpl_.get(); }

private:
  std::unique_ptr<T> pimpl_;
};

} /* namespace hal::util */
