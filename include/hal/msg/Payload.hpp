#pragma once

#include "hal/PropertyMap.hpp"
#include "hal/msg/exceptions.hpp"
#include "hal/util/TypeHash.hpp"

#include <concepts>
#include <map>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace hal::msg {

/**
 * The conventional payload shape: named parameters, e.g. {"path": "/cfg.xml"}.
 */
using Params_t = std::map<std::string, PropertyMap::PropVariant_t>;

/**
 * Type-erased, immutable message data. A Payload either is empty or holds exactly one value of
 * some type T, which can only be read back as a const T&. The value is tagged with TypeHash<T>
 * upon construction, and get() checks the tag before handing out a reference.
 *
 * Copies share the same underlying value; since the value can never be mutated through a Payload,
 * this is safe to do across threads.
 */
class Payload {
  template<typename Raw_t>
  using Stored_t = std::conditional_t<std::same_as<std::decay_t<Raw_t>, const char *>
                                        || std::same_as<std::decay_t<Raw_t>, char *>,
                                      std::string,
                                      std::decay_t<Raw_t>>;

public:
  /**
   * An empty payload.
   */
  Payload() = default;

  /**
   * String literals and other C strings are stored as std::string, so that they are read back with
   * get<std::string>() rather than as a pointer that may dangle.
   */
  template<typename Raw_t, typename T = Stored_t<Raw_t>>
  requires(!std::same_as<std::decay_t<Raw_t>, Payload>)
  Payload(Raw_t &&val)
    : container_(std::make_shared<const Container_<T>>(std::forward<Raw_t>(val))) { }

  bool has_value() const noexcept { return container_ != nullptr; }

  /**
   * Returns the TypeHash of the held value, or 0 if empty.
   */
  util::Hash_t identity() const noexcept { return has_value() ? container_->hsh : 0; }

  template<typename Raw_t, typename T = std::decay_t<Raw_t>>
  bool holds() const noexcept {
    return identity() == util::TypeHash<T>;
  }

  /**
   * Returns a read-only reference to the held value. The reference is valid for as long as this
   * Payload (or a copy of it) is alive.
   *
   * Throws PayloadTypeMismatch if the payload is empty or holds a type other than T.
   */
  template<typename Raw_t, typename T = std::decay_t<Raw_t>>
  const T &get() const {
    if(!has_value()) {
      throw PayloadTypeMismatch("Attempted to read a value from an empty Payload");
    }

    if(!holds<T>()) {
      throw PayloadTypeMismatch(
        "Attempted to read a Payload as a different type from the one it was created with");
    }

    return static_cast<const Container_<T> *>(container_.get())->val;
  }

private:
  struct ContainerBase_ {
    explicit ContainerBase_(const util::Hash_t hshArg) : hsh(hshArg) { }
    virtual ~ContainerBase_() = default;

    const util::Hash_t hsh;
  };

  template<typename T>
  struct Container_ : ContainerBase_ {
    template<typename U>
    explicit Container_(U &&valArg)
      : ContainerBase_(util::TypeHash<T>), val(std::forward<U>(valArg)) { }

    const T val;
  };

  std::shared_ptr<const ContainerBase_> container_;
};

}  // namespace hal::msg
