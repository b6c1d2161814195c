#pragma once

#include "hal/ILogger.hpp"
#include "hal/hal_types.hpp"
#include "hal/util/Spinlock.hpp"
#include "hal/util/TypeHash.hpp"

#include <atomic>
#include <concepts>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>

namespace hal {

/**
 * Used to restrict entries in PropertyMap to a given set of types.
 */
template<typename T>
concept prop_map_type = std::same_as<S64, T> || std::same_as<U64, T> || std::same_as<bool, T>
                        || std::same_as<double, T> || std::same_as<std::string, T>;

/**
 * Type tag shared by all PropertyValues, so that they can live in one map.
 */
class PropertyValueBase {
public:
  explicit PropertyValueBase(const util::Hash_t tagArg) : tag{tagArg} { }
  virtual ~PropertyValueBase() = default;

  const util::Hash_t tag;
};

/**
 * Wrapper for a property value of a given type. The underlying value will be atomic if T is
 * trivial; otherwise access will be guarded by a Spinlock. A copy of the value can be atomically
 * retrieved using get(), and the value can be atomically set using set().
 */
template<typename Raw_t, typename T = std::decay_t<Raw_t>>
requires prop_map_type<T>
class PropertyValue : public PropertyValueBase {
public:
  // N.B. that this will value-initialize val_
  PropertyValue() : PropertyValueBase(util::TypeHash<T>), val_{} { }
  ~PropertyValue() override = default;

  // PropertyValues should only ever be created in-place within a PropertyMap
  PropertyValue(const PropertyValue &)            = delete;
  PropertyValue &operator=(const PropertyValue &) = delete;
  PropertyValue(PropertyValue &&)                 = delete;
  PropertyValue &operator=(PropertyValue &&)      = delete;

  T get() const noexcept {
    if constexpr(std::is_trivial_v<T>) {
      return val_.load(std::memory_order_acquire);
    }
    else {
      std::scoped_lock lck{spinlock_};
      return val_;
    }
  }

  void set(const T &newVal) noexcept {
    if constexpr(std::is_trivial_v<T>) {
      val_.store(newVal, std::memory_order_release);
    }
    else {
      std::scoped_lock lck{spinlock_};
      val_ = newVal;
    }
  }

private:
  std::conditional_t<std::is_trivial_v<T>, std::atomic<T>, T> val_;

  // N.B. the lock is unused by trivial types
  mutable util::Spinlock spinlock_;
};

/**
 * Maps string keys to PropertyValues; holds the application's configuration. Threadsafe.
 *
 * Each key is tagged with the type it was first accessed as, and subsequent typed accesses must
 * use the same type.
 */
class PropertyMap {
public:
  using PropVariant_t = std::variant<S64, U64, bool, double, std::string>;

  /**
   * String value held by PropVariant_t to indicate the a given key does not exist in the
   * PropertyMap.
   */
  static constexpr auto KEY_NOT_FOUND_STR = "NOT_FOUND";

  explicit PropertyMap(ILogger &logger) : logger_(logger) { }

  /**
   * Retrieve a PropertyValue from the map, creating a default-initialized entry tagged with type T
   * if the key has not been seen before. Throws std::runtime_error if the key was previously
   * accessed as a different type.
   *
   * Returns a reference to the underlying PropertyValue which stays valid for the lifetime of the
   * map; it is an anti-pattern to repeatedly call get_prop in order to access a property.
   */
  template<typename Raw_t, typename T = std::decay_t<Raw_t>>
  requires prop_map_type<T> PropertyValue<T>
  &get_prop(const std::string &key) {
    std::scoped_lock lck{mtx_};
    return get_prop_<T>(key);
  }

  /**
   * Get a copy of a property value without knowing the type beforehand. Does not create an entry
   * for a key that does not exist; KEY_NOT_FOUND_STR is returned instead.
   */
  PropVariant_t get_prop_variant(const std::string &key) {
    std::scoped_lock lck{mtx_};

    auto it = map_.find(key);
    if(it == map_.end()) {
      return KEY_NOT_FOUND_STR;
    }

    PropVariant_t retval;
    visit_tag_(it->second->tag, [&]<typename T>(std::type_identity<T>) {
      retval = static_cast<const PropertyValue<T> &>(*(it->second)).get();
    });

    return retval;
  }

  /**
   * Returns a pair consisting of a boolean indicating if the key is present and the TypeHash of the
   * value (or 0 if the key is not present).
   */
  std::pair<bool, util::Hash_t> query_prop(std::string_view key) {
    std::scoped_lock lck{mtx_};

    auto it = map_.find(std::string(key));
    if(it == map_.end()) {
      return {false, 0};
    }

    return {true, it->second->tag};
  }

  /**
   * Set a property without knowing the type of the entry in the map. If the entry exists with a
   * different type, the value is coerced to that type (falling back to a default value if coercion
   * fails). If the entry does not exist it is created with the type held by val.
   */
  void set_prop_variant(const std::string &key, const PropVariant_t &val) {
    std::scoped_lock lck{mtx_};

    auto it = map_.find(key);
    if(it != map_.end()) {
      visit_tag_(it->second->tag, [&]<typename T>(std::type_identity<T>) {
        static_cast<PropertyValue<T> &>(*(it->second)).set(coerce_<T>(val));
      });
    }
    else {
      std::visit([&]<typename T>(const T &v) { get_prop_<T>(key).set(v); }, val);
    }
  }

private:
  /**
   * Invokes f with a std::type_identity of the property type whose TypeHash is hsh.
   */
  template<typename F>
  void visit_tag_(const util::Hash_t hsh, F &&f) {
    const bool found = visit_tag_impl_<S64, U64, bool, double, std::string>(hsh, f);
    if(!found) {
      logger_.error("Encountered a PropertyMap entry with an invalid type tag");
    }
  }

  template<typename... Ts, typename F>
  static bool visit_tag_impl_(const util::Hash_t hsh, F &f) {
    return ((hsh == util::TypeHash<Ts> ? (f(std::type_identity<Ts>{}), true) : false) || ...);
  }

  /**
   * Convert whatever the variant holds to T. Strings are parsed with an istringstream, which
   * leaves the result value-initialized if parsing fails.
   */
  template<typename T>
  static T coerce_(const PropVariant_t &variant) {
    return std::visit(
      []<typename V>(const V &v) -> T {
        if constexpr(std::is_same_v<T, V>) {
          return v;
        }
        else if constexpr(std::is_same_v<T, std::string>) {
          std::stringstream ss;
          ss << std::boolalpha << v;
          return ss.str();
        }
        else if constexpr(std::is_same_v<V, std::string>) {
          T                  t{};
          std::istringstream iss(v);
          iss >> std::boolalpha >> t;
          return t;
        }
        else {
          return static_cast<T>(v);
        }
      },
      variant);
  }

  template<typename T>
  PropertyValue<T> &get_prop_(const std::string &key) {
    auto it = map_.find(key);
    if(it == map_.end()) {
      it = map_.emplace(key, std::make_unique<PropertyValue<T>>()).first;
    }
    else if(it->second->tag != util::TypeHash<T>) {
      std::stringstream ss;
      ss << "Attempted to interpret a PropertyValue as a different type from what it was "
            "previously interpreted as for key ";
      ss << key;
      throw std::runtime_error(ss.str());
    }

    return static_cast<PropertyValue<T> &>(*(it->second));
  }

  ILogger &logger_;

  std::unordered_map<std::string, std::unique_ptr<PropertyValueBase>> map_;

  std::mutex mtx_;
};

}  // namespace hal
