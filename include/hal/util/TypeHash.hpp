#pragma once

#include <cstdint>
#include <string_view>
#include <type_traits>

/**
 * Utility to create a unique hash for individual types at compile time. Used to tag type-erased
 * values (message payloads, property values) so that they can be read back with a degree of type
 * safety.
 *
 * Based on https://github.com/Manu343726/ctti/blob/master/include/ctti/detail/hash.hpp
 */
namespace hal::util {

namespace detail {
  constinit const std::uint64_t FNV_BASIS_64 = 0xCBF2'9CE4'8422'2325;
  constinit const std::uint64_t FNV_PRIME_64 = 0x0000'0100'0000'01B3;

  consteval std::uint64_t fnv1a_hash(const std::string_view sv) {
    std::uint64_t hash = FNV_BASIS_64;

    for(const auto c : sv) {
      hash = (hash ^ static_cast<std::uint64_t>(c)) * FNV_PRIME_64;
    }
    return hash;
  }

  /**
   * The magic macros used here expand to the full name of the function _including_ the type
   * argument, which gives us a unique string per type.
   */
  template<typename T>
  consteval std::string_view uid_helper() {
#if defined(HAL_COMPILER_MSVC) || defined(HAL_COMPILER_CLANG_CL)
    return __FUNCSIG__;
#elif defined(HAL_COMPILER_GCC) || defined(HAL_COMPILER_CLANG)
    return __PRETTY_FUNCTION__;
#else
#error "This compiler cannot support the compile-time UID feature"
#endif
  }
} /* namespace detail */

// N.B. that the type is decayed, so cv-qualifiers and references do not affect the hash
template<typename T>
constinit const inline auto TypeHash = detail::fnv1a_hash(detail::uid_helper<std::decay_t<T>>());

using Hash_t = std::remove_const_t<decltype(TypeHash<void>)>;

} /* namespace hal::util */
