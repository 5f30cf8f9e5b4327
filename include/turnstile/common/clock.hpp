#pragma once
#include <turnstile/schema/primitives.hpp>

#include <chrono>
#include <functional>

namespace turnstile::common {

/// Wall-clock source in Unix milliseconds. Injected so tests can pin time.
using clock_function_t = std::function<turnstile::schema::timestamp_milliseconds_t()>;

inline turnstile::schema::timestamp_milliseconds_t system_now() {
  return static_cast<turnstile::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace turnstile::common
