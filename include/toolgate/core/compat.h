#ifndef TOOLGATE_CORE_COMPAT_H
#define TOOLGATE_CORE_COMPAT_H

// Vocabulary types used across toolgate. The project builds as C++17, so
// these resolve to the standard library types.

#include <cstddef>
#include <optional>
#include <variant>

namespace toolgate {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

using std::make_optional;

template <typename... Types>
using variant = std::variant<Types...>;

using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

}  // namespace toolgate

#endif  // TOOLGATE_CORE_COMPAT_H
