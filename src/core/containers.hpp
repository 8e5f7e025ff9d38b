#pragma once

#include <ankerl/unordered_dense.h>

namespace warden::core {

// Container aliases backed by ankerl::unordered_dense (dense storage, fast
// iteration). Iterators invalidate on insertion, like std::vector.
//
// Usage:
//   warden::core::fast_map<std::string, std::string> environment;
//   warden::core::fast_set<std::string_view> excluded_headers;

template <typename Key, typename Value>
using fast_map = ankerl::unordered_dense::map<Key, Value>;

template <typename Key>
using fast_set = ankerl::unordered_dense::set<Key>;

}  // namespace warden::core
