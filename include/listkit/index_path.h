/// @file index_path.h
/// @brief (section, item) position used by changesets and snapshot queries.

#pragma once

#include <listkit/api.h>

#include <compare>
#include <cstddef>
#include <iosfwd>
#include <string>

namespace listkit {

struct IndexPath {
    std::size_t section = 0;
    std::size_t item = 0;

    auto operator<=>(const IndexPath&) const = default;
};

/// "[section, item]"
LISTKIT_API std::string to_string(const IndexPath& path);
LISTKIT_API std::ostream& operator<<(std::ostream& os, const IndexPath& path);

} // namespace listkit
