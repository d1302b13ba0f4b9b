#pragma once

#include <vector>

#include "ufs/directory_entry.hpp"

namespace ufs {
namespace impl {

// Combines the listings of one directory taken from the primary (`upper`) and the secondary (`lower`) source.
// An entry of `upper` wins over an entry of `lower` with the same name, unless both are directories:
// then the entry keeps the name and permissions of `upper` and the later of the two last write times,
// which is what opening that directory through the merge reports.
// The result is sorted by name in byte order.
//
// Throws `filesystem_error` with `state_not_recoverable` if `upper` holds a name twice.
std::vector<directory_entry> merge_entries(std::vector<directory_entry> upper, std::vector<directory_entry> const& lower);

// Metadata of a directory present in both sources.
directory_entry merge_directory_entry(directory_entry const& upper, directory_entry const& lower);

}  // namespace impl
}  // namespace ufs
