#pragma once

#include <string>
#include <vector>

#include "ufs/directory_entry.hpp"

#include "ufs/impl/file.hpp"

namespace ufs {
namespace impl {

// Directory present in both sources of a merge.
// Its metadata is what `merge_entries` reports for the same directory in the listing of its parent.
class MergedDirectory: public StaticDirectory {
   public:
	MergedDirectory(
	    std::string                         name,
	    directory_entry const&              upper,
	    std::vector<directory_entry>        upper_entries,
	    directory_entry const&              lower,
	    std::vector<directory_entry> const& lower_entries);
};

}  // namespace impl
}  // namespace ufs
