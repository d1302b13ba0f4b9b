#include "ufs/impl/merged_file.hpp"

#include <string>
#include <utility>
#include <vector>

#include "ufs/directory_entry.hpp"

#include "ufs/impl/file.hpp"
#include "ufs/impl/merge.hpp"

namespace ufs {
namespace impl {

namespace {

directory_entry rename_(directory_entry const& entry, std::string name) {
	return {std::move(name), entry.type(), entry.perms(), entry.last_write_time(), entry.file_size()};
}

}  // namespace

MergedDirectory::MergedDirectory(
    std::string                         name,
    directory_entry const&              upper,
    std::vector<directory_entry>        upper_entries,
    directory_entry const&              lower,
    std::vector<directory_entry> const& lower_entries)
    : StaticDirectory(
        merge_directory_entry(rename_(upper, std::move(name)), lower),
        merge_entries(std::move(upper_entries), lower_entries)) { }

}  // namespace impl
}  // namespace ufs
