#include "ufs/impl/merge.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#include "ufs/directory_entry.hpp"

namespace fs = std::filesystem;

namespace ufs {
namespace impl {

directory_entry merge_directory_entry(directory_entry const& upper, directory_entry const& lower) {
	return {
	    upper.name(),
	    fs::file_type::directory,
	    upper.perms(),
	    std::max(upper.last_write_time(), lower.last_write_time()),
	};
}

std::vector<directory_entry> merge_entries(std::vector<directory_entry> upper, std::vector<directory_entry> const& lower) {
	std::unordered_map<std::string, std::size_t> index;
	index.reserve(upper.size() + lower.size());

	for(std::size_t i = 0; i < upper.size(); ++i) {
		auto const [_, ok] = index.emplace(upper[i].name(), i);
		if(!ok) {
			throw fs::filesystem_error("duplicate entry in a listing of the primary source", upper[i].name(), std::make_error_code(std::errc::state_not_recoverable));
		}
	}

	auto rst = std::move(upper);
	rst.reserve(rst.size() + lower.size());

	for(auto const& entry: lower) {
		auto const [it, ok] = index.emplace(entry.name(), rst.size());
		if(ok) {
			rst.push_back(entry);
			continue;
		}

		auto& existing = rst[it->second];
		if(!(existing.is_directory() && entry.is_directory())) {
			continue;
		}

		existing = merge_directory_entry(existing, entry);
	}

	std::sort(rst.begin(), rst.end(), [](auto const& lhs, auto const& rhs) { return lhs.name() < rhs.name(); });
	return rst;
}

}  // namespace impl
}  // namespace ufs
