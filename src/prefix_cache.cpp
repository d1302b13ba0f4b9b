#include "ufs/impl/prefix_cache.hpp"

#include <cstddef>
#include <filesystem>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>

#include "ufs/fs.hpp"

#include "ufs/impl/utils.hpp"

namespace fs = std::filesystem;

namespace ufs {
namespace impl {

void PrefixCache::validate(Fs const& source, std::string_view p) {
	auto const path = std::string(p);
	if(this->known_ok_(path)) {
		return;
	}

	for(auto const prefix_view: path_prefixes(p)) {
		auto const prefix = std::string(prefix_view);
		if(this->known_ok_(prefix)) {
			continue;
		}

		std::error_code ec;

		auto const f = source.open(prefix, ec);
		if(ec) {
			if(!is_not_found(ec)) {
				throw fs::filesystem_error("cannot open a prefix on the primary source", path, prefix, ec);
			}

			// Nothing below an absent prefix exists in `source` either.
			this->mark_ok_(prefix);
			this->mark_ok_(path);
			return;
		}

		directory_entry info;
		try {
			info = f->stat();
			f->close();
		} catch(fs::filesystem_error const& err) {
			auto const code = is_not_found(err.code()) ? std::make_error_code(std::errc::state_not_recoverable) : err.code();
			throw fs::filesystem_error("cannot stat a prefix on the primary source", path, prefix, code);
		}

		if(!info.is_directory()) {
			throw fs::filesystem_error("shadowed by a file on the primary source", path, prefix, std::make_error_code(std::errc::no_such_file_or_directory));
		}

		this->mark_ok_(prefix);
	}
}

void PrefixCache::enable(bool enabled) {
	std::unique_lock lock(this->mutex_);

	this->enabled_ = enabled;
	if(!enabled) {
		this->known_ok_prefixes_.clear();
	}
}

bool PrefixCache::enabled() const {
	std::shared_lock lock(this->mutex_);
	return this->enabled_;
}

bool PrefixCache::contains(std::string const& p) const {
	std::shared_lock lock(this->mutex_);
	return this->known_ok_prefixes_.contains(p);
}

std::size_t PrefixCache::size() const {
	std::shared_lock lock(this->mutex_);
	return this->known_ok_prefixes_.size();
}

bool PrefixCache::known_ok_(std::string const& p) const {
	std::shared_lock lock(this->mutex_);
	return this->enabled_ && this->known_ok_prefixes_.contains(p);
}

void PrefixCache::mark_ok_(std::string const& p) {
	std::unique_lock lock(this->mutex_);
	if(!this->enabled_) {
		return;
	}

	this->known_ok_prefixes_.insert(p);
}

}  // namespace impl
}  // namespace ufs
