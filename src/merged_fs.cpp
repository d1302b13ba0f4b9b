#include "ufs/merged_fs.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "ufs/directory_entry.hpp"
#include "ufs/file.hpp"
#include "ufs/fs.hpp"

#include "ufs/impl/merged_file.hpp"
#include "ufs/impl/prefix_cache.hpp"
#include "ufs/impl/utils.hpp"

namespace fs = std::filesystem;

namespace ufs {

namespace {

constexpr char const* Primary   = "primary";
constexpr char const* Secondary = "secondary";

// A source that fails with NotFound-class error on a path it has just opened is inconsistent;
// the error must not be mistaken for an absent path.
std::error_code fatal_code_(std::error_code const& ec) {
	return is_not_found(ec) ? std::make_error_code(std::errc::state_not_recoverable) : ec;
}

fs::filesystem_error err_source_(char const* op, char const* source, fs::path const& p, std::error_code const& ec) {
	return fs::filesystem_error(std::string("cannot ") + op + " on the " + source + " source", p, ec);
}

directory_entry stat_(File const& f, char const* source, fs::path const& p) {
	try {
		return f.stat();
	} catch(fs::filesystem_error const& err) {
		throw err_source_("stat", source, p, fatal_code_(err.code()));
	}
}

std::vector<directory_entry> list_(File& f, char const* source, fs::path const& p) {
	try {
		auto entries = f.read_dir(-1);
		f.close();

		if(!entries) {
			return {};
		}
		return std::move(*entries);
	} catch(fs::filesystem_error const& err) {
		throw err_source_("list", source, p, fatal_code_(err.code()));
	}
}

}  // namespace

MergedFs::MergedFs(std::shared_ptr<Fs const> primary, std::shared_ptr<Fs const> secondary)
    : primary_(std::move(primary))
    , secondary_(std::move(secondary))
    , cache_(std::make_unique<impl::PrefixCache>()) {
	if(!this->primary_) {
		throw std::invalid_argument("primary source is null");
	}
	if(!this->secondary_) {
		throw std::invalid_argument("secondary source is null");
	}
}

MergedFs::~MergedFs() = default;

std::shared_ptr<File> MergedFs::open(fs::path const& p) const {
	auto const s = impl::must_be_valid_path(p);

	std::error_code ec;

	auto upper = this->primary_->open(p, ec);
	if(!ec) {
		auto const upper_info = stat_(*upper, Primary, p);
		if(!upper_info.is_directory()) {
			// Hides whatever the secondary has here, a whole directory included.
			return upper;
		}

		auto lower = this->secondary_->open(p, ec);
		if(ec) {
			if(is_not_found(ec)) {
				return upper;
			}
			throw err_source_("open", Secondary, p, ec);
		}

		auto const lower_info = stat_(*lower, Secondary, p);
		if(!lower_info.is_directory()) {
			lower->close();
			return upper;
		}

		auto upper_entries = list_(*upper, Primary, p);
		auto lower_entries = list_(*lower, Secondary, p);
		try {
			return std::make_shared<impl::MergedDirectory>(
			    std::string(impl::base_name(s)),
			    upper_info, std::move(upper_entries),
			    lower_info, lower_entries);
		} catch(fs::filesystem_error const& err) {
			throw fs::filesystem_error("cannot merge directory", p, err.path1(), err.code());
		}
	}
	if(!is_not_found(ec)) {
		throw err_source_("open", Primary, p, ec);
	}

	this->cache_->validate(*this->primary_, s);

	return this->secondary_->open(p);
}

void MergedFs::set_path_caching(bool enabled) {
	this->cache_->enable(enabled);
}

bool MergedFs::path_caching() const {
	return this->cache_->enabled();
}

std::size_t MergedFs::cached_prefix_count() const {
	return this->cache_->size();
}

std::shared_ptr<MergedFs> make_merged_fs(std::shared_ptr<Fs const> primary, std::shared_ptr<Fs const> secondary) {
	return std::make_shared<MergedFs>(std::move(primary), std::move(secondary));
}

std::shared_ptr<Fs const> make_merged_fs(std::vector<std::shared_ptr<Fs const>> sources) {
	if(sources.empty()) {
		return make_empty_fs();
	}

	auto it  = sources.rbegin();
	auto rst = std::move(*it);
	for(++it; it != sources.rend(); ++it) {
		rst = make_merged_fs(std::move(*it), std::move(rst));
	}

	if(!rst) {
		throw std::invalid_argument("source is null");
	}
	return rst;
}

}  // namespace ufs
