#include "ufs/impl/os_file.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "ufs/impl/file.hpp"

namespace fs = std::filesystem;

namespace ufs {
namespace impl {

std::optional<directory_entry> os_entry(fs::path const& p, std::string name) {
	std::error_code ec;

	auto st = fs::status(p, ec);
	if(st.type() == fs::file_type::not_found || ec == std::errc::too_many_symbolic_link_levels) {
		// Dangling or looping link; describe the link itself.
		st = fs::symlink_status(p, ec);
		if(st.type() == fs::file_type::not_found) {
			return std::nullopt;
		}
	}
	if(ec) {
		throw fs::filesystem_error("cannot stat", p, ec);
	}

	auto const follow = st.type() != fs::file_type::symlink;

	auto const t = follow ? fs::last_write_time(p, ec) : fs::file_time_type::min();
	if(ec) {
		if(ec == std::errc::no_such_file_or_directory) {
			return std::nullopt;
		}
		throw fs::filesystem_error("cannot read last write time", p, ec);
	}

	std::uintmax_t size = 0;
	if(st.type() == fs::file_type::regular) {
		size = fs::file_size(p, ec);
		if(ec) {
			if(ec == std::errc::no_such_file_or_directory) {
				return std::nullopt;
			}
			throw fs::filesystem_error("cannot read file size", p, ec);
		}
	}

	return directory_entry(std::move(name), st.type(), st.permissions(), t, size);
}

std::vector<directory_entry> os_entries(fs::path const& p) {
	std::vector<directory_entry> rst;
	for(auto const& entry: fs::directory_iterator(p)) {
		// Files removed while listing are skipped.
		auto e = os_entry(entry.path(), entry.path().filename().string());
		if(!e) {
			continue;
		}

		rst.push_back(std::move(*e));
	}

	std::sort(rst.begin(), rst.end(), [](auto const& lhs, auto const& rhs) { return lhs.name() < rhs.name(); });
	return rst;
}

OsDirectory::OsDirectory(directory_entry info, fs::path p)
    : StaticDirectory(std::move(info), {})
    , path_(std::move(p)) { }

void OsDirectory::close() {
	StaticDirectory::close();
	this->listed_ = true;
}

std::optional<std::vector<directory_entry>> OsDirectory::read_dir(std::intmax_t n) {
	if(!this->listed_) {
		this->entries_ = os_entries(this->path_);
		this->listed_  = true;
	}

	return StaticDirectory::read_dir(n);
}

OsRegularFile::OsRegularFile(directory_entry info, fs::path p)
    : info_(std::move(info))
    , path_(std::move(p)) {
	if(!this->info_.is_regular_file()) {
		// Opened on the first read so that special files do not block.
		return;
	}

	this->in_.open(this->path_, std::ios_base::in | std::ios_base::binary);
	if(!this->in_.is_open()) {
		throw fs::filesystem_error("cannot open", this->path_, std::make_error_code(std::errc::io_error));
	}
}

void OsRegularFile::close() {
	if(this->in_.is_open()) {
		this->in_.close();
	}

	this->closed_ = true;
}

std::size_t OsRegularFile::read(char* buffer, std::size_t count) {
	if(this->closed_) {
		throw err_closed(this->info_.name());
	}
	if(!this->in_.is_open()) {
		this->in_.open(this->path_, std::ios_base::in | std::ios_base::binary);
		if(!this->in_.is_open()) {
			throw fs::filesystem_error("cannot open", this->path_, std::make_error_code(std::errc::io_error));
		}
	}
	if(this->in_.eof()) {
		return 0;
	}

	this->in_.read(buffer, static_cast<std::streamsize>(count));
	if(this->in_.bad()) {
		throw fs::filesystem_error("cannot read", this->path_, std::make_error_code(std::errc::io_error));
	}

	return static_cast<std::size_t>(this->in_.gcount());
}

std::optional<std::vector<directory_entry>> OsRegularFile::read_dir(std::intmax_t /*n*/) {
	throw err_not_a_directory(this->info_.name());
}

}  // namespace impl
}  // namespace ufs
