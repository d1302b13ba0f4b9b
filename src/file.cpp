#include "ufs/impl/file.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "ufs/file.hpp"

namespace fs = std::filesystem;

namespace ufs {

std::string File::read_all() {
	constexpr std::size_t ChunkSize = 4096;

	std::string rst;
	while(true) {
		auto const offset = rst.size();
		rst.resize(offset + ChunkSize);

		auto const n = this->read(rst.data() + offset, ChunkSize);
		rst.resize(offset + n);
		if(n == 0) {
			break;
		}
	}

	return rst;
}

namespace impl {

fs::filesystem_error err_is_a_directory(std::string const& name) {
	return fs::filesystem_error("cannot read a directory", name, std::make_error_code(std::errc::is_a_directory));
}

fs::filesystem_error err_not_a_directory(std::string const& name) {
	return fs::filesystem_error("cannot list a file that is not a directory", name, std::make_error_code(std::errc::not_a_directory));
}

fs::filesystem_error err_closed(std::string const& name) {
	return fs::filesystem_error("file is closed", name, std::make_error_code(std::errc::bad_file_descriptor));
}

StaticDirectory::StaticDirectory(directory_entry info, std::vector<directory_entry> entries)
    : info_(std::move(info))
    , entries_(std::move(entries)) { }

void StaticDirectory::close() {
	this->entries_.clear();
	this->entries_.shrink_to_fit();
	this->offset_ = 0;
}

std::size_t StaticDirectory::read(char* /*buffer*/, std::size_t /*count*/) {
	throw err_is_a_directory(this->info_.name());
}

std::optional<std::vector<directory_entry>> StaticDirectory::read_dir(std::intmax_t n) {
	auto const remaining = this->entries_.size() - this->offset_;
	if(remaining == 0) {
		if(n <= 0) {
			return std::vector<directory_entry>{};
		}
		return std::nullopt;
	}

	auto const cnt = n <= 0
	    ? remaining
	    : std::min(remaining, static_cast<std::size_t>(n));

	auto const first = this->entries_.cbegin() + static_cast<std::ptrdiff_t>(this->offset_);
	auto       rst   = std::vector<directory_entry>(first, first + static_cast<std::ptrdiff_t>(cnt));

	this->offset_ += cnt;
	return rst;
}

StaticRegularFile::StaticRegularFile(directory_entry info, std::shared_ptr<std::string const> data)
    : info_(std::move(info))
    , data_(std::move(data)) { }

std::size_t StaticRegularFile::read(char* buffer, std::size_t count) {
	if(!this->data_) {
		throw err_closed(this->info_.name());
	}

	auto const n = std::min(count, this->data_->size() - std::min(this->offset_, this->data_->size()));
	std::memcpy(buffer, this->data_->data() + this->offset_, n);

	this->offset_ += n;
	return n;
}

std::optional<std::vector<directory_entry>> StaticRegularFile::read_dir(std::intmax_t /*n*/) {
	throw err_not_a_directory(this->info_.name());
}

}  // namespace impl
}  // namespace ufs
