#include "ufs/fs.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "ufs/directory_entry.hpp"
#include "ufs/file.hpp"

#include "ufs/impl/file.hpp"
#include "ufs/impl/utils.hpp"

namespace fs = std::filesystem;

namespace ufs {

bool is_not_found(std::error_code const& ec) noexcept {
	return ec == std::errc::no_such_file_or_directory
	    || ec == std::errc::invalid_argument;
}

std::shared_ptr<File> Fs::open(fs::path const& p, std::error_code& ec) const {
	return impl::handle_error([&] { return this->open(p); }, ec);
}

directory_entry Fs::stat(fs::path const& p) const {
	auto const f   = this->open(p);
	auto       rst = f->stat();
	f->close();
	return rst;
}

directory_entry Fs::stat(fs::path const& p, std::error_code& ec) const {
	return impl::handle_error([&] { return this->stat(p); }, ec);
}

bool Fs::exists(fs::path const& p) const {
	std::error_code ec;

	auto const f = this->open(p, ec);
	if(ec) {
		if(is_not_found(ec)) {
			return false;
		}
		throw fs::filesystem_error("", p, ec);
	}

	f->close();
	return true;
}

bool Fs::is_directory(fs::path const& p) const {
	std::error_code ec;

	auto const info = this->stat(p, ec);
	if(ec && !is_not_found(ec)) {
		throw fs::filesystem_error("", p, ec);
	}

	return !ec && info.is_directory();
}

bool Fs::is_regular_file(fs::path const& p) const {
	std::error_code ec;

	auto const info = this->stat(p, ec);
	if(ec && !is_not_found(ec)) {
		throw fs::filesystem_error("", p, ec);
	}

	return !ec && info.is_regular_file();
}

std::string Fs::read_file(fs::path const& p) const {
	auto const f = this->open(p);
	if(f->stat().is_directory()) {
		throw impl::err_is_a_directory(p.string());
	}

	auto rst = f->read_all();
	f->close();
	return rst;
}

std::string Fs::read_file(fs::path const& p, std::error_code& ec) const {
	return impl::handle_error([&] { return this->read_file(p); }, ec);
}

std::vector<directory_entry> Fs::read_directory(fs::path const& p) const {
	auto const f = this->open(p);

	auto entries = f->read_dir(-1);
	f->close();

	if(!entries) {
		return {};
	}
	return std::move(*entries);
}

}  // namespace ufs
