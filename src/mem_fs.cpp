#include "ufs/mem_fs.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "ufs/fs.hpp"

#include "ufs/impl/mem_file.hpp"
#include "ufs/impl/utils.hpp"

namespace fs = std::filesystem;

namespace ufs {

namespace {

template<typename F>
void for_each_component_(std::string_view p, F const& f) {
	if(p == impl::RootPath) {
		return;
	}

	while(true) {
		auto const i = p.find('/');
		f(std::string(p.substr(0, i)), i == std::string_view::npos);
		if(i == std::string_view::npos) {
			return;
		}

		p.remove_prefix(i + 1);
	}
}

// returns nullptr if not exists.
std::shared_ptr<impl::MemFile> find_(std::shared_ptr<impl::MemDirectory> const& root, std::string_view p) {
	std::shared_ptr<impl::MemFile> f = root;
	for_each_component_(p, [&](std::string const& name, bool /*last*/) {
		auto d = std::dynamic_pointer_cast<impl::MemDirectory>(std::move(f));
		f      = d ? d->next(name) : nullptr;
	});

	return f;
}

// Walks to the parent of `p`, creating missing directories.
std::shared_ptr<impl::MemDirectory> pull_parent_(std::shared_ptr<impl::MemDirectory> d, fs::path const& p, std::string_view s) {
	for_each_component_(s, [&](std::string const& name, bool last) {
		if(last) {
			return;
		}

		auto [next_d, _] = d->emplace_directory(name);
		if(!next_d) {
			throw fs::filesystem_error("", p, std::make_error_code(std::errc::not_a_directory));
		}

		d = std::move(next_d);
	});

	return d;
}

fs::filesystem_error err_no_such_file_(fs::path const& p) {
	return fs::filesystem_error("", p, std::make_error_code(std::errc::no_such_file_or_directory));
}

}  // namespace

MemFs::MemFs()
    : root_(std::make_shared<impl::MemDirectory>()) { }

std::shared_ptr<File> MemFs::open(fs::path const& p) const {
	auto const s = impl::must_be_valid_path(p);

	std::shared_lock lock(this->mutex_);

	auto const f = find_(this->root_, s);
	if(!f) {
		throw err_no_such_file_(p);
	}

	return f->open(std::string(impl::base_name(s)));
}

bool MemFs::create_directories(fs::path const& p) {
	auto const s = impl::must_be_valid_path(p);

	std::unique_lock lock(this->mutex_);

	bool created = false;

	auto d = this->root_;
	for_each_component_(s, [&](std::string const& name, bool last) {
		auto [next_d, ok] = d->emplace_directory(name);
		if(!next_d) {
			auto const ec = last ? std::errc::file_exists : std::errc::not_a_directory;
			throw fs::filesystem_error("", p, std::make_error_code(ec));
		}

		created = ok;
		d       = std::move(next_d);
	});

	return created;
}

void MemFs::write_file(fs::path const& p, std::string_view content) {
	auto const s = impl::must_be_valid_path(p);
	if(s == impl::RootPath) {
		throw fs::filesystem_error("", p, std::make_error_code(std::errc::is_a_directory));
	}

	std::unique_lock lock(this->mutex_);

	auto const d = pull_parent_(this->root_, p, s);

	auto [r, _] = d->emplace_regular_file(std::string(impl::base_name(s)));
	if(!r) {
		throw fs::filesystem_error("", p, std::make_error_code(std::errc::is_a_directory));
	}

	r->write(std::string(content));
}

bool MemFs::remove(fs::path const& p) {
	auto const s = impl::must_be_valid_path(p);
	if(s == impl::RootPath) {
		throw fs::filesystem_error("cannot remove the root", p, std::make_error_code(std::errc::device_or_resource_busy));
	}

	std::unique_lock lock(this->mutex_);

	auto const name   = impl::base_name(s);
	auto const parent = std::string_view(s).substr(0, s.size() - name.size());

	auto const d = std::dynamic_pointer_cast<impl::MemDirectory>(
	    find_(this->root_, parent.empty() ? impl::RootPath : parent.substr(0, parent.size() - 1)));
	if(!d) {
		return false;
	}

	return d->erase(std::string(name));
}

void MemFs::permissions(fs::path const& p, fs::perms prms) {
	auto const s = impl::must_be_valid_path(p);

	std::unique_lock lock(this->mutex_);

	auto const f = find_(this->root_, s);
	if(!f) {
		throw err_no_such_file_(p);
	}

	f->perms(prms & fs::perms::mask);
}

void MemFs::last_write_time(fs::path const& p, fs::file_time_type t) {
	auto const s = impl::must_be_valid_path(p);

	std::unique_lock lock(this->mutex_);

	auto const f = find_(this->root_, s);
	if(!f) {
		throw err_no_such_file_(p);
	}

	f->last_write_time(t);
}

std::shared_ptr<MemFs> make_mem_fs() {
	return std::make_shared<MemFs>();
}

std::shared_ptr<Fs> make_empty_fs() {
	return make_mem_fs();
}

}  // namespace ufs
