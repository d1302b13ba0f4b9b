#include "ufs/impl/os_fs.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <utility>

#include "ufs/fs.hpp"

#include "ufs/impl/os_file.hpp"
#include "ufs/impl/utils.hpp"

namespace fs = std::filesystem;

namespace ufs {
namespace impl {

OsFs::OsFs(fs::path root)
    : root_(std::move(root)) { }

std::shared_ptr<File> OsFs::open(fs::path const& p) const {
	auto const s = must_be_valid_path(p);

	auto const target = s == RootPath ? this->root_ : this->root_ / s;

	auto info = os_entry(target, std::string(base_name(s)));
	if(!info) {
		throw fs::filesystem_error("", p, std::make_error_code(std::errc::no_such_file_or_directory));
	}
	if(info->is_directory()) {
		return std::make_shared<OsDirectory>(std::move(*info), target);
	}

	return std::make_shared<OsRegularFile>(std::move(*info), target);
}

}  // namespace impl

std::shared_ptr<Fs> make_os_fs(fs::path root) {
	return std::make_shared<impl::OsFs>(std::move(root));
}

}  // namespace ufs
