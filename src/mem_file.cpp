#include "ufs/impl/mem_file.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ufs/impl/file.hpp"

namespace fs = std::filesystem;

namespace ufs {
namespace impl {

void MemRegularFile::write(std::string data) {
	this->data_            = std::make_shared<std::string const>(std::move(data));
	this->last_write_time_ = fs::file_time_type::clock::now();
}

std::shared_ptr<File> MemRegularFile::open(std::string name) const {
	return std::make_shared<StaticRegularFile>(this->entry(std::move(name)), this->data_);
}

std::shared_ptr<MemFile> MemDirectory::next(std::string const& name) const {
	auto const it = this->files_.find(name);
	if(it == this->files_.end()) {
		return nullptr;
	}

	return it->second;
}

std::pair<std::shared_ptr<MemRegularFile>, bool> MemDirectory::emplace_regular_file(std::string const& name) {
	auto [it, ok] = this->files_.emplace(name, nullptr);
	if(ok) {
		it->second             = std::make_shared<MemRegularFile>();
		this->last_write_time_ = fs::file_time_type::clock::now();
	}

	return std::make_pair(std::dynamic_pointer_cast<MemRegularFile>(it->second), ok);
}

std::pair<std::shared_ptr<MemDirectory>, bool> MemDirectory::emplace_directory(std::string const& name) {
	auto [it, ok] = this->files_.emplace(name, nullptr);
	if(ok) {
		it->second             = std::make_shared<MemDirectory>();
		this->last_write_time_ = fs::file_time_type::clock::now();
	}

	return std::make_pair(std::dynamic_pointer_cast<MemDirectory>(it->second), ok);
}

bool MemDirectory::erase(std::string const& name) {
	if(this->files_.erase(name) == 0) {
		return false;
	}

	this->last_write_time_ = fs::file_time_type::clock::now();
	return true;
}

std::vector<directory_entry> MemDirectory::entries() const {
	std::vector<directory_entry> rst;
	rst.reserve(this->files_.size());
	for(auto const& [name, f]: this->files_) {
		rst.push_back(f->entry(name));
	}

	return rst;
}

std::shared_ptr<File> MemDirectory::open(std::string name) const {
	return std::make_shared<StaticDirectory>(this->entry(std::move(name)), this->entries());
}

}  // namespace impl
}  // namespace ufs
