#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "ufs/directory_entry.hpp"
#include "ufs/file.hpp"

#include "ufs/impl/file.hpp"

namespace ufs {
namespace impl {

class MemFile {
   public:
	MemFile(std::filesystem::perms perms)
	    : perms_(perms) { }

	virtual ~MemFile() = default;

	[[nodiscard]] virtual std::filesystem::file_type type() const = 0;

	[[nodiscard]] virtual std::uintmax_t size() const {
		return 0;
	}

	[[nodiscard]] std::filesystem::perms perms() const {
		return this->perms_;
	}

	void perms(std::filesystem::perms prms) {
		this->perms_ = prms;
	}

	[[nodiscard]] std::filesystem::file_time_type last_write_time() const {
		return this->last_write_time_;
	}

	void last_write_time(std::filesystem::file_time_type new_time) {
		this->last_write_time_ = new_time;
	}

	[[nodiscard]] directory_entry entry(std::string name) const {
		return {std::move(name), this->type(), this->perms_, this->last_write_time_, this->size()};
	}

	// Copies the current state into a handle.
	[[nodiscard]] virtual std::shared_ptr<File> open(std::string name) const = 0;

   protected:
	std::filesystem::perms          perms_;
	std::filesystem::file_time_type last_write_time_ = std::filesystem::file_time_type::clock::now();
};

class MemRegularFile: public MemFile {
   public:
	MemRegularFile(std::filesystem::perms perms)
	    : MemFile(perms)
	    , data_(std::make_shared<std::string const>()) { }

	MemRegularFile()
	    : MemRegularFile(StaticRegularFile::DefaultPerms) { }

	[[nodiscard]] std::filesystem::file_type type() const override {
		return std::filesystem::file_type::regular;
	}

	[[nodiscard]] std::uintmax_t size() const override {
		return this->data_->size();
	}

	void write(std::string data);

	[[nodiscard]] std::shared_ptr<File> open(std::string name) const override;

   private:
	// Replaced on every write so that opened handles keep their snapshot.
	std::shared_ptr<std::string const> data_;
};

class MemDirectory: public MemFile {
   public:
	MemDirectory(std::filesystem::perms perms)
	    : MemFile(perms) { }

	MemDirectory()
	    : MemDirectory(StaticDirectory::DefaultPerms) { }

	[[nodiscard]] std::filesystem::file_type type() const override {
		return std::filesystem::file_type::directory;
	}

	// returns nullptr if not exists.
	[[nodiscard]] std::shared_ptr<MemFile> next(std::string const& name) const;

	std::pair<std::shared_ptr<MemRegularFile>, bool> emplace_regular_file(std::string const& name);

	std::pair<std::shared_ptr<MemDirectory>, bool> emplace_directory(std::string const& name);

	bool erase(std::string const& name);

	[[nodiscard]] std::vector<directory_entry> entries() const;

	[[nodiscard]] std::shared_ptr<File> open(std::string name) const override;

   private:
	std::map<std::string, std::shared_ptr<MemFile>> files_;
};

}  // namespace impl
}  // namespace ufs
