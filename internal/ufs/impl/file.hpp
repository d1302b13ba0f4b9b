#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ufs/directory_entry.hpp"
#include "ufs/file.hpp"

namespace ufs {
namespace impl {

std::filesystem::filesystem_error err_is_a_directory(std::string const& name);

std::filesystem::filesystem_error err_not_a_directory(std::string const& name);

std::filesystem::filesystem_error err_closed(std::string const& name);

// Directory whose entries are fixed when it is opened.
class StaticDirectory: public File {
   public:
	static constexpr auto DefaultPerms = std::filesystem::perms::all
	    & ~std::filesystem::perms::group_write
	    & ~std::filesystem::perms::others_write;

	// `entries` must be sorted by name.
	StaticDirectory(directory_entry info, std::vector<directory_entry> entries);

	[[nodiscard]] directory_entry stat() const override {
		return this->info_;
	}

	// Drops the entries; `stat` stays valid.
	void close() override;

	std::size_t read(char* buffer, std::size_t count) override;

	std::optional<std::vector<directory_entry>> read_dir(std::intmax_t n) override;

   protected:
	directory_entry              info_;
	std::vector<directory_entry> entries_;
	std::size_t                  offset_ = 0;
};

// Regular file over an immutable buffer.
class StaticRegularFile: public File {
   public:
	static constexpr auto DefaultPerms = std::filesystem::perms::owner_write
	    | std::filesystem::perms::owner_read
	    | std::filesystem::perms::group_read
	    | std::filesystem::perms::others_read;

	StaticRegularFile(directory_entry info, std::shared_ptr<std::string const> data);

	[[nodiscard]] directory_entry stat() const override {
		return this->info_;
	}

	void close() override {
		this->data_.reset();
	}

	std::size_t read(char* buffer, std::size_t count) override;

	std::optional<std::vector<directory_entry>> read_dir(std::intmax_t n) override;

   private:
	directory_entry                    info_;
	std::shared_ptr<std::string const> data_;
	std::size_t                        offset_ = 0;
};

}  // namespace impl
}  // namespace ufs
