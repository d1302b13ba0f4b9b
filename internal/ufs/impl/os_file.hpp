#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "ufs/directory_entry.hpp"
#include "ufs/file.hpp"

#include "ufs/impl/file.hpp"

namespace ufs {
namespace impl {

// Reads the metadata of `p`, following symbolic links; a dangling or looping link is described as the link itself.
// Returns `std::nullopt` if nothing exists at `p`.
std::optional<directory_entry> os_entry(std::filesystem::path const& p, std::string name);

// Entries of the directory at `p`, sorted by name.
std::vector<directory_entry> os_entries(std::filesystem::path const& p);

// Host directory listed on the first `read_dir`; later reads page through that listing.
class OsDirectory: public StaticDirectory {
   public:
	OsDirectory(directory_entry info, std::filesystem::path p);

	void close() override;

	std::optional<std::vector<directory_entry>> read_dir(std::intmax_t n) override;

   private:
	std::filesystem::path path_;
	bool                  listed_ = false;
};

class OsRegularFile: public File {
   public:
	OsRegularFile(directory_entry info, std::filesystem::path p);

	[[nodiscard]] directory_entry stat() const override {
		return this->info_;
	}

	void close() override;

	std::size_t read(char* buffer, std::size_t count) override;

	std::optional<std::vector<directory_entry>> read_dir(std::intmax_t n) override;

   private:
	directory_entry       info_;
	std::filesystem::path path_;
	std::ifstream         in_;
	bool                  closed_ = false;
};

}  // namespace impl
}  // namespace ufs
