#pragma once

#include <filesystem>
#include <memory>
#include <string_view>

#include <ufs/fs.hpp>
#include <ufs/mem_fs.hpp>

namespace testing {

constexpr std::string_view QuoteA = "Lorem ipsum dolor sit amet";
constexpr std::string_view QuoteB = "Ut enim ad minim veniam";

// Directory on the host that is removed with its contents when destroyed.
class TempDir {
   public:
	TempDir();
	~TempDir();

	TempDir(TempDir const& other) = delete;
	TempDir(TempDir&& other)      = delete;

	[[nodiscard]] std::filesystem::path const& path() const noexcept {
		return this->path_;
	}

   private:
	std::filesystem::path path_;
};

void write_host_file(std::filesystem::path const& p, std::string_view content);

// Source A of the two-source scenario:
// + a
// + b/
//   + x
std::shared_ptr<ufs::MemFs> make_source_a();

// Source B of the two-source scenario:
// + a/
//   + y
// + b/
//   + z
std::shared_ptr<ufs::MemFs> make_source_b();

}  // namespace testing
