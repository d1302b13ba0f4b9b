#pragma once

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string_view>

#include "ufs/fs.hpp"

namespace ufs {

namespace impl {
class MemDirectory;
}  // namespace impl

/**
 * @brief `Fs` whose files live in memory.
 *
 * The tree can be modified while it is being viewed; a handle returned by `open` holds a snapshot
 * and does not observe later modification.
 */
class MemFs: public Fs {
   public:
	MemFs();

	using Fs::open;

	[[nodiscard]] std::shared_ptr<File> open(std::filesystem::path const& p) const override;

	/**
	 * @brief Creates a directory and its missing parents.
	 *
	 * @param[in] p Path to the directory to create.
	 * @return `true` if a directory was created, `false` if it already existed.
	 */
	bool create_directories(std::filesystem::path const& p);

	/**
	 * @brief Creates or replaces a regular file. Missing parents are created.
	 *
	 * @param[in] p       Path to the file to write.
	 * @param[in] content New content of the file.
	 */
	void write_file(std::filesystem::path const& p, std::string_view content);

	/**
	 * @brief Removes a file, or a directory with everything in it.
	 *
	 * @param[in] p Path to the file to remove.
	 * @return `true` if the file was removed, `false` if it did not exist.
	 */
	bool remove(std::filesystem::path const& p);

	void permissions(std::filesystem::path const& p, std::filesystem::perms prms);

	void last_write_time(std::filesystem::path const& p, std::filesystem::file_time_type t);

   private:
	mutable std::shared_mutex           mutex_;
	std::shared_ptr<impl::MemDirectory> root_;
};

/**
 * @brief Makes empty `MemFs`.
 *
 * @return New empty `MemFs`.
 */
std::shared_ptr<MemFs> make_mem_fs();

}  // namespace ufs
