#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "ufs/directory_entry.hpp"
#include "ufs/file.hpp"

namespace ufs {

/**
 * @brief Read-only hierarchy of files.
 *
 * Paths are relative and `/`-separated; `"."` names the root.
 * A path that is malformed or absent fails with a NotFound-class error (see `is_not_found`),
 * any other failure is an I/O error of the source.
 */
class Fs {
   public:
	virtual ~Fs() = default;

	/**
	 * @brief Opens a file or a directory.
	 *
	 * @param[in] p Path to the file to open.
	 * @return Handle to the opened file.
	 */
	[[nodiscard]] virtual std::shared_ptr<File> open(std::filesystem::path const& p) const = 0;

	/**
	 * @brief Opens a file or a directory.
	 *
	 * @param[in]  p  Path to the file to open.
	 * @param[out] ec Error code to store error status to.
	 * @return Handle to the opened file, or `nullptr` on error.
	 */
	[[nodiscard]] std::shared_ptr<File> open(std::filesystem::path const& p, std::error_code& ec) const;

	/**
	 * @brief Retrieves the metadata of a file.
	 *
	 * @param[in] p Path to the file.
	 * @return Metadata of the file.
	 */
	[[nodiscard]] directory_entry stat(std::filesystem::path const& p) const;

	/**
	 * @brief Retrieves the metadata of a file.
	 *
	 * @param[in]  p  Path to the file.
	 * @param[out] ec Error code to store error status to.
	 * @return Metadata of the file.
	 */
	[[nodiscard]] directory_entry stat(std::filesystem::path const& p, std::error_code& ec) const;

	/**
	 * @brief Checks whether the path refers to an existing file.
	 *
	 * @param[in] p Path to check.
	 * @return `true` if the file exists, `false` if the path is absent or malformed.
	 */
	[[nodiscard]] bool exists(std::filesystem::path const& p) const;

	[[nodiscard]] bool is_directory(std::filesystem::path const& p) const;

	[[nodiscard]] bool is_regular_file(std::filesystem::path const& p) const;

	/**
	 * @brief Reads the whole content of a regular file.
	 *
	 * @param[in] p Path to the file.
	 * @return Content of the file.
	 */
	[[nodiscard]] std::string read_file(std::filesystem::path const& p) const;

	/**
	 * @brief Reads the whole content of a regular file.
	 *
	 * @param[in]  p  Path to the file.
	 * @param[out] ec Error code to store error status to.
	 * @return Content of the file.
	 */
	[[nodiscard]] std::string read_file(std::filesystem::path const& p, std::error_code& ec) const;

	/**
	 * @brief Lists a directory.
	 *
	 * @param[in] p Path to the directory.
	 * @return Entries of the directory sorted by name.
	 */
	[[nodiscard]] std::vector<directory_entry> read_directory(std::filesystem::path const& p) const;

	/**
	 * @brief Finds the paths matching a pattern.
	 *   Each `/`-separated component of the pattern is matched against the names in one directory level.
	 *   `*` matches any sequence of characters, `?` matches a single character,
	 *   `[...]` matches a character class, and `\` quotes the next character.
	 *
	 * @param[in] pattern Pattern to match.
	 * @return Matched paths in listing order.
	 */
	[[nodiscard]] std::vector<std::filesystem::path> glob(std::string_view pattern) const;
};

/**
 * @brief Checks whether the error means the path is absent, shadowed, or malformed.
 *
 * @param[in] ec Error code to check.
 * @return `true` if the error is NotFound-class, `false` otherwise.
 */
bool is_not_found(std::error_code const& ec) noexcept;

/**
 * @brief Makes `Fs` that exposes a directory of the OS-provided file system.
 *
 * @param root Directory to expose.
 * @return New read-only `Fs` rooted at \p root.
 */
std::shared_ptr<Fs> make_os_fs(std::filesystem::path root);

/**
 * @brief Makes `Fs` that holds nothing but an empty root directory.
 *
 * @return New empty `Fs`.
 */
std::shared_ptr<Fs> make_empty_fs();

}  // namespace ufs
