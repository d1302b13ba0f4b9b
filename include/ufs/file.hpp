#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ufs/directory_entry.hpp"

namespace ufs {

/**
 * @brief Handle to a file or a directory opened from an `Fs`.
 *
 * A handle is owned by the caller that opened it and is not safe for concurrent use.
 * Closing it releases the underlying resource but keeps the metadata returned by `stat`,
 * so a closed handle still serves as a record of the file it was opened for.
 */
class File {
   public:
	virtual ~File() = default;

	/**
	 * @brief Retrieves the metadata of the opened file.
	 *
	 * @return Metadata of the file.
	 */
	[[nodiscard]] virtual directory_entry stat() const = 0;

	/**
	 * @brief Releases the resources held by the handle.
	 *
	 */
	virtual void close() = 0;

	/**
	 * @brief Reads bytes of a regular file from the current position.
	 *
	 * @param[out] buffer Buffer to store the bytes to.
	 * @param[in]  count  Maximum number of bytes to read.
	 * @return Number of bytes read; `0` at the end of the file.
	 */
	virtual std::size_t read(char* buffer, std::size_t count) = 0;

	/**
	 * @brief Reads the next entries of a directory.
	 *
	 * @param[in] n Maximum number of entries to return. If `n <= 0`, all the remaining entries are returned.
	 * @return Entries sorted by name. `std::nullopt` if `n > 0` and no entry remains.
	 */
	virtual std::optional<std::vector<directory_entry>> read_dir(std::intmax_t n) = 0;

	/**
	 * @brief Reads the rest of a regular file.
	 *
	 * @return Bytes from the current position to the end of the file.
	 */
	std::string read_all();
};

}  // namespace ufs
