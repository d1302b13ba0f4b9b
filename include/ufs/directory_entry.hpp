#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>

namespace ufs {

class directory_entry {
   public:
	directory_entry() noexcept                  = default;
	directory_entry(directory_entry const&)     = default;
	directory_entry(directory_entry&&) noexcept = default;

	directory_entry(
	    std::string                     name,
	    std::filesystem::file_type      type,
	    std::filesystem::perms          perms,
	    std::filesystem::file_time_type last_write_time,
	    std::uintmax_t                  size = 0)
	    : name_(std::move(name))
	    , type_(type)
	    , perms_(perms)
	    , last_write_time_(last_write_time)
	    , size_(size) { }

	directory_entry& operator=(directory_entry const& other)     = default;
	directory_entry& operator=(directory_entry&& other) noexcept = default;

	/**
	 * @brief Returns the final component of the path this entry was read from.
	 *
	 * @return Name of the entry.
	 */
	[[nodiscard]] std::string const& name() const noexcept {
		return this->name_;
	}

	/**
	 * @brief Returns the name of the entry as a path.
	 *
	 * @return Name of the entry.
	 */
	[[nodiscard]] std::filesystem::path path() const {
		return this->name_;
	}

	/**
	 * @brief Retrieves the type of the file.
	 *
	 * @return Type of the file.
	 */
	[[nodiscard]] std::filesystem::file_type type() const noexcept {
		return this->type_;
	}

	/**
	 * @brief Retrieves the permission bits of the file.
	 *
	 * @return Permission bits of the file.
	 */
	[[nodiscard]] std::filesystem::perms perms() const noexcept {
		return this->perms_;
	}

	/**
	 * @brief Retrieves the status of the file, which is its type and permission bits.
	 *
	 * @return Status of the file.
	 */
	[[nodiscard]] std::filesystem::file_status status() const noexcept {
		return std::filesystem::file_status(this->type_, this->perms_);
	}

	/**
	 * @brief Checks whether the entry refers to a directory.
	 *
	 * @return `true` if the entry is a directory, `false` otherwise.
	 */
	[[nodiscard]] bool is_directory() const noexcept {
		return this->type_ == std::filesystem::file_type::directory;
	}

	/**
	 * @brief Checks whether the entry refers to a regular file.
	 *
	 * @return `true` if the entry is a regular file, `false` otherwise.
	 */
	[[nodiscard]] bool is_regular_file() const noexcept {
		return this->type_ == std::filesystem::file_type::regular;
	}

	/**
	 * @brief Checks whether the entry refers to a symbolic link.
	 *   Sources resolve links themselves, so this is `true` only for a link the source could not resolve.
	 *
	 * @return `true` if the entry is a symbolic link, `false` otherwise.
	 */
	[[nodiscard]] bool is_symlink() const noexcept {
		return this->type_ == std::filesystem::file_type::symlink;
	}

	/**
	 * @brief Checks whether the entry refers to an other file.
	 *
	 * @return `true` if the entry is neither a regular file, a directory, nor a symbolic link, `false` otherwise.
	 */
	[[nodiscard]] bool is_other() const noexcept {
		return !this->is_regular_file() && !this->is_directory() && !this->is_symlink();
	}

	/**
	 * @brief Retrieves the last write time of the file.
	 *
	 * @return Last write time of the file.
	 */
	[[nodiscard]] std::filesystem::file_time_type last_write_time() const noexcept {
		return this->last_write_time_;
	}

	/**
	 * @brief Retrieves the size of the file.
	 *
	 * @return Size of the file in bytes. Directories report `0`.
	 */
	[[nodiscard]] std::uintmax_t file_size() const noexcept {
		return this->size_;
	}

	bool operator==(directory_entry const& rhs) const noexcept = default;

   private:
	std::string                     name_;
	std::filesystem::file_type      type_            = std::filesystem::file_type::none;
	std::filesystem::perms          perms_           = std::filesystem::perms::unknown;
	std::filesystem::file_time_type last_write_time_ = std::filesystem::file_time_type::min();
	std::uintmax_t                  size_            = 0;
};

}  // namespace ufs
