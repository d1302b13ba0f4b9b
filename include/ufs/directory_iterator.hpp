#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <memory>
#include <utility>
#include <vector>

#include "ufs/directory_entry.hpp"
#include "ufs/file.hpp"
#include "ufs/fs.hpp"

namespace ufs {

class directory_iterator {
   public:
	using value_type        = ufs::directory_entry;
	using difference_type   = std::ptrdiff_t;
	using pointer           = ufs::directory_entry const*;
	using reference         = ufs::directory_entry const&;
	using iterator_category = std::input_iterator_tag;

	static constexpr std::intmax_t DefaultPageSize = 64;

	directory_iterator() noexcept = default;

	explicit directory_iterator(Fs const& fs, std::filesystem::path const& p)
	    : directory_iterator(fs.open(p)) { }

	/**
	 * @brief Iterates over the remaining entries of an opened directory.
	 *
	 * @param dir       Opened directory.
	 * @param page_size Number of entries fetched from \p dir at once.
	 */
	explicit directory_iterator(std::shared_ptr<File> dir, std::intmax_t page_size = DefaultPageSize)
	    : dir_(std::move(dir))
	    , page_size_(page_size) {
		this->fetch_();
	}

	directory_iterator(directory_iterator const&) = default;
	directory_iterator(directory_iterator&&)      = default;

	directory_iterator& operator=(directory_iterator const&) = default;
	directory_iterator& operator=(directory_iterator&&)      = default;

	directory_entry const& operator*() const {
		return this->page_[this->index_];
	}

	directory_entry const* operator->() const {
		return &this->page_[this->index_];
	}

	directory_iterator& operator++() {
		++this->index_;
		if(this->index_ >= this->page_.size()) {
			this->fetch_();
		}
		return *this;
	}

	bool operator==(directory_iterator const& rhs) const noexcept {
		return this->dir_ == rhs.dir_ && this->index_ == rhs.index_;
	}

   private:
	void fetch_() {
		this->index_ = 0;
		if(!this->dir_) {
			return;
		}

		auto page = this->dir_->read_dir(this->page_size_ > 0 ? this->page_size_ : DefaultPageSize);
		if(!page || page->empty()) {
			this->dir_.reset();
			this->page_.clear();
			return;
		}

		this->page_ = std::move(*page);
	}

	std::shared_ptr<File>        dir_;
	std::intmax_t                page_size_ = DefaultPageSize;
	std::vector<directory_entry> page_;
	std::size_t                  index_ = 0;
};

inline directory_iterator begin(directory_iterator iter) noexcept {
	return iter;
}

inline directory_iterator end(directory_iterator /*unused*/) noexcept {
	return {};
}

}  // namespace ufs
