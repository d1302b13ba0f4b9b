#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <vector>

#include "ufs/fs.hpp"

namespace ufs {

namespace impl {
class PrefixCache;
}  // namespace impl

/**
 * @brief `Fs` that presents two sources as one.
 *
 * A path is answered by the primary source first. Directories present in both sources are merged;
 * any other file in the primary hides whatever the secondary has at the same path, including
 * the whole subtree below it. `MergedFs` is itself an `Fs`, so merges nest.
 *
 * `open` may be called concurrently from multiple threads.
 */
class MergedFs: public Fs {
   public:
	MergedFs(std::shared_ptr<Fs const> primary, std::shared_ptr<Fs const> secondary);

	MergedFs(MergedFs const& other) = delete;
	MergedFs(MergedFs&& other)      = delete;

	~MergedFs() override;

	using Fs::open;

	[[nodiscard]] std::shared_ptr<File> open(std::filesystem::path const& p) const override;

	/**
	 * @brief Enables or disables memoization of path prefixes known not to be shadowed by the primary source.
	 *   Disabling clears the memoized prefixes, so changes made to the primary source become visible.
	 *   Only this node is affected; nested merges keep their own setting.
	 *
	 * @param[in] enabled `true` to memoize prefixes, `false` otherwise.
	 */
	void set_path_caching(bool enabled);

	[[nodiscard]] bool path_caching() const;

	/**
	 * @brief Returns the number of memoized prefixes.
	 *
	 * @return Number of memoized prefixes.
	 */
	[[nodiscard]] std::size_t cached_prefix_count() const;

	[[nodiscard]] std::shared_ptr<Fs const> const& primary() const noexcept {
		return this->primary_;
	}

	[[nodiscard]] std::shared_ptr<Fs const> const& secondary() const noexcept {
		return this->secondary_;
	}

   private:
	std::shared_ptr<Fs const> primary_;
	std::shared_ptr<Fs const> secondary_;

	std::unique_ptr<impl::PrefixCache> cache_;
};

/**
 * @brief Makes `Fs` that merges two sources, resolving conflicts in favor of \p primary.
 *
 * @param primary   Source with higher priority.
 * @param secondary Source with lower priority.
 * @return New merged `Fs`.
 */
std::shared_ptr<MergedFs> make_merged_fs(std::shared_ptr<Fs const> primary, std::shared_ptr<Fs const> secondary);

/**
 * @brief Makes `Fs` that merges any number of sources, highest priority first.
 *   The result behaves as `sources[0]` merged over the merge of the rest.
 *   No source yields an empty `Fs`, and a single source is returned as is.
 *
 * @param sources Sources ordered by priority.
 * @return New merged `Fs`.
 */
std::shared_ptr<Fs const> make_merged_fs(std::vector<std::shared_ptr<Fs const>> sources);

}  // namespace ufs
