#pragma once

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_set>

#include "ufs/fs.hpp"

namespace ufs {
namespace impl {

// Remembers paths that are known not to be shadowed by a non-directory of a source,
// that is, every prefix of such a path is either a directory or absent in that source.
// Safe for concurrent use; the same prefix may be checked twice by racing callers.
class PrefixCache {
   public:
	PrefixCache() = default;

	PrefixCache(PrefixCache const& other) = delete;
	PrefixCache(PrefixCache&& other)      = delete;

	// Throws `filesystem_error` with `no_such_file_or_directory` if `p` or one of its ancestors is
	// a non-directory in `source`; the error carries `p` and the shadowing prefix.
	// Any failure of `source` other than NotFound-class is propagated.
	void validate(Fs const& source, std::string_view p);

	void enable(bool enabled);

	[[nodiscard]] bool enabled() const;

	[[nodiscard]] bool contains(std::string const& p) const;

	[[nodiscard]] std::size_t size() const;

   private:
	[[nodiscard]] bool known_ok_(std::string const& p) const;

	void mark_ok_(std::string const& p);

	mutable std::shared_mutex       mutex_;
	std::unordered_set<std::string> known_ok_prefixes_;
	bool                            enabled_ = true;
};

}  // namespace impl
}  // namespace ufs
