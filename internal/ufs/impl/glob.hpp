#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ufs {
namespace impl {

// Matches a single path component against a pattern.
// `*` matches any sequence of characters, `?` matches one character, `[...]` matches one character of
// a class (`a-z` ranges, `^` or `!` negates), and `\` quotes the next character.
class GlobFilter {
   public:
	// Throws `filesystem_error` with `invalid_argument` if `pattern` is malformed.
	explicit GlobFilter(std::string_view pattern);

	[[nodiscard]] bool matches(std::string_view name) const;

	[[nodiscard]] static bool has_meta(std::string_view pattern) noexcept;

   private:
	struct Token {
		enum class Kind {
			Literal,
			Any,
			Star,
			Class,
		};

		Kind kind = Kind::Literal;
		char c    = 0;

		std::vector<std::pair<char, char>> ranges;
		bool                               negated = false;

		[[nodiscard]] bool accepts(char ch) const;
	};

	void apply_state_(std::vector<std::size_t>& states, char c, std::size_t state) const;

	std::vector<Token> tokens_;
};

}  // namespace impl
}  // namespace ufs
