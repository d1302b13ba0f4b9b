#include "ufs/impl/glob.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "ufs/fs.hpp"

#include "ufs/impl/utils.hpp"

namespace fs = std::filesystem;

namespace ufs {
namespace impl {

namespace {

fs::filesystem_error err_bad_pattern_(std::string_view pattern) {
	return fs::filesystem_error("bad pattern", std::string(pattern), std::make_error_code(std::errc::invalid_argument));
}

}  // namespace

GlobFilter::GlobFilter(std::string_view pattern) {
	auto const end = pattern.size();

	// Reads a character of a class, unquoting it if escaped.
	auto const read_class_char = [&](std::size_t& i) -> char {
		if(pattern[i] == '\\') {
			++i;
			if(i == end) {
				throw err_bad_pattern_(pattern);
			}
		}
		return pattern[i++];
	};

	for(std::size_t i = 0; i < end; ++i) {
		auto const c = pattern[i];
		switch(c) {
		case '*': {
			// Consecutive stars match the same as one.
			if(!this->tokens_.empty() && this->tokens_.back().kind == Token::Kind::Star) {
				break;
			}
			this->tokens_.push_back(Token{.kind = Token::Kind::Star});
			break;
		}

		case '?': {
			this->tokens_.push_back(Token{.kind = Token::Kind::Any});
			break;
		}

		case '\\': {
			++i;
			if(i == end) {
				throw err_bad_pattern_(pattern);
			}
			this->tokens_.push_back(Token{.kind = Token::Kind::Literal, .c = pattern[i]});
			break;
		}

		case '[': {
			++i;

			Token token{.kind = Token::Kind::Class};
			if(i < end && (pattern[i] == '^' || pattern[i] == '!')) {
				token.negated = true;
				++i;
			}

			while(true) {
				if(i == end) {
					throw err_bad_pattern_(pattern);
				}
				if(pattern[i] == ']') {
					if(token.ranges.empty()) {
						throw err_bad_pattern_(pattern);
					}
					break;
				}

				auto const lo = read_class_char(i);
				auto       hi = lo;
				if(i + 1 < end && pattern[i] == '-' && pattern[i + 1] != ']') {
					++i;
					hi = read_class_char(i);
					if(static_cast<unsigned char>(hi) < static_cast<unsigned char>(lo)) {
						throw err_bad_pattern_(pattern);
					}
				}
				if(i == end) {
					throw err_bad_pattern_(pattern);
				}

				token.ranges.emplace_back(lo, hi);
			}

			this->tokens_.push_back(std::move(token));
			break;
		}

		default: {
			this->tokens_.push_back(Token{.kind = Token::Kind::Literal, .c = c});
			break;
		}
		}
	}
}

bool GlobFilter::matches(std::string_view name) const {
	std::vector<std::size_t> states{0};
	std::vector<std::size_t> next;

	for(auto const c: name) {
		next.clear();
		for(auto const state: states) {
			this->apply_state_(next, c, state);
		}

		std::sort(next.begin(), next.end());
		next.erase(std::unique(next.begin(), next.end()), next.end());
		if(next.empty()) {
			return false;
		}

		std::swap(states, next);
	}

	for(auto state: states) {
		while(state < this->tokens_.size() && this->tokens_[state].kind == Token::Kind::Star) {
			++state;
		}
		if(state == this->tokens_.size()) {
			return true;
		}
	}

	return false;
}

bool GlobFilter::has_meta(std::string_view pattern) noexcept {
	return pattern.find_first_of("*?[\\") != std::string_view::npos;
}

bool GlobFilter::Token::accepts(char ch) const {
	auto const u = static_cast<unsigned char>(ch);

	auto const in_class = std::any_of(this->ranges.begin(), this->ranges.end(), [u](auto const& range) {
		return static_cast<unsigned char>(range.first) <= u && u <= static_cast<unsigned char>(range.second);
	});
	return in_class != this->negated;
}

void GlobFilter::apply_state_(std::vector<std::size_t>& states, char c, std::size_t state) const {
	if(state >= this->tokens_.size()) {
		return;
	}

	auto const& token = this->tokens_[state];
	switch(token.kind) {
	case Token::Kind::Star: {
		// Either the star consumes `c` or it matches nothing.
		if(c != '/') {
			states.push_back(state);
		}
		this->apply_state_(states, c, state + 1);
		break;
	}

	case Token::Kind::Any: {
		if(c != '/') {
			states.push_back(state + 1);
		}
		break;
	}

	case Token::Kind::Class: {
		if(c != '/' && token.accepts(c)) {
			states.push_back(state + 1);
		}
		break;
	}

	case Token::Kind::Literal: {
		if(c == token.c) {
			states.push_back(state + 1);
		}
		break;
	}
	}
}

}  // namespace impl

std::vector<fs::path> Fs::glob(std::string_view pattern) const {
	if(pattern.empty()) {
		return {};
	}

	std::vector<std::string_view> components;
	for(auto rest = pattern;;) {
		auto const i = rest.find('/');
		components.push_back(rest.substr(0, i));
		if(i == std::string_view::npos) {
			break;
		}
		rest.remove_prefix(i + 1);
	}

	// Every component is checked before any lookup so that a malformed pattern is reported even without matches.
	std::vector<impl::GlobFilter> filters;
	filters.reserve(components.size());
	for(auto const component: components) {
		if(component.empty()) {
			throw impl::err_bad_pattern_(pattern);
		}
		filters.emplace_back(component);
	}

	std::vector<std::string> dirs{std::string(impl::RootPath)};
	for(std::size_t i = 0; i < components.size(); ++i) {
		auto const component = components[i];

		std::vector<std::string> next;
		for(auto const& dir: dirs) {
			if(!impl::GlobFilter::has_meta(component)) {
				if(component == "." || component == "..") {
					// Never a name inside a directory; only the whole pattern "." names the root.
					if(components.size() == 1 && component == "." && this->exists(dir)) {
						next.push_back(dir);
					}
					continue;
				}

				auto p = impl::join_path(dir, component);
				if(!impl::is_valid_path(p)) {
					continue;
				}
				if(this->exists(p)) {
					next.push_back(std::move(p));
				}
				continue;
			}

			std::error_code ec;

			auto const f = this->open(dir, ec);
			if(ec) {
				if(is_not_found(ec)) {
					continue;
				}
				throw fs::filesystem_error("cannot open a directory to match", dir, ec);
			}
			if(!f->stat().is_directory()) {
				f->close();
				continue;
			}

			auto const entries = f->read_dir(-1);
			f->close();
			if(!entries) {
				continue;
			}

			for(auto const& entry: *entries) {
				if(filters[i].matches(entry.name())) {
					next.push_back(impl::join_path(dir, entry.name()));
				}
			}
		}

		dirs = std::move(next);
		if(dirs.empty()) {
			break;
		}
	}

	return std::vector<fs::path>(dirs.begin(), dirs.end());
}

}  // namespace ufs
