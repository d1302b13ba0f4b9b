#pragma once

#include <concepts>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace ufs {
namespace impl {

constexpr std::string_view Alphanumeric = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

constexpr std::string_view RootPath = ".";

std::string random_string(std::size_t len, std::string_view char_set);

// `"."`, or components separated by a single `/` where no component is empty, `.`, or `..`.
bool is_valid_path(std::string_view p) noexcept;

// Throws `invalid_argument` if `p` is not a valid path; returns it as a string otherwise.
std::string must_be_valid_path(std::filesystem::path const& p);

std::string_view base_name(std::string_view p) noexcept;

// Every prefix of `p` that ends at a component boundary, shortest first; the last one is `p` itself.
std::vector<std::string_view> path_prefixes(std::string_view p);

std::string join_path(std::string_view dir, std::string_view name);

template<std::invocable<> F, typename R = std::invoke_result_t<F>>
auto handle_error(F const& f, std::error_code& ec, R v = R{}) -> R {
	try {
		auto rst = f();
		ec.clear();
		return rst;
	} catch(std::filesystem::filesystem_error const& err) {
		ec = err.code();
		return v;
	}
}

}  // namespace impl
}  // namespace ufs
