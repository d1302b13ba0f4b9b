#include "ufs/impl/utils.hpp"

#include <cstddef>
#include <filesystem>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace ufs {
namespace impl {

namespace {

std::mt19937& random_engine_() {
	static thread_local std::mt19937 engine(std::random_device{}());
	return engine;
}

}  // namespace

std::string random_string(std::size_t len, std::string_view char_set) {
	std::uniform_int_distribution<std::size_t> distribution{0, char_set.size() - 1};

	std::string rst(len, char_set.at(0));
	for(auto& c: rst) {
		c = char_set[distribution(random_engine_())];
	}

	return rst;
}

bool is_valid_path(std::string_view p) noexcept {
	if(p == RootPath) {
		return true;
	}
	if(p.empty()) {
		return false;
	}

	while(true) {
		auto const i    = p.find('/');
		auto const elem = p.substr(0, i);
		if(elem.empty() || elem == "." || elem == "..") {
			return false;
		}
		if(i == std::string_view::npos) {
			return true;
		}

		p.remove_prefix(i + 1);
	}
}

std::string must_be_valid_path(fs::path const& p) {
	auto s = p.string();
	if(!is_valid_path(s)) {
		throw fs::filesystem_error("invalid path", p, std::make_error_code(std::errc::invalid_argument));
	}

	return s;
}

std::string_view base_name(std::string_view p) noexcept {
	auto const i = p.rfind('/');
	if(i == std::string_view::npos) {
		return p;
	}

	return p.substr(i + 1);
}

std::vector<std::string_view> path_prefixes(std::string_view p) {
	std::vector<std::string_view> rst;
	for(std::size_t i = p.find('/'); i != std::string_view::npos; i = p.find('/', i + 1)) {
		rst.push_back(p.substr(0, i));
	}

	rst.push_back(p);
	return rst;
}

std::string join_path(std::string_view dir, std::string_view name) {
	if(dir.empty() || dir == RootPath) {
		return std::string(name);
	}

	std::string rst;
	rst.reserve(dir.size() + 1 + name.size());
	rst.append(dir);
	rst.push_back('/');
	rst.append(name);
	return rst;
}

}  // namespace impl
}  // namespace ufs
