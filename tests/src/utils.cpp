#include <filesystem>
#include <string_view>
#include <system_error>
#include <vector>

#include <catch2/catch_template_test_macros.hpp>

#include "ufs/impl/utils.hpp"

TEST_CASE("is_valid_path") {
	SECTION("valid") {
		for(auto const* p: {".", "a", "a/b", "a/b/c", "a.b", "..a", "a..", ".a/b."}) {
			INFO(p);
			CHECK(ufs::impl::is_valid_path(p));
		}
	}

	SECTION("invalid") {
		for(auto const* p: {"", "/", "/a", "a/", "a//b", "./a", "a/.", "a/./b", "..", "a/..", "../a"}) {
			INFO(p);
			CHECK(not ufs::impl::is_valid_path(p));
		}
	}
}

TEST_CASE("must_be_valid_path") {
	CHECK("a/b" == ufs::impl::must_be_valid_path("a/b"));

	try {
		(void)ufs::impl::must_be_valid_path("a/../b");
		FAIL("must throw");
	} catch(std::filesystem::filesystem_error const& err) {
		CHECK(std::errc::invalid_argument == err.code());
		CHECK("a/../b" == err.path1());
	}
}

TEST_CASE("base_name") {
	CHECK("." == ufs::impl::base_name("."));
	CHECK("a" == ufs::impl::base_name("a"));
	CHECK("c" == ufs::impl::base_name("a/b/c"));
}

TEST_CASE("path_prefixes") {
	using V = std::vector<std::string_view>;

	CHECK(V{"."} == ufs::impl::path_prefixes("."));
	CHECK(V{"a"} == ufs::impl::path_prefixes("a"));
	CHECK(V{"a", "a/b", "a/b/c"} == ufs::impl::path_prefixes("a/b/c"));
}

TEST_CASE("join_path") {
	CHECK("a" == ufs::impl::join_path(".", "a"));
	CHECK("a" == ufs::impl::join_path("", "a"));
	CHECK("a/b" == ufs::impl::join_path("a", "b"));
}

TEST_CASE("random_string") {
	auto const s = ufs::impl::random_string(32, ufs::impl::Alphanumeric);
	CHECK(32 == s.size());
	CHECK(s.find_first_not_of(ufs::impl::Alphanumeric) == std::string_view::npos);
}
