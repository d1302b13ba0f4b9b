#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <catch2/catch_template_test_macros.hpp>

#include <ufs/directory_entry.hpp>
#include <ufs/fs.hpp>
#include <ufs/mem_fs.hpp>
#include <ufs/merged_fs.hpp>

#include "ufs/impl/utils.hpp"

#include "testing.hpp"
#include "testing/suites/fs.hpp"

namespace fs = std::filesystem;

namespace {

// + a        (file)
// + b/
//   + s1
// + c/
//   + d      (file)
std::shared_ptr<ufs::MemFs> make_s1_() {
	auto fs = ufs::make_mem_fs();
	fs->write_file("a", "a of s1");
	fs->write_file("b/s1", "");
	fs->write_file("c/d", "d of s1");
	return fs;
}

// + a/
//   + s2
// + b/
//   + s2
// + c        (file)
std::shared_ptr<ufs::MemFs> make_s2_() {
	auto fs = ufs::make_mem_fs();
	fs->write_file("a/s2", "");
	fs->write_file("b/s2", "");
	fs->write_file("c", "c of s2");
	return fs;
}

// + b/
//   + s3
//   + s2     (file, shadowed by s2)
// + c/
//   + e      (file)
// + f        (file)
std::shared_ptr<ufs::MemFs> make_s3_() {
	auto fs = ufs::make_mem_fs();
	fs->write_file("b/s3", "");
	fs->write_file("b/s2", "s2 of s3");
	fs->write_file("c/e", "");
	fs->write_file("f", "f of s3");
	return fs;
}

void collect_(ufs::Fs const& fs, std::string const& dir, std::vector<std::string>& paths) {
	for(auto const& entry: fs.read_directory(dir)) {
		auto p = ufs::impl::join_path(dir, entry.name());
		paths.push_back(p);
		if(entry.is_directory()) {
			collect_(fs, p, paths);
		}
	}
}

}  // namespace

class TestMultiMerge: public testing::suites::TestFsFixture {
   public:
	std::shared_ptr<ufs::Fs const> make() override {
		return ufs::make_merged_fs({make_s1_(), make_s2_(), make_s3_()});
	}

	std::vector<std::string> expected() override {
		return {"a", "b/s1", "b/s2", "b/s3", "c/d", "c/e", "f"};
	}
};

METHOD_AS_TEST_CASE(testing::suites::TestFsBasic<TestMultiMerge>::test, "MultiMerge conformance");

TEST_CASE("MultiMerge") {
	SECTION("no source is an empty view") {
		auto const empty = ufs::make_merged_fs(std::vector<std::shared_ptr<ufs::Fs const>>{});
		REQUIRE(nullptr != empty);
		CHECK(empty->is_directory("."));
		CHECK(empty->read_directory(".").empty());

		std::error_code ec;
		(void)empty->open("a", ec);
		CHECK(ufs::is_not_found(ec));
	}

	SECTION("single source is returned as is") {
		auto const s1 = make_s1_();
		CHECK(s1 == ufs::make_merged_fs({s1}));
	}

	SECTION("null source") {
		CHECK_THROWS_AS(ufs::make_merged_fs({make_s1_(), nullptr}), std::invalid_argument);
		CHECK_THROWS_AS(ufs::make_merged_fs({nullptr}), std::invalid_argument);
	}

	SECTION("first source has the highest priority") {
		auto const merged = ufs::make_merged_fs({make_s1_(), make_s2_(), make_s3_()});

		CHECK("a of s1" == merged->read_file("a"));
		CHECK(not merged->exists("a/s2"));
		CHECK("d of s1" == merged->read_file("c/d"));
		CHECK(not merged->exists("c/e"));
		CHECK("f of s3" == merged->read_file("f"));
		CHECK(merged->is_regular_file("b/s2"));
		CHECK(merged->read_file("b/s2").empty());
	}

	SECTION("behaves as nested merges") {
		auto const flat   = ufs::make_merged_fs({make_s1_(), make_s2_(), make_s3_()});
		auto const nested = ufs::make_merged_fs(make_s1_(), ufs::make_merged_fs(make_s2_(), make_s3_()));

		std::vector<std::string> flat_paths;
		std::vector<std::string> nested_paths;
		collect_(*flat, ".", flat_paths);
		collect_(*nested, ".", nested_paths);
		REQUIRE(nested_paths == flat_paths);

		// Paths that exist in some source but are masked in the view.
		auto paths = flat_paths;
		paths.insert(paths.end(), {"a/s2", "c/e", "b/missing", "g"});

		for(auto const& p: paths) {
			INFO(p);

			std::error_code flat_ec;
			std::error_code nested_ec;

			auto const flat_info   = flat->stat(p, flat_ec);
			auto const nested_info = nested->stat(p, nested_ec);
			CHECK(nested_ec == flat_ec);
			if(flat_ec) {
				continue;
			}

			CHECK(nested_info.name() == flat_info.name());
			CHECK(nested_info.type() == flat_info.type());
			CHECK(nested_info.perms() == flat_info.perms());
			if(flat_info.is_regular_file()) {
				CHECK(nested->read_file(p) == flat->read_file(p));
			}
		}
	}
}
