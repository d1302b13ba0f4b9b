#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include <catch2/catch_template_test_macros.hpp>

#include <ufs.hpp>

#include "testing.hpp"

namespace fs = std::filesystem;

TEST_CASE("example") {
	// Defaults shipped on the host, overridden by files kept in memory.
	testing::TempDir dir;
	fs::create_directories(dir.path() / "conf");
	testing::write_host_file(dir.path() / "conf/app.toml", "level = \"info\"");
	testing::write_host_file(dir.path() / "conf/db.toml", "host = \"localhost\"");

	auto overrides = ufs::make_mem_fs();
	overrides->write_file("conf/app.toml", "level = \"debug\"");
	overrides->write_file("conf/cache.toml", "size = 64");

	auto const view = ufs::make_merged_fs({overrides, ufs::make_os_fs(dir.path())});

	CHECK("level = \"debug\"" == view->read_file("conf/app.toml"));
	CHECK("host = \"localhost\"" == view->read_file("conf/db.toml"));

	std::vector<std::string> names;
	for(auto const& entry: ufs::directory_iterator(*view, "conf")) {
		names.push_back(entry.name());
	}
	CHECK(std::vector<std::string>{"app.toml", "cache.toml", "db.toml"} == names);

	CHECK(std::vector<fs::path>{"conf/app.toml", "conf/cache.toml", "conf/db.toml"} == view->glob("conf/*.toml"));
}
