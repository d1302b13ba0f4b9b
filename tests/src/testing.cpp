#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <ufs/directory_entry.hpp>
#include <ufs/file.hpp>
#include <ufs/mem_fs.hpp>

#include "ufs/impl/utils.hpp"

#include "testing.hpp"
#include "testing/utils.hpp"

namespace fs = std::filesystem;

namespace testing {

TempDir::TempDir()
    : path_(fs::temp_directory_path() / "ufs-test" / ufs::impl::random_string(16, ufs::impl::Alphanumeric)) {
	fs::create_directories(this->path_);
}

TempDir::~TempDir() {
	std::error_code ec;
	fs::remove_all(this->path_, ec);
}

void write_host_file(fs::path const& p, std::string_view content) {
	std::ofstream out(p, std::ios::binary | std::ios::trunc);
	out << content;
	if(!out) {
		throw fs::filesystem_error("cannot write", p, std::make_error_code(std::errc::io_error));
	}
}

std::shared_ptr<ufs::MemFs> make_source_a() {
	auto fs = ufs::make_mem_fs();
	fs->write_file("a", QuoteA);
	fs->write_file("b/x", "x of a");
	return fs;
}

std::shared_ptr<ufs::MemFs> make_source_b() {
	auto fs = ufs::make_mem_fs();
	fs->write_file("a/y", "y of b");
	fs->write_file("b/z", "z of b");
	return fs;
}

std::shared_ptr<ufs::File> CountingFs::open(fs::path const& p) const {
	{
		std::lock_guard lock(this->mutex_);
		++this->counts_[p.string()];
	}

	return this->fs_->open(p);
}

std::size_t CountingFs::count(std::string const& p) const {
	std::lock_guard lock(this->mutex_);

	auto const it = this->counts_.find(p);
	return it == this->counts_.end() ? 0 : it->second;
}

std::size_t CountingFs::total() const {
	std::lock_guard lock(this->mutex_);

	std::size_t rst = 0;
	for(auto const& [_, n]: this->counts_) {
		rst += n;
	}
	return rst;
}

void CountingFs::reset() {
	std::lock_guard lock(this->mutex_);
	this->counts_.clear();
}

namespace {

class FaultyFile: public ufs::File {
   public:
	FaultyFile(std::shared_ptr<ufs::File> f, std::string path, FaultyFs::Stage stage, std::errc code)
	    : f_(std::move(f))
	    , path_(std::move(path))
	    , stage_(stage)
	    , code_(code) { }

	[[nodiscard]] ufs::directory_entry stat() const override {
		if(this->stage_ == FaultyFs::Stage::Stat) {
			throw fs::filesystem_error("injected stat fault", this->path_, std::make_error_code(this->code_));
		}
		return this->f_->stat();
	}

	void close() override {
		this->f_->close();
	}

	std::size_t read(char* buffer, std::size_t count) override {
		return this->f_->read(buffer, count);
	}

	std::optional<std::vector<ufs::directory_entry>> read_dir(std::intmax_t n) override {
		if(this->stage_ == FaultyFs::Stage::List) {
			throw fs::filesystem_error("injected list fault", this->path_, std::make_error_code(this->code_));
		}

		auto page = this->f_->read_dir(n);
		if(this->stage_ == FaultyFs::Stage::Duplicate && page && !page->empty()) {
			page->push_back(page->front());
		}
		return page;
	}

   private:
	std::shared_ptr<ufs::File> f_;
	std::string                path_;
	FaultyFs::Stage            stage_;
	std::errc                  code_;
};

}  // namespace

std::shared_ptr<ufs::File> FaultyFs::open(fs::path const& p) const {
	auto const s  = p.string();
	auto const it = this->faults_.find(s);
	if(it == this->faults_.end()) {
		return this->fs_->open(p);
	}

	auto const [stage, code] = it->second;
	if(stage == Stage::Open) {
		throw fs::filesystem_error("injected open fault", p, std::make_error_code(code));
	}

	return std::make_shared<FaultyFile>(this->fs_->open(p), s, stage, code);
}

void FaultyFs::fail(std::string p, Stage stage, std::errc code) {
	this->faults_.insert_or_assign(std::move(p), std::make_pair(stage, code));
}

}  // namespace testing
