#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>

#include <ufs/file.hpp>
#include <ufs/fs.hpp>

namespace testing {

// Forwards to another source and counts how many times each path is opened.
class CountingFs: public ufs::Fs {
   public:
	explicit CountingFs(std::shared_ptr<ufs::Fs const> fs)
	    : fs_(std::move(fs)) { }

	using ufs::Fs::open;

	[[nodiscard]] std::shared_ptr<ufs::File> open(std::filesystem::path const& p) const override;

	[[nodiscard]] std::size_t count(std::string const& p) const;

	[[nodiscard]] std::size_t total() const;

	void reset();

   private:
	std::shared_ptr<ufs::Fs const> fs_;

	mutable std::mutex                                   mutex_;
	mutable std::unordered_map<std::string, std::size_t> counts_;
};

// Forwards to another source but fails at a chosen stage for chosen paths.
class FaultyFs: public ufs::Fs {
   public:
	enum class Stage {
		Open,
		Stat,
		List,
		// The listing holds its first entry twice.
		Duplicate,
	};

	explicit FaultyFs(std::shared_ptr<ufs::Fs const> fs)
	    : fs_(std::move(fs)) { }

	using ufs::Fs::open;

	[[nodiscard]] std::shared_ptr<ufs::File> open(std::filesystem::path const& p) const override;

	void fail(std::string p, Stage stage, std::errc code = std::errc::io_error);

   private:
	std::shared_ptr<ufs::Fs const> fs_;

	std::unordered_map<std::string, std::pair<Stage, std::errc>> faults_;
};

}  // namespace testing
