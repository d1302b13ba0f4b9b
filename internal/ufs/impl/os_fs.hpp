#pragma once

#include <filesystem>
#include <memory>

#include "ufs/file.hpp"
#include "ufs/fs.hpp"

namespace ufs {
namespace impl {

class OsFs: public Fs {
   public:
	OsFs(std::filesystem::path root);

	using Fs::open;

	[[nodiscard]] std::shared_ptr<File> open(std::filesystem::path const& p) const override;

   private:
	std::filesystem::path root_;
};

}  // namespace impl
}  // namespace ufs
