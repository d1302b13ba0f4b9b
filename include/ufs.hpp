#pragma once

#include "ufs/directory_entry.hpp"
#include "ufs/directory_iterator.hpp"
#include "ufs/file.hpp"
#include "ufs/fs.hpp"
#include "ufs/mem_fs.hpp"
#include "ufs/merged_fs.hpp"
