// Copyright (c) 2025, envact Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef ENVACT_FS_FILESYSTEM_HPP
#define ENVACT_FS_FILESYSTEM_HPP

#include <filesystem>

namespace envact::fs
{
    // envact only needs the standard path type; keep the name used across the code base.
    using u8path = std::filesystem::path;

    using std::filesystem::absolute;
    using std::filesystem::canonical;
    using std::filesystem::create_directories;
    using std::filesystem::current_path;
    using std::filesystem::directory_entry;
    using std::filesystem::directory_iterator;
    using std::filesystem::exists;
    using std::filesystem::filesystem_error;
    using std::filesystem::is_directory;
    using std::filesystem::is_regular_file;
    using std::filesystem::remove;
    using std::filesystem::remove_all;
    using std::filesystem::temp_directory_path;
    using std::filesystem::weakly_canonical;
}

#endif
