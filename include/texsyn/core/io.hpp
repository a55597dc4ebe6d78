#pragma once

#include <texsyn/core/fwd.hpp>
#include <filesystem>
#include <string>
#include <string_view>

namespace txs {
  namespace fs = std::filesystem;

  namespace io {
    // Return a copy of a provided path with a given extension (re)-placed
    inline
    fs::path path_with_ext(fs::path path, std::string_view ext) {
      return path.replace_extension(ext);
    }

    // Simple string load/save to/from file
    std::string load_string(const fs::path &path);
    void        save_string(const fs::path &path, const std::string &string);
  } // namespace io
} // namespace txs
