#pragma once
#include <filesystem>

namespace fc {

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

}
