#pragma once

#include <functional>
#include <string>
#include <vector>

namespace wgsessions {

// Regular files in `dir` whose name starts with `prefix`, sorted by
// filename descending. Returns false (and fills error_out) only when the
// directory itself cannot be listed.
bool list_log_files(const std::string& dir, const std::string& prefix,
                    std::vector<std::string>& out, std::string* error_out = nullptr);

bool is_gzip_path(const std::string& path);

// Calls on_line for every line of the file, without the trailing newline.
// Files ending in ".gz" are decompressed with zlib. Returns false if the
// file cannot be opened or a read/decode error occurs.
bool for_each_line(const std::string& path,
                   const std::function<void(const std::string&)>& on_line,
                   std::string* error_out = nullptr);

} // namespace wgsessions
