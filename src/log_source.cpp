#include "wgsessions/log_source.hpp"

#include <zlib.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace wgsessions {

namespace fs = std::filesystem;

bool list_log_files(const std::string& dir, const std::string& prefix,
                    std::vector<std::string>& out, std::string* error_out) {
  out.clear();

  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    if (error_out) *error_out = "Cannot list directory " + dir + ": " + ec.message();
    return false;
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name.compare(0, prefix.size(), prefix) != 0) continue;

    std::error_code type_ec;
    if (!it->is_regular_file(type_ec) || type_ec) continue;
    out.push_back(it->path().string());
  }

  if (ec) {
    if (error_out) *error_out = "Error while listing " + dir + ": " + ec.message();
    return false;
  }

  std::sort(out.begin(), out.end(), [](const std::string& a, const std::string& b) {
    return fs::path(a).filename().string() > fs::path(b).filename().string();
  });
  return true;
}

bool is_gzip_path(const std::string& path) {
  const std::string ext = ".gz";
  return path.size() >= ext.size() &&
         path.compare(path.size() - ext.size(), ext.size(), ext) == 0;
}

static void strip_eol(std::string& line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();
}

static bool read_plain(const std::string& path,
                       const std::function<void(const std::string&)>& on_line,
                       std::string* error_out) {
  std::ifstream in(path);
  if (!in) {
    if (error_out) *error_out = "Failed to open file: " + path;
    return false;
  }

  std::string line;
  while (std::getline(in, line)) {
    strip_eol(line);
    on_line(line);
  }

  if (in.bad()) {
    if (error_out) *error_out = "Read error in file: " + path;
    return false;
  }
  return true;
}

static bool read_gzip(const std::string& path,
                      const std::function<void(const std::string&)>& on_line,
                      std::string* error_out) {
  gzFile gz = gzopen(path.c_str(), "rb");
  if (gz == nullptr) {
    if (error_out) *error_out = "Failed to open file: " + path;
    return false;
  }

  // gzopen falls back to plain reads when the gzip header is missing.
  if (gzdirect(gz) == 1) {
    gzclose(gz);
    if (error_out) *error_out = "Not in gzip format: " + path;
    return false;
  }

  char buf[8192];
  std::string pending;
  bool ok = true;

  for (;;) {
    const int n = gzread(gz, buf, sizeof(buf));
    if (n < 0) {
      int errnum = Z_OK;
      const char* msg = gzerror(gz, &errnum);
      if (error_out) {
        *error_out = "Decompression error in " + path + ": " + (msg ? msg : "unknown");
      }
      ok = false;
      break;
    }
    if (n == 0) break;

    pending.append(buf, static_cast<size_t>(n));
    size_t start = 0;
    size_t nl = 0;
    while ((nl = pending.find('\n', start)) != std::string::npos) {
      std::string line = pending.substr(start, nl - start);
      strip_eol(line);
      on_line(line);
      start = nl + 1;
    }
    pending.erase(0, start);
  }

  // A truncated archive reads as a short stream; zlib flags it on close.
  const int close_rc = gzclose(gz);
  if (ok && close_rc != Z_OK) {
    if (error_out) *error_out = "Truncated or corrupt archive: " + path;
    ok = false;
  }

  if (ok && !pending.empty()) {
    strip_eol(pending);
    on_line(pending);
  }
  return ok;
}

bool for_each_line(const std::string& path,
                   const std::function<void(const std::string&)>& on_line,
                   std::string* error_out) {
  if (is_gzip_path(path)) return read_gzip(path, on_line, error_out);
  return read_plain(path, on_line, error_out);
}

} // namespace wgsessions
