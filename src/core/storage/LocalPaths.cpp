#include "LocalPaths.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include <pwd.h>
#include <unistd.h>

#include "core/Errors.hpp"

namespace fs = std::filesystem;

namespace sigdrift {

std::string normalize_path(const std::string& path) {
  if (path.empty()) return ".";
  std::string out = fs::path(path).lexically_normal().string();
  // lexically_normal keeps a trailing separator ("a/b/" and "a/b/..")
  while (out.size() > 1 && out.back() == '/') out.pop_back();
  return out.empty() ? "." : out;
}

std::string expand_home(const std::string& path, const std::string& home) {
  if (home.empty()) return path;
  if (path == "~") return home;
  if (path.size() > 1 && path[0] == '~' && path[1] == '/') {
    std::string base = home;
    while (base.size() > 1 && base.back() == '/') base.pop_back();
    return base + path.substr(1);
  }
  return path;
}

bool is_under(const std::string& path, const std::string& dir) {
  if (dir.empty()) return false;
  if (dir == "/") return !path.empty() && path[0] == '/';
  if (path.compare(0, dir.size(), dir) != 0) return false;
  return path.size() == dir.size() || path[dir.size()] == '/';
}

std::string home_relative(const std::string& path, const std::string& home) {
  const std::string h = home.empty() ? std::string() : normalize_path(home);
  // a root or empty home would turn every absolute path into "~/..."
  if (h.empty() || h == "/" || !is_under(path, h)) return path;
  return "~" + path.substr(h.size());
}

std::string current_home() {
  if (const char* v = std::getenv("HOME"); v && *v) return std::string(v);
  if (const passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) return std::string(pw->pw_dir);
  throw Error("cannot determine home directory (HOME unset, no passwd entry)");
}

bool path_exists(const std::string& path) {
  std::error_code ec;
  return fs::exists(fs::path(path), ec);
}

bool read_file(const std::string& path, std::string& out) {
  std::error_code ec;
  if (!fs::exists(fs::path(path), ec)) return false;
  if (fs::is_directory(fs::path(path), ec)) throw Error("cannot read " + path + ": is a directory");
  std::ifstream in(path, std::ios::binary);
  if (!in) throw Error("cannot open " + path + ": " + std::strerror(errno));
  std::ostringstream buf; buf << in.rdbuf();
  if (in.bad()) throw Error("cannot read " + path);
  out = buf.str();
  return true;
}

void replace_file(const std::string& path, std::string_view bytes) {
  fs::path dest(path);
  fs::path parent = dest.parent_path();
  if (!parent.empty()) fs::create_directories(parent);

  fs::path tmp = dest;
  tmp += ".tmp";
  {
    std::ofstream os(tmp, std::ios::binary | std::ios::trunc);
    if (!os) throw Error("cannot create " + tmp.string() + ": " + std::strerror(errno));
    os.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    os.flush();
    if (!os) {
      std::error_code ignored;
      fs::remove(tmp, ignored);
      throw Error("short write to " + tmp.string());
    }
  }

  std::error_code ec;
  fs::rename(tmp, dest, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw Error("cannot rename " + tmp.string() + " to " + path + ": " + ec.message());
  }
}

} // namespace sigdrift
