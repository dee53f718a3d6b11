#pragma once
#include <string>
#include <string_view>

namespace sigdrift {

// Lexical normalization: collapses ".", ".." and repeated separators and
// drops a trailing separator. Never touches the filesystem.
std::string normalize_path(const std::string& path);

// Replaces a leading "~" component with home. "~user" forms are left alone.
std::string expand_home(const std::string& path, const std::string& home);

// True if path equals dir or lies below it. Both are compared lexically.
bool is_under(const std::string& path, const std::string& dir);

// "/Users/x/App.app" -> "~/App.app" when home is "/Users/x"; otherwise path.
std::string home_relative(const std::string& path, const std::string& home);

// HOME, falling back to the password database.
std::string current_home();

bool path_exists(const std::string& path);

// Returns false if the file does not exist; throws on read errors.
bool read_file(const std::string& path, std::string& out);

// Writes bytes to a sibling temp file and renames it over path.
// Creates missing parent directories.
void replace_file(const std::string& path, std::string_view bytes);

} // namespace sigdrift
