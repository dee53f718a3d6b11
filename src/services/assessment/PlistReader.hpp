#pragma once
#include <map>
#include <string>
#include <string_view>

namespace sigdrift {

// Parses an XML property list whose root is a <dict> and returns its
// top-level scalar entries as text. Nested arrays and dicts are skipped.
// Throws std::runtime_error on malformed input.
std::map<std::string, std::string> read_plist_dict(std::string_view xml);

} // namespace sigdrift
