#pragma once

#include <string>
#include <string_view>

namespace semgraph {

std::string ToLower(std::string_view s);
std::string ToUpper(std::string_view s);

std::string_view Trim(std::string_view s);

inline bool StartsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline bool EndsWith(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// ASCII case-insensitive substring test; an empty needle matches everything
bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle);

// IRI segment after the last '#' or '/' (the whole IRI if neither occurs)
std::string_view LocalName(std::string_view iri);

// File name without directory and final extension ("dir/foo.ttl" -> "foo")
std::string FileStem(std::string_view path);

} // namespace semgraph
