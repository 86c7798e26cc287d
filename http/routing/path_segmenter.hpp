#ifndef TRELLIS_HTTP_PATH_SEGMENTER_HPP
#define TRELLIS_HTTP_PATH_SEGMENTER_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Trellis::Http {

using PathSegments = std::vector<std::string>;

/*
 * Splits on '/' and drops empty tokens, so "//a///b/" is ["a", "b"].
 * A path with no tokens at all ("" or "/") is the single root token "/".
 */
PathSegments SplitPath(std::string_view path);

// "/x#v1" -> {"/x", "v1"}, a path without '#' keeps an empty version
std::pair<std::string_view, std::string_view> SplitRouteVersion(std::string_view route);

// "get, Post" -> ["GET", "POST"], blank tokens are skipped, nothing left means ["ALL"]
std::vector<std::string> SplitMethods(std::string_view csv);

} // namespace Trellis::Http

#endif // TRELLIS_HTTP_PATH_SEGMENTER_HPP
