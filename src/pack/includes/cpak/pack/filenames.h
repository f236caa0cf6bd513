#pragma once

#include "cpak/document/serialization.h"

#include <boost/filesystem.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cpak::pack {

/**
 * Make a display name usable as a path segment.
 *
 * The name is decomposed (Unicode NFD); every code point other than an
 * ASCII letter or digit or a combining diacritical mark (U+0300 - U+036F)
 * is replaced by a single '_'.
 */
std::string
safe_filename(std::string_view name);

/**
 * `<safe-name>_<id>` for named documents, otherwise `fallback`.
 */
std::string
display_name(
    const std::optional<std::string>& name,
    std::string_view id,
    std::string_view fallback);

/**
 * All source files of a format below `root`, sorted by path.
 * Only the top level is searched unless `recursive` is set.
 */
std::vector<boost::filesystem::path>
find_source_files(
    const boost::filesystem::path& root,
    document::Format format,
    bool recursive);

}  // namespace cpak::pack
