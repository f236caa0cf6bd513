#pragma once

#include <boost/filesystem.hpp>
#include <boost/json.hpp>
#include <ostream>
#include <string>
#include <string_view>

namespace cpak::document {

// Text format of source and extracted files
enum class Format {
    JSON,  // default
    YAML
};

struct JsonOptions
{
    /** Spaces per indentation level */
    int indent = 2;
};

struct YamlOptions
{
    /** Spaces per indentation level (yaml-cpp accepts 2 to 9) */
    int indent = 2;
};

struct SerializeOptions
{
    Format format = Format::JSON;
    JsonOptions json;
    YamlOptions yaml;
};

/**
 * Extension written for a format, without the dot ("json" or "yml").
 */
std::string_view
file_extension(Format format);

/**
 * Whether a file is a source file of the given format: `.json` for JSON,
 * `.yml` or `.yaml` for YAML.
 */
bool
has_format_extension(const boost::filesystem::path& path, Format format);

/**
 * Parse document text.
 * @throws ParseError on malformed input
 */
boost::json::value
parse_text(std::string_view text, Format format);

/**
 * Pretty-print a JSON value: members in stored order, `indent` spaces per
 * level, no trailing newline.
 */
void
pretty_print(std::ostream& os, const boost::json::value& jv, int indent = 2);

/**
 * Serialize a value to the text written into files, including the trailing
 * newline.
 */
std::string
serialize(const boost::json::value& jv, const SerializeOptions& options);

/**
 * Read and parse a file.
 * @throws ParseError naming the path on malformed content
 */
boost::json::value
read_file(const boost::filesystem::path& path, Format format);

/**
 * Serialize and write a value, creating parent directories as needed.
 */
void
write_file(
    const boost::json::value& jv,
    const boost::filesystem::path& path,
    const SerializeOptions& options);

}  // namespace cpak::document
