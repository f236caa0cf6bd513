#pragma once

#include <optional>
#include <string>

namespace cpak::cli {

/**
 * Type-safe structure for `cpak compile` command line options
 */
struct CompileCommandOptions
{
    /** Directory holding the source files */
    std::optional<std::string> source_dir;

    /** Path of the RocksDB pack to write */
    std::optional<std::string> pack_path;

    /** Read YAML source files instead of JSON */
    bool yaml = false;

    /** Also read source files in subdirectories */
    bool recursive = false;

    /** Log level (error, warn, info, debug) */
    std::string log_level = "warn";

    /** Report every packed and removed entry */
    bool verbose = false;

    /** Whether to display help information */
    bool show_help = false;

    /** Whether parsing completed successfully */
    bool valid = true;

    /** Any error message to display */
    std::optional<std::string> error_message;

    /** Pre-formatted help text */
    std::string help_text;
};

/**
 * Type-safe structure for `cpak extract` command line options
 */
struct ExtractCommandOptions
{
    /** Path of the RocksDB pack to read */
    std::optional<std::string> pack_path;

    /** Directory to write the extracted files into */
    std::optional<std::string> dest_dir;

    /** Primary document type of the pack, e.g. Actor */
    std::optional<std::string> document_type;

    /** Collection override (defaults from the document type) */
    std::optional<std::string> collection;

    /** Write YAML files instead of JSON */
    bool yaml = false;

    /** Recreate the pack's folders as directories */
    bool folders = false;

    /** Remove the destination directory first */
    bool clean = false;

    /** Spaces per indentation level of the written files */
    int indent = 2;

    /** Log level (error, warn, info, debug) */
    std::string log_level = "warn";

    /** Report every written file */
    bool verbose = false;

    /** Whether to display help information */
    bool show_help = false;

    /** Whether parsing completed successfully */
    bool valid = true;

    /** Any error message to display */
    std::optional<std::string> error_message;

    /** Pre-formatted help text */
    std::string help_text;
};

/**
 * Parse the arguments of `cpak compile`. argv[0] is the program name; the
 * subcommand itself has already been removed.
 */
CompileCommandOptions
parse_compile_argv(int argc, char* argv[]);

/**
 * Parse the arguments of `cpak extract`. argv[0] is the program name; the
 * subcommand itself has already been removed.
 */
ExtractCommandOptions
parse_extract_argv(int argc, char* argv[]);

}  // namespace cpak::cli
