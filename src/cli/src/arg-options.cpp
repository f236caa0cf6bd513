#include "cpak/cli/arg-options.h"

#include <boost/program_options.hpp>
#include <sstream>
#include <stdexcept>
#include <string>

namespace po = boost::program_options;
namespace cpak::cli {

namespace {

bool
is_log_level(const std::string& level)
{
    return level == "error" || level == "warn" || level == "info" ||
        level == "debug";
}

const char*
program_name(int argc, char* argv[])
{
    return argc > 0 ? argv[0] : "cpak";
}

}  // namespace

CompileCommandOptions
parse_compile_argv(int argc, char* argv[])
{
    CompileCommandOptions options;

    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Display this help message")(
        "source,s",
        po::value<std::string>(),
        "Directory holding the source files")(
        "pack,p", po::value<std::string>(), "Path of the pack to write")(
        "yaml,y", po::bool_switch(), "Read YAML (.yml, .yaml) source files")(
        "recursive,r",
        po::bool_switch(),
        "Also read source files in subdirectories")(
        "log-level,l",
        po::value<std::string>()->default_value("warn"),
        "Log level (error, warn, info, debug)")(
        "verbose,v",
        po::bool_switch(),
        "Report every packed and removed entry");

    std::ostringstream help_stream;
    help_stream << "cpak compile - pack source files into a compendium pack"
                << std::endl
                << std::endl
                << "Usage: " << program_name(argc, argv)
                << " compile --source <dir> --pack <db> [options]" << std::endl
                << desc << std::endl
                << "Entries already in the pack that no source file declares "
                   "are removed."
                << std::endl;
    options.help_text = help_stream.str();

    try
    {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            options.show_help = true;
            return options;
        }

        if (vm.count("source"))
        {
            options.source_dir = vm["source"].as<std::string>();
        }
        else
        {
            options.valid = false;
            options.error_message = "No source directory specified (--source)";
            return options;
        }

        if (vm.count("pack"))
        {
            options.pack_path = vm["pack"].as<std::string>();
        }
        else
        {
            options.valid = false;
            options.error_message = "No pack specified (--pack)";
            return options;
        }

        options.yaml = vm["yaml"].as<bool>();
        options.recursive = vm["recursive"].as<bool>();
        options.verbose = vm["verbose"].as<bool>();

        std::string level = vm["log-level"].as<std::string>();
        if (!is_log_level(level))
        {
            options.valid = false;
            options.error_message =
                "Log level must be one of: error, warn, info, debug";
            return options;
        }
        options.log_level = level;
    }
    catch (const po::error& e)
    {
        options.valid = false;
        options.error_message = e.what();
    }

    return options;
}

ExtractCommandOptions
parse_extract_argv(int argc, char* argv[])
{
    ExtractCommandOptions options;

    po::options_description desc("Allowed options");
    desc.add_options()("help,h", "Display this help message")(
        "pack,p", po::value<std::string>(), "Path of the pack to read")(
        "dest,d",
        po::value<std::string>(),
        "Directory to write the extracted files into")(
        "type,t",
        po::value<std::string>(),
        "Primary document type of the pack (Actor, Item, JournalEntry, ...)")(
        "collection,c",
        po::value<std::string>(),
        "Collection of the primaries (defaults from --type)")(
        "yaml,y", po::bool_switch(), "Write YAML (.yml) files")(
        "folders,f",
        po::bool_switch(),
        "Recreate the pack's folders as directories")(
        "clean",
        po::bool_switch(),
        "Remove the destination directory before writing")(
        "indent",
        po::value<int>()->default_value(2),
        "Spaces per indentation level (default: 2)")(
        "log-level,l",
        po::value<std::string>()->default_value("warn"),
        "Log level (error, warn, info, debug)")(
        "verbose,v", po::bool_switch(), "Report every written file");

    std::ostringstream help_stream;
    help_stream << "cpak extract - unpack a compendium pack into source files"
                << std::endl
                << std::endl
                << "Usage: " << program_name(argc, argv)
                << " extract --pack <db> --dest <dir> --type <DocumentType> "
                   "[options]"
                << std::endl
                << desc << std::endl
                << "One file is written per primary document, with its "
                   "embedded documents inline."
                << std::endl;
    options.help_text = help_stream.str();

    try
    {
        po::variables_map vm;
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);

        if (vm.count("help"))
        {
            options.show_help = true;
            return options;
        }

        if (vm.count("pack"))
        {
            options.pack_path = vm["pack"].as<std::string>();
        }
        else
        {
            options.valid = false;
            options.error_message = "No pack specified (--pack)";
            return options;
        }

        if (vm.count("dest"))
        {
            options.dest_dir = vm["dest"].as<std::string>();
        }
        else
        {
            options.valid = false;
            options.error_message =
                "No destination directory specified (--dest)";
            return options;
        }

        // Unknown types are reported by the extractor itself
        if (vm.count("type"))
        {
            options.document_type = vm["type"].as<std::string>();
        }

        if (vm.count("collection"))
        {
            options.collection = vm["collection"].as<std::string>();
        }

        options.yaml = vm["yaml"].as<bool>();
        options.folders = vm["folders"].as<bool>();
        options.clean = vm["clean"].as<bool>();
        options.verbose = vm["verbose"].as<bool>();

        options.indent = vm["indent"].as<int>();
        if (options.indent < 0 || options.indent > 9)
        {
            options.valid = false;
            options.error_message = "indent must be between 0 and 9";
            return options;
        }
        if (options.yaml && options.indent < 2)
        {
            options.valid = false;
            options.error_message = "YAML indent must be between 2 and 9";
            return options;
        }

        std::string level = vm["log-level"].as<std::string>();
        if (!is_log_level(level))
        {
            options.valid = false;
            options.error_message =
                "Log level must be one of: error, warn, info, debug";
            return options;
        }
        options.log_level = level;
    }
    catch (const po::error& e)
    {
        options.valid = false;
        options.error_message = e.what();
    }

    return options;
}

}  // namespace cpak::cli
