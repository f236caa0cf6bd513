#include "cpak/cli/arg-options.h"
#include "cpak/core/errors.h"
#include "cpak/core/logger.h"
#include "cpak/pack/compiler.h"
#include "cpak/pack/extractor.h"

#include <iostream>
#include <string>

using namespace cpak;

namespace {

void
print_usage(const char* program_name)
{
    std::cout << "cpak - compendium pack compiler and extractor\n\n"
              << "Usage: " << program_name << " <subcommand> [options]\n\n"
              << "Subcommands:\n"
              << "  compile  Pack a directory of source files into a pack\n"
              << "  extract  Unpack a pack into one source file per document\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name
              << " compile --source packs/src/monsters --pack packs/monsters\n"
              << "  " << program_name
              << " extract --pack packs/monsters --dest packs/src/monsters "
                 "--type Actor --folders --clean\n"
              << "\n"
              << "For subcommand-specific help:\n"
              << "  " << program_name << " <subcommand> --help\n";
}

template <typename Options>
bool
report_parse_result(const Options& options)
{
    if (!options.show_help && options.valid)
        return false;

    if (!options.valid && options.error_message)
    {
        std::cerr << "Error: " << *options.error_message << std::endl
                  << std::endl;
    }
    std::cout << options.help_text << std::endl;
    return true;
}

void
apply_log_level(const std::string& level, bool verbose)
{
    if (!Logger::set_level(level))
    {
        Logger::set_level(LogLevel::WARNING);
        std::cerr << "Unrecognized log level: " << level
                  << ", falling back to 'warn'" << std::endl;
    }
    if (verbose && Logger::get_level() < LogLevel::INFO)
        Logger::set_level(LogLevel::INFO);
}

int
run_compile(int argc, char* argv[])
{
    cli::CompileCommandOptions options = cli::parse_compile_argv(argc, argv);
    if (report_parse_result(options))
        return options.valid ? 0 : 1;

    apply_log_level(options.log_level, options.verbose);

    pack::CompileOptions compile_options;
    compile_options.format =
        options.yaml ? document::Format::YAML : document::Format::JSON;
    compile_options.recursive = options.recursive;
    compile_options.log = options.verbose;

    try
    {
        auto result = pack::compile_pack(
            *options.source_dir, *options.pack_path, compile_options);
        LOGI(
            "Packed ",
            result.packed,
            " entries, removed ",
            result.removed,
            " into ",
            *options.pack_path);
        return 0;
    }
    catch (const std::exception& e)
    {
        LOGE("Compile failed: ", e.what());
        return 1;
    }
}

int
run_extract(int argc, char* argv[])
{
    cli::ExtractCommandOptions options = cli::parse_extract_argv(argc, argv);
    if (report_parse_result(options))
        return options.valid ? 0 : 1;

    apply_log_level(options.log_level, options.verbose);

    pack::ExtractOptions extract_options;
    extract_options.document_type = options.document_type.value_or("");
    extract_options.collection = options.collection;
    extract_options.folders = options.folders;
    extract_options.clean = options.clean;
    extract_options.format =
        options.yaml ? document::Format::YAML : document::Format::JSON;
    extract_options.json.indent = options.indent;
    extract_options.yaml.indent = options.indent;
    extract_options.log = options.verbose;

    try
    {
        auto result = pack::extract_pack(
            *options.pack_path, *options.dest_dir, extract_options);
        LOGI(
            "Wrote ",
            result.written,
            " files to ",
            *options.dest_dir,
            " (",
            result.discarded,
            " discarded)");
        return 0;
    }
    catch (const std::exception& e)
    {
        LOGE("Extract failed: ", e.what());
        return 1;
    }
}

}  // namespace

int
main(int argc, char* argv[])
{
    if (argc < 2)
    {
        print_usage(argv[0]);
        return 1;
    }

    std::string subcommand = argv[1];

    // Hand the subcommand its own argv, program name first
    int sub_argc = argc - 1;
    char** sub_argv = argv + 1;
    sub_argv[0] = argv[0];

    if (subcommand == "compile")
    {
        return run_compile(sub_argc, sub_argv);
    }
    else if (subcommand == "extract")
    {
        return run_extract(sub_argc, sub_argv);
    }
    else if (subcommand == "--help" || subcommand == "-h")
    {
        print_usage(argv[0]);
        return 0;
    }
    else
    {
        std::cerr << "Error: Unknown subcommand '" << subcommand << "'\n\n";
        print_usage(argv[0]);
        return 1;
    }
}
