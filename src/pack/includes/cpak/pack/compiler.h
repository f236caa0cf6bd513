#pragma once

#include "cpak/core/logger.h"
#include "cpak/document/document.h"
#include "cpak/document/serialization.h"
#include "cpak/pack/transforms.h"
#include "cpak/store/store.h"

#include <boost/filesystem.hpp>
#include <cstddef>
#include <string>
#include <unordered_set>

namespace cpak::pack {

struct CompileOptions
{
    document::Format format = document::Format::JSON;

    // Also pick up source files in subdirectories
    bool recursive = false;

    // Report every packed and removed entry
    bool log = false;

    EntryTransform transform_entry;

    // NeDB packs are not supported; setting this is a configuration error
    bool nedb = false;
};

struct CompileResult
{
    std::size_t packed = 0;
    std::size_t discarded = 0;
    std::size_t removed = 0;
};

/**
 * Packs a directory of source files into a store.
 *
 * Each source file holds one primary document carrying its composite key
 * in `_key`. The primary is stored under that key with all embedded
 * documents inline; keys already in the store that no source file packed
 * are deleted. Every put and delete goes into a single batch that is only
 * written once all files were packed, so a failing run leaves the store
 * untouched.
 */
class Compiler
{
public:
    /**
     * @throws ConfigurationError on unsupported options
     */
    Compiler(store::Store& store, CompileOptions options);

    CompileResult
    compile(const boost::filesystem::path& source_dir);

    static LogPartition&
    get_log_partition()
    {
        return log_partition_;
    }

private:
    // Parse a source file into a document of its declared collection
    document::Document
    load(const boost::filesystem::path& file) const;

    EntryAction
    apply_transform(
        document::Document& doc,
        const boost::filesystem::path& file) const;

    void
    pack_file(const boost::filesystem::path& file, store::WriteBatch& batch);

    void
    remove_stale(store::WriteBatch& batch);

    void
    compact();

    inline static LogPartition log_partition_{"PACK", LogLevel::INHERIT};

    store::Store& store_;
    CompileOptions options_;
    CompileResult result_;

    // Every node key claimed this run, embedded nodes included
    std::unordered_set<std::string> claimed_;

    // Keys written this run (primaries only)
    std::unordered_set<std::string> staged_;
};

/**
 * @throws ConfigurationError if the options cannot be honoured
 */
void
validate_compile_options(const CompileOptions& options);

/**
 * Compile into an already open store.
 */
CompileResult
compile_pack(
    const boost::filesystem::path& source_dir,
    store::Store& store,
    const CompileOptions& options = {});

/**
 * Compile into the RocksDB pack at `pack_path`, creating it if needed.
 */
CompileResult
compile_pack(
    const boost::filesystem::path& source_dir,
    const boost::filesystem::path& pack_path,
    const CompileOptions& options = {});

}  // namespace cpak::pack
