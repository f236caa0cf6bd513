#pragma once

#include "cpak/core/logger.h"
#include "cpak/document/composite-key.h"
#include "cpak/document/document.h"
#include "cpak/document/serialization.h"
#include "cpak/pack/folder-index.h"
#include "cpak/pack/transforms.h"
#include "cpak/store/store.h"

#include <boost/filesystem.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace cpak::pack {

struct ExtractOptions
{
    // Primary document type of the pack, e.g. "Actor". Required.
    std::string document_type;

    // Collection of the pack's primaries; defaults from the document type
    std::optional<std::string> collection;

    // Recreate the pack's folder tree as directories
    bool folders = false;

    // Remove the destination directory before writing
    bool clean = false;

    document::Format format = document::Format::JSON;
    document::JsonOptions json;
    document::YamlOptions yaml;

    // Report every written file
    bool log = false;

    EntryTransform transform_entry;
    NameTransform transform_name;
    FolderNameTransform transform_folder_name;

    // NeDB packs are not supported; setting this is a configuration error
    bool nedb = false;
};

struct ExtractResult
{
    std::size_t written = 0;
    std::size_t discarded = 0;

    // Embedded records met while iterating; reached through their owner
    std::size_t embedded = 0;
};

/**
 * Resolve the collection a run extracts.
 * @throws ConfigurationError if the document type is missing or unknown,
 * or NeDB was requested
 */
std::string
validate_extract_options(const ExtractOptions& options);

/**
 * Unpacks a store into one source file per primary document.
 *
 * The store is read in key order. Embedded records are never written as
 * files of their own: each primary document is walked, embedded entries
 * stored as bare ids are fetched from the store by their composite key, and
 * every node gets its `_key` back before the document is serialized.
 */
class Extractor
{
public:
    /**
     * @throws ConfigurationError on invalid options
     */
    Extractor(store::Store& store, ExtractOptions options);

    ExtractResult
    extract(const boost::filesystem::path& dest_dir);

    const FolderIndex&
    folder_index() const
    {
        return folder_index_;
    }

    static LogPartition&
    get_log_partition()
    {
        return log_partition_;
    }

private:
    void
    extract_entry(
        const std::string& key,
        boost::json::value value,
        const boost::filesystem::path& dest_dir);

    // Output path relative to the destination directory
    std::string
    output_name(
        const document::Document& doc,
        const document::CompositeKey& key,
        const std::string& raw_key) const;

    inline static LogPartition log_partition_{"UNPACK", LogLevel::INHERIT};

    store::Store& store_;
    ExtractOptions options_;
    std::string collection_;
    FolderIndex folder_index_;
    ExtractResult result_;
};

/**
 * Extract from an already open store.
 */
ExtractResult
extract_pack(
    store::Store& store,
    const boost::filesystem::path& dest_dir,
    const ExtractOptions& options);

/**
 * Extract the RocksDB pack at `pack_path`, which must exist.
 */
ExtractResult
extract_pack(
    const boost::filesystem::path& pack_path,
    const boost::filesystem::path& dest_dir,
    const ExtractOptions& options);

}  // namespace cpak::pack
