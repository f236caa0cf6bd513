#include "cpak/pack/extractor.h"
#include "cpak/core/errors.h"
#include "cpak/document/composite-key.h"
#include "cpak/document/hierarchy.h"
#include "cpak/document/walker.h"
#include "cpak/pack/filenames.h"
#include "cpak/pack/key-prefix.h"
#include "cpak/store/rocks-store.h"

#include <utility>

namespace cpak::pack {

namespace fs = boost::filesystem;
using document::Document;

namespace {

/**
 * Gives every node its `_key` back and pulls embedded entries that are
 * stored as bare ids in from the store, so the walker descends into them
 * next.
 */
class UnpackVisitor
{
public:
    using context_type = KeyPrefix;

    explicit UnpackVisitor(store::Store& store) : store_(store)
    {
    }

    KeyPrefix
    visit_node(
        Document& doc,
        std::string_view collection,
        const KeyPrefix& prefix)
    {
        KeyPrefix next = prefix.extend(collection, doc.id());
        std::string key = next.key();
        doc.set_key(key);

        for (auto& slot : doc.slots())
        {
            for (auto& entry : slot.entries)
            {
                if (!entry.is_reference())
                    continue;
                entry.resolve(
                    fetch(key, next, slot.field->name, entry.id()));
            }
        }
        return next;
    }

private:
    Document
    fetch(
        const std::string& owner,
        const KeyPrefix& prefix,
        std::string_view field,
        const std::string& id)
    {
        std::string child_key = prefix.extend(field, id).key();
        auto value = store_.get(child_key);
        if (!value)
        {
            throw ResolutionError(
                "Embedded " + std::string(field) + " '" + id + "' of " +
                owner + " is missing from the pack (expected " + child_key +
                ")");
        }
        if (!value->is_object())
        {
            throw SchemaError(
                "embedded record " + child_key + " is not an object");
        }

        auto child = Document::from_json(std::move(value->as_object()), field);
        child.take_key();
        return child;
    }

    store::Store& store_;
};

}  // namespace

std::string
validate_extract_options(const ExtractOptions& options)
{
    if (options.nedb)
    {
        throw ConfigurationError(
            "NeDB packs are not supported, only RocksDB packs can be "
            "extracted");
    }
    if (options.document_type.empty())
        throw ConfigurationError("a document type is required");

    auto collection = document::collection_for_type(options.document_type);
    if (!collection)
    {
        throw ConfigurationError(
            "unknown document type '" + options.document_type + "'");
    }

    if (options.collection && !options.collection->empty())
        return *options.collection;
    return std::string(*collection);
}

Extractor::Extractor(store::Store& store, ExtractOptions options)
    : store_(store), options_(std::move(options))
{
    collection_ = validate_extract_options(options_);
}

std::string
Extractor::output_name(
    const Document& doc,
    const document::CompositeKey& key,
    const std::string& raw_key) const
{
    std::optional<std::string> folder;
    if (auto parent = doc.folder())
        folder = folder_index_.path_of(*parent);

    std::string name;
    if (options_.transform_name)
    {
        try
        {
            name = options_.transform_name(doc, NameContext{folder});
        }
        catch (const PackError&)
        {
            throw;
        }
        catch (const std::exception& e)
        {
            throw TransformError(raw_key, e.what());
        }
    }
    if (!name.empty())
        return name;

    std::string ext =
        "." + std::string(document::file_extension(options_.format));

    fs::path path;
    const FolderIndex::Entry* own = nullptr;
    if (key.collection() == document::FOLDERS_COLLECTION)
        own = folder_index_.find(doc.id());

    if (own)
        path = fs::path(own->name) / ("_Folder" + ext);
    else
        path = display_name(doc.name(), key.id(), raw_key) + ext;

    if (folder)
        path = fs::path(*folder) / path;
    return path.generic_string();
}

void
Extractor::extract_entry(
    const std::string& key,
    boost::json::value value,
    const fs::path& dest_dir)
{
    auto composite = document::decompose_key(key);
    if (!composite.is_primary())
    {
        ++result_.embedded;
        return;
    }

    if (!value.is_object())
        throw SchemaError("stored value of " + key + " is not an object");

    if (composite.collection() != collection_ &&
        composite.collection() != document::FOLDERS_COLLECTION)
    {
        OLOGW(
            "Entry ",
            key,
            " is not part of collection '",
            collection_,
            "', extracting it anyway");
    }

    auto doc = Document::from_json(
        std::move(value.as_object()), composite.collection());
    doc.take_key();

    UnpackVisitor visitor(store_);
    document::walk_hierarchy(doc, visitor);

    if (options_.transform_entry)
    {
        EntryAction action;
        try
        {
            action = options_.transform_entry(doc);
        }
        catch (const PackError&)
        {
            throw;
        }
        catch (const std::exception& e)
        {
            throw TransformError(key, e.what());
        }
        if (action == EntryAction::DISCARD)
        {
            OLOGD("Discarded ", key);
            ++result_.discarded;
            return;
        }
    }

    std::string name = output_name(doc, composite, key);

    document::SerializeOptions serialize_options;
    serialize_options.format = options_.format;
    serialize_options.json = options_.json;
    serialize_options.yaml = options_.yaml;
    document::write_file(doc.to_json(), dest_dir / name, serialize_options);
    ++result_.written;

    if (options_.log)
    {
        OLOGI("Wrote ", COLORED(BLUE, name));
    }
}

ExtractResult
Extractor::extract(const fs::path& dest_dir)
{
    result_ = {};

    if (options_.clean)
    {
        OLOGD("Cleaning ", dest_dir.string());
        fs::remove_all(dest_dir);
    }
    fs::create_directories(dest_dir);

    folder_index_ = FolderIndex();
    if (options_.folders)
    {
        folder_index_ =
            FolderIndex::build(store_, options_.transform_folder_name);
    }

    store_.scan({}, [&](std::string_view key, std::string_view raw) {
        std::string k(key);
        try
        {
            extract_entry(k, store::Store::decode(key, raw), dest_dir);
        }
        catch (const std::exception& e)
        {
            OLOGE("Failed to extract ", COLORED(RED, k), ". ", e.what());
            throw;
        }
        return true;
    });

    return result_;
}

ExtractResult
extract_pack(
    store::Store& store,
    const fs::path& dest_dir,
    const ExtractOptions& options)
{
    Extractor extractor(store, options);
    return extractor.extract(dest_dir);
}

ExtractResult
extract_pack(
    const fs::path& pack_path,
    const fs::path& dest_dir,
    const ExtractOptions& options)
{
    validate_extract_options(options);

    store::RocksStore::Options store_options;
    store_options.create_if_missing = false;
    store_options.error_if_missing = true;
    store::RocksStore store(pack_path.string(), store_options);

    ExtractResult result = extract_pack(store, dest_dir, options);
    store.close();
    return result;
}

}  // namespace cpak::pack
