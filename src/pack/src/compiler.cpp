#include "cpak/pack/compiler.h"
#include "cpak/core/errors.h"
#include "cpak/document/composite-key.h"
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
 * Derives every node's key, strips the in-band `_key` and claims the key
 * for this run. The primary's key is the one it declares; embedded keys
 * follow from their position below it.
 */
class PackVisitor
{
public:
    using context_type = KeyPrefix;

    PackVisitor(
        std::unordered_set<std::string>& claimed,
        const fs::path& file)
        : claimed_(claimed), file_(file)
    {
    }

    KeyPrefix
    visit_node(
        Document& doc,
        std::string_view collection,
        const KeyPrefix& prefix)
    {
        auto declared = doc.take_key();

        KeyPrefix next;
        if (prefix.is_root())
        {
            if (!declared)
            {
                throw ParseError(
                    file_.string(), "document has no string _key");
            }
            auto composite = decompose_root(*declared);
            if (composite.collection() != collection)
            {
                throw ParseError(
                    file_.string(),
                    "_key '" + *declared + "' moves the document from '" +
                        std::string(collection) + "' to '" +
                        composite.collection() + "'");
            }
            next = {composite.collection_path(), composite.id_path()};
            root_key_ = *declared;
        }
        else
        {
            next = prefix.extend(collection, doc.id());
        }

        std::string key = next.key();

        // A bare id would leave its embedded record unclaimed, and the
        // record would be removed as stale
        for (const auto& slot : doc.slots())
        {
            for (const auto& entry : slot.entries)
            {
                if (!entry.is_reference())
                    continue;
                throw SchemaError(
                    "embedded " + std::string(slot.field->name) + " '" +
                    entry.id() + "' of " + key +
                    " is a bare id; source files must hold embedded "
                    "documents inline");
            }
        }

        if (!claimed_.insert(key).second)
        {
            throw IntegrityError(
                "An entry with key '" + key +
                "' was already packed and would be overwritten by this "
                "entry (" +
                file_.string() + ")");
        }
        return next;
    }

    const std::string&
    root_key() const
    {
        return root_key_;
    }

private:
    document::CompositeKey
    decompose_root(const std::string& key) const
    {
        try
        {
            auto composite = document::decompose_key(key);
            if (!composite.is_primary())
            {
                throw KeyError(
                    "'" + key + "' is not the key of a primary document");
            }
            return composite;
        }
        catch (const KeyError& e)
        {
            throw ParseError(file_.string(), e.what());
        }
    }

    std::unordered_set<std::string>& claimed_;
    const fs::path& file_;
    std::string root_key_;
};

}  // namespace

void
validate_compile_options(const CompileOptions& options)
{
    if (options.nedb)
    {
        throw ConfigurationError(
            "NeDB packs are not supported, only RocksDB packs can be "
            "compiled");
    }
}

Compiler::Compiler(store::Store& store, CompileOptions options)
    : store_(store), options_(std::move(options))
{
    validate_compile_options(options_);
}

Document
Compiler::load(const fs::path& file) const
{
    boost::json::value jv = document::read_file(file, options_.format);

    try
    {
        if (!jv.is_object())
            throw SchemaError("top-level value is not an object");

        auto key = jv.as_object().if_contains(document::KEY_FIELD);
        if (!key || !key->is_string())
            throw KeyError("document has no string _key");

        auto composite = document::decompose_key(key->as_string().c_str());
        if (!composite.is_primary())
        {
            throw KeyError(
                "'" + composite.str() +
                "' is not the key of a primary document");
        }

        return Document::from_json(
            std::move(jv.as_object()), composite.collection());
    }
    catch (const ParseError& e)
    {
        throw ParseError(file.string(), e.what());
    }
}

EntryAction
Compiler::apply_transform(Document& doc, const fs::path& file) const
{
    if (!options_.transform_entry)
        return EntryAction::KEEP;

    try
    {
        return options_.transform_entry(doc);
    }
    catch (const PackError&)
    {
        throw;
    }
    catch (const std::exception& e)
    {
        throw TransformError(file.string(), e.what());
    }
}

void
Compiler::pack_file(const fs::path& file, store::WriteBatch& batch)
{
    Document doc = load(file);

    if (apply_transform(doc, file) == EntryAction::DISCARD)
    {
        OLOGD("Discarded ", file.string());
        ++result_.discarded;
        return;
    }

    PackVisitor visitor(claimed_, file);
    try
    {
        document::walk_hierarchy(doc, visitor);
    }
    catch (const SchemaError& e)
    {
        throw ParseError(file.string(), e.what());
    }

    // Embedded documents stay inline in the primary's value
    batch.put(visitor.root_key(), doc.to_json());
    staged_.insert(visitor.root_key());
    ++result_.packed;

    if (options_.log)
    {
        auto name = doc.name();
        OLOGI(
            "Packed ",
            COLORED(BLUE, doc.id()),
            COLORED(BLUE, name ? " (" + *name + ")" : std::string()));
    }
}

void
Compiler::remove_stale(store::WriteBatch& batch)
{
    for (auto& key : store_.keys())
    {
        if (staged_.count(key))
            continue;
        if (options_.log)
        {
            OLOGI("Removed ", COLORED(BLUE, key));
        }
        batch.del(std::move(key));
        ++result_.removed;
    }
}

void
Compiler::compact()
{
    auto first = store_.first_key();
    auto last = store_.last_key();
    if (!first || !last)
    {
        OLOGD("Store is empty, skipping compaction");
        return;
    }
    OLOGD("Compacting ", *first, " .. ", *last);
    store_.compact_range(*first, *last);
}

CompileResult
Compiler::compile(const fs::path& source_dir)
{
    result_ = {};
    claimed_.clear();
    staged_.clear();

    auto files =
        find_source_files(source_dir, options_.format, options_.recursive);
    OLOGD("Found ", files.size(), " source files in ", source_dir.string());

    store::WriteBatch batch;
    for (const auto& file : files)
    {
        try
        {
            pack_file(file, batch);
        }
        catch (const std::exception& e)
        {
            if (options_.log)
            {
                OLOGE(
                    "Failed to pack ",
                    COLORED(RED, file.string()),
                    ". ",
                    e.what());
            }
            throw;
        }
    }

    remove_stale(batch);
    store_.write(batch);
    compact();

    return result_;
}

CompileResult
compile_pack(
    const fs::path& source_dir,
    store::Store& store,
    const CompileOptions& options)
{
    Compiler compiler(store, options);
    return compiler.compile(source_dir);
}

CompileResult
compile_pack(
    const fs::path& source_dir,
    const fs::path& pack_path,
    const CompileOptions& options)
{
    validate_compile_options(options);

    fs::create_directories(pack_path);
    store::RocksStore::Options store_options;
    store_options.create_if_missing = true;
    store::RocksStore store(pack_path.string(), store_options);
    CompileResult result = compile_pack(source_dir, store, options);
    store.close();
    return result;
}

}  // namespace cpak::pack
