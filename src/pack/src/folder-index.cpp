#include "cpak/pack/folder-index.h"
#include "cpak/core/errors.h"
#include "cpak/document/composite-key.h"
#include "cpak/document/document.h"
#include "cpak/pack/filenames.h"

#include <boost/filesystem/path.hpp>
#include <exception>
#include <unordered_set>
#include <vector>

namespace cpak::pack {

using document::Document;

FolderIndex
FolderIndex::build(store::Store& store, const FolderNameTransform& transform_name)
{
    FolderIndex index;
    const std::string prefix = std::string(1, document::KEY_SECTION_DELIMITER) +
        std::string(document::FOLDERS_COLLECTION);

    store.for_each(
        [&](const std::string& key, boost::json::value value) {
            // The prefix also matches collections that merely start with
            // "folders"; only primary folder records count
            auto composite = document::decompose_key(key);
            if (!composite.is_primary() ||
                composite.collection() != document::FOLDERS_COLLECTION)
                return;
            if (!value.is_object())
            {
                throw SchemaError(
                    "folder record " + key + " is not an object");
            }

            auto doc = Document::from_json(
                std::move(value.as_object()), document::FOLDERS_COLLECTION);

            std::string name;
            if (transform_name)
            {
                try
                {
                    name = transform_name(doc);
                }
                catch (const PackError&)
                {
                    throw;
                }
                catch (const std::exception& e)
                {
                    throw TransformError(key, e.what());
                }
            }
            if (name.empty())
                name = display_name(doc.name(), doc.id(), key);

            index.add(doc.id(), std::move(name), doc.folder());
        },
        prefix);

    index.resolve();
    PLOGD(log_partition_, "Indexed ", index.size(), " folders");
    return index;
}

void
FolderIndex::add(
    const std::string& id,
    std::string name,
    std::optional<std::string> parent)
{
    Entry& entry = entries_[id];
    entry.name = std::move(name);
    entry.parent = std::move(parent);
    entry.path.clear();
}

void
FolderIndex::resolve()
{
    for (auto& [id, entry] : entries_)
    {
        std::vector<const Entry*> chain{&entry};
        std::unordered_set<std::string> visited{id};

        auto parent_id = entry.parent;
        while (parent_id)
        {
            auto it = entries_.find(*parent_id);
            if (it == entries_.end())
                break;
            if (!visited.insert(*parent_id).second)
            {
                PLOGE(log_partition_, "Folder ", id, " is its own ancestor");
                throw IntegrityError(
                    "Folder '" + id + "' has a cyclic parent chain through '" +
                    *parent_id + "'");
            }
            chain.push_back(&it->second);
            parent_id = it->second.parent;
        }

        boost::filesystem::path path;
        for (auto it = chain.rbegin(); it != chain.rend(); ++it)
            path /= (*it)->name;
        entry.path = path.generic_string();
    }
}

const FolderIndex::Entry*
FolderIndex::find(const std::string& id) const
{
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : &it->second;
}

std::optional<std::string>
FolderIndex::path_of(const std::string& id) const
{
    const Entry* entry = find(id);
    if (!entry)
        return std::nullopt;
    return entry->path;
}

}  // namespace cpak::pack
