#pragma once

#include "cpak/core/logger.h"
#include "cpak/pack/transforms.h"
#include "cpak/store/store.h"

#include <optional>
#include <string>
#include <unordered_map>

namespace cpak::pack {

/**
 * Map from folder id to the directory an extracted document of that folder
 * is written under.
 *
 * Built in one pass over the `!folders` records of a store. A folder's path
 * is the names of its ancestors joined from the root down to itself; a
 * missing or unknown parent ends the chain.
 */
class FolderIndex
{
public:
    struct Entry
    {
        std::string name;                   // directory name of this folder
        std::optional<std::string> parent;  // declared parent folder id
        std::string path;                   // relative path, root first
    };

    FolderIndex() = default;

    /**
     * Collect and resolve every folder record of the store.
     * @throws IntegrityError if parent references form a cycle
     */
    static FolderIndex
    build(store::Store& store, const FolderNameTransform& transform_name = {});

    /**
     * Add one folder record. Paths are not valid until resolve() is called.
     */
    void
    add(const std::string& id,
        std::string name,
        std::optional<std::string> parent);

    /**
     * Compute the path of every folder.
     * @throws IntegrityError naming a folder whose ancestry loops
     */
    void
    resolve();

    const Entry*
    find(const std::string& id) const;

    bool
    contains(const std::string& id) const
    {
        return entries_.count(id) != 0;
    }

    // Relative path of a folder, if it is known
    std::optional<std::string>
    path_of(const std::string& id) const;

    std::size_t
    size() const
    {
        return entries_.size();
    }

    bool
    empty() const
    {
        return entries_.empty();
    }

private:
    inline static LogPartition log_partition_{"FOLDERS", LogLevel::INHERIT};

    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace cpak::pack
