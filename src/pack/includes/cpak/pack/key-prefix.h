#pragma once

#include "cpak/document/composite-key.h"

#include <string>
#include <string_view>

namespace cpak::pack {

/**
 * Collection and id paths of a node's parent, handed down the hierarchy by
 * the pack and unpack visitors. Empty for a primary document.
 */
struct KeyPrefix
{
    std::string collections;
    std::string ids;

    bool
    is_root() const
    {
        return collections.empty();
    }

    // Prefix of a node of `collection` with id `id` below this one
    KeyPrefix
    extend(std::string_view collection, std::string_view id) const
    {
        return {
            document::key_join({collections, collection}),
            document::key_join({ids, id})};
    }

    std::string
    key() const
    {
        return document::compose_key(collections, ids);
    }
};

}  // namespace cpak::pack
