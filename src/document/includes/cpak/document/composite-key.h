#pragma once

#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace cpak::document {

inline constexpr char KEY_SECTION_DELIMITER = '!';
inline constexpr char KEY_SEGMENT_DELIMITER = '.';

/**
 * Decomposed form of a composite key `!<collection-path>!<id-path>`.
 *
 * Both paths hold one segment per nesting level, root first:
 *   !actors.items.effects!a1.i1.e1
 *   collections = {actors, items, effects}, ids = {a1, i1, e1}
 */
struct CompositeKey
{
    std::vector<std::string> collections;
    std::vector<std::string> ids;

    // A primary record lives at the first level of the hierarchy
    bool
    is_primary() const
    {
        return collections.size() == 1;
    }

    // The collection of the node itself (the last segment)
    const std::string&
    collection() const
    {
        return collections.back();
    }

    const std::string&
    id() const
    {
        return ids.back();
    }

    std::string
    collection_path() const;

    std::string
    id_path() const;

    std::string
    str() const;

    // Key of an embedded node one level below this one
    CompositeKey
    child(std::string_view collection, std::string_view id) const;

    bool
    operator==(const CompositeKey& other) const = default;
};

/**
 * Join the non-empty parts with '.'.
 */
std::string
key_join(std::initializer_list<std::string_view> parts);

std::string
compose_key(std::string_view collection_path, std::string_view id_path);

// Segment form: one collection and one id per nesting level, root first
std::string
compose_key(
    const std::vector<std::string>& collections,
    const std::vector<std::string>& ids);

/**
 * Split a composite key into its collection and id segments.
 * @throws KeyError if the key is not of the form `!<path>!<path>` with the
 * same number of segments on both sides
 */
CompositeKey
decompose_key(std::string_view key);

}  // namespace cpak::document
