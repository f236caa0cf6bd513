#include "cpak/document/composite-key.h"
#include "cpak/core/errors.h"

#include <string>

namespace cpak::document {

namespace {

std::vector<std::string>
split_segments(std::string_view path)
{
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true)
    {
        auto pos = path.find(KEY_SEGMENT_DELIMITER, start);
        segments.emplace_back(path.substr(start, pos - start));
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }
    return segments;
}

std::string
join_segments(const std::vector<std::string>& segments)
{
    std::string joined;
    for (const auto& segment : segments)
    {
        if (segment.empty())
            continue;
        if (!joined.empty())
            joined += KEY_SEGMENT_DELIMITER;
        joined += segment;
    }
    return joined;
}

}  // namespace

std::string
CompositeKey::collection_path() const
{
    return join_segments(collections);
}

std::string
CompositeKey::id_path() const
{
    return join_segments(ids);
}

std::string
CompositeKey::str() const
{
    return compose_key(collections, ids);
}

CompositeKey
CompositeKey::child(std::string_view collection, std::string_view id) const
{
    CompositeKey key = *this;
    key.collections.emplace_back(collection);
    key.ids.emplace_back(id);
    return key;
}

std::string
key_join(std::initializer_list<std::string_view> parts)
{
    std::string joined;
    for (auto part : parts)
    {
        if (part.empty())
            continue;
        if (!joined.empty())
            joined += KEY_SEGMENT_DELIMITER;
        joined.append(part);
    }
    return joined;
}

std::string
compose_key(std::string_view collection_path, std::string_view id_path)
{
    std::string key;
    key.reserve(collection_path.size() + id_path.size() + 2);
    key += KEY_SECTION_DELIMITER;
    key.append(collection_path);
    key += KEY_SECTION_DELIMITER;
    key.append(id_path);
    return key;
}

std::string
compose_key(
    const std::vector<std::string>& collections,
    const std::vector<std::string>& ids)
{
    return compose_key(join_segments(collections), join_segments(ids));
}

CompositeKey
decompose_key(std::string_view key)
{
    if (key.empty() || key.front() != KEY_SECTION_DELIMITER)
    {
        throw KeyError(
            "'" + std::string(key) + "' does not start with '" +
            KEY_SECTION_DELIMITER + "'");
    }

    auto split = key.find(KEY_SECTION_DELIMITER, 1);
    if (split == std::string_view::npos)
    {
        throw KeyError("'" + std::string(key) + "' has no id section");
    }

    auto collection_path = key.substr(1, split - 1);
    auto id_path = key.substr(split + 1);
    if (collection_path.empty() || id_path.empty())
    {
        throw KeyError("'" + std::string(key) + "' has an empty section");
    }

    CompositeKey decomposed;
    decomposed.collections = split_segments(collection_path);
    decomposed.ids = split_segments(id_path);
    if (decomposed.collections.size() != decomposed.ids.size())
    {
        throw KeyError(
            "'" + std::string(key) + "' has " +
            std::to_string(decomposed.collections.size()) +
            " collection segments but " +
            std::to_string(decomposed.ids.size()) + " id segments");
    }
    return decomposed;
}

}  // namespace cpak::document
