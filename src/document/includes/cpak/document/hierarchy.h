#pragma once

#include <optional>
#include <span>
#include <string_view>

namespace cpak::document {

inline constexpr std::string_view FOLDERS_COLLECTION = "folders";

enum class EmbeddedKind {
    COLLECTION,  // ordered sequence of embedded documents
    SINGULAR     // at most one embedded document
};

/**
 * One embedded field of a collection. The field name doubles as the
 * collection name of the documents it holds.
 */
struct EmbeddedField
{
    std::string_view name;
    EmbeddedKind kind;

    bool
    is_collection() const
    {
        return kind == EmbeddedKind::COLLECTION;
    }
};

/**
 * Embedded fields declared for a collection, in declaration order.
 * Collections without embedded documents yield an empty span.
 */
std::span<const EmbeddedField>
embedded_fields(std::string_view collection);

/**
 * Look up a single embedded field of a collection by name.
 * @return nullptr if the collection does not declare the field
 */
const EmbeddedField*
find_embedded_field(std::string_view collection, std::string_view field);

struct DocumentTypeEntry
{
    std::string_view type;        // e.g. "Actor"
    std::string_view collection;  // e.g. "actors"
};

/**
 * The primary document types a pack can hold.
 */
std::span<const DocumentTypeEntry>
document_types();

/**
 * Map a document type name to its collection name.
 * @return std::nullopt for unknown document types
 */
std::optional<std::string_view>
collection_for_type(std::string_view document_type);

}  // namespace cpak::document
