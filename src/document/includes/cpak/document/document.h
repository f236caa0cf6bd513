#pragma once

#include "cpak/document/hierarchy.h"

#include <boost/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace cpak::document {

inline constexpr std::string_view ID_FIELD = "_id";
inline constexpr std::string_view KEY_FIELD = "_key";
inline constexpr std::string_view NAME_FIELD = "name";
inline constexpr std::string_view FOLDER_FIELD = "folder";

class Document;

// An embedded document known only by its id
struct Reference
{
    std::string id;
};

/**
 * One element of an embedded slot: either the embedded document itself or
 * a reference that has to be resolved against the store.
 */
class EmbeddedEntry
{
public:
    explicit EmbeddedEntry(Document document);
    explicit EmbeddedEntry(Reference reference);

    EmbeddedEntry(EmbeddedEntry&&) noexcept;
    EmbeddedEntry&
    operator=(EmbeddedEntry&&) noexcept;
    ~EmbeddedEntry();

    bool
    is_inline() const
    {
        return std::holds_alternative<std::unique_ptr<Document>>(value_);
    }

    bool
    is_reference() const
    {
        return std::holds_alternative<Reference>(value_);
    }

    Document&
    document();

    const Document&
    document() const;

    // Id of the inline document, or the referenced id
    std::string
    id() const;

    // Replace a reference by the document it points to
    void
    resolve(Document document);

    EmbeddedEntry
    clone() const;

private:
    std::variant<std::unique_ptr<Document>, Reference> value_;
};

/**
 * The embedded documents a node holds under one schema field.
 * A singular slot holds zero or one entries.
 */
struct EmbeddedSlot
{
    const EmbeddedField* field;

    // Whether the field appeared in the source (a null singular counts)
    bool present = false;

    std::vector<EmbeddedEntry> entries;
};

/**
 * A node of the document hierarchy.
 *
 * Own fields are kept in a JSON object in their authored order; fields the
 * hierarchy schema declares as embedded are lifted into typed slots and
 * only a placeholder stays behind in the object so to_json() can restore
 * the original field order.
 *
 * Documents are move-only. clone() is the one way to obtain an independent
 * copy.
 */
class Document
{
public:
    /**
     * Build a document of the given collection, validating every embedded
     * field against the hierarchy schema.
     * @throws SchemaError on a missing `_id` or a mis-shaped embedded field
     */
    static Document
    from_json(boost::json::object object, std::string_view collection);

    Document(Document&&) noexcept = default;
    Document&
    operator=(Document&&) noexcept = default;
    Document(const Document&) = delete;
    Document&
    operator=(const Document&) = delete;

    Document
    clone() const;

    // Reassemble the full nested JSON object
    boost::json::object
    to_json() const;

    const std::string&
    collection() const
    {
        return collection_;
    }

    std::string
    id() const;

    // Non-empty string name, if any
    std::optional<std::string>
    name() const;

    // Parent folder id, if any
    std::optional<std::string>
    folder() const;

    std::optional<std::string>
    key() const;

    void
    set_key(std::string key);

    // Remove the in-band key and return it
    std::optional<std::string>
    take_key();

    boost::json::object&
    fields()
    {
        return fields_;
    }

    const boost::json::object&
    fields() const
    {
        return fields_;
    }

    std::vector<EmbeddedSlot>&
    slots()
    {
        return slots_;
    }

    const std::vector<EmbeddedSlot>&
    slots() const
    {
        return slots_;
    }

    EmbeddedSlot*
    slot(std::string_view field);

    const EmbeddedSlot*
    slot(std::string_view field) const;

private:
    Document() = default;

    std::optional<std::string>
    string_field(std::string_view field) const;

    std::string collection_;
    boost::json::object fields_;
    std::vector<EmbeddedSlot> slots_;
};

}  // namespace cpak::document
