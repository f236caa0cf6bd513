#include "cpak/document/document.h"
#include "cpak/core/errors.h"

#include <utility>

namespace cpak::document {

namespace {

EmbeddedEntry
make_entry(
    boost::json::value& value,
    const EmbeddedField& field,
    std::string_view parent)
{
    if (value.is_object())
    {
        return EmbeddedEntry(
            Document::from_json(std::move(value.as_object()), field.name));
    }
    if (value.is_string())
    {
        return EmbeddedEntry(Reference{value.as_string().c_str()});
    }
    throw SchemaError(
        "embedded '" + std::string(field.name) + "' of " + std::string(parent) +
        " must hold documents or ids, got " +
        boost::json::serialize(value));
}

}  // namespace

EmbeddedEntry::EmbeddedEntry(Document document)
    : value_(std::make_unique<Document>(std::move(document)))
{
}

EmbeddedEntry::EmbeddedEntry(Reference reference) : value_(std::move(reference))
{
}

EmbeddedEntry::EmbeddedEntry(EmbeddedEntry&&) noexcept = default;

EmbeddedEntry&
EmbeddedEntry::operator=(EmbeddedEntry&&) noexcept = default;

EmbeddedEntry::~EmbeddedEntry() = default;

Document&
EmbeddedEntry::document()
{
    return *std::get<std::unique_ptr<Document>>(value_);
}

const Document&
EmbeddedEntry::document() const
{
    return *std::get<std::unique_ptr<Document>>(value_);
}

std::string
EmbeddedEntry::id() const
{
    if (is_inline())
        return document().id();
    return std::get<Reference>(value_).id;
}

void
EmbeddedEntry::resolve(Document document)
{
    value_ = std::make_unique<Document>(std::move(document));
}

EmbeddedEntry
EmbeddedEntry::clone() const
{
    if (is_inline())
        return EmbeddedEntry(document().clone());
    return EmbeddedEntry(std::get<Reference>(value_));
}

Document
Document::from_json(boost::json::object object, std::string_view collection)
{
    Document doc;
    doc.collection_ = collection;

    auto id = object.if_contains(ID_FIELD);
    if (!id || !id->is_string())
    {
        throw SchemaError(
            "document in '" + std::string(collection) +
            "' has no string _id: " + boost::json::serialize(object));
    }

    for (const auto& field : embedded_fields(collection))
    {
        EmbeddedSlot slot{&field};
        auto it = object.find(field.name);
        if (it != object.end())
        {
            slot.present = true;
            auto& value = it->value();
            if (field.is_collection())
            {
                if (!value.is_array())
                {
                    throw SchemaError(
                        "embedded collection '" + std::string(field.name) +
                        "' of " + std::string(collection) +
                        " must be an array");
                }
                for (auto& element : value.as_array())
                {
                    slot.entries.push_back(
                        make_entry(element, field, collection));
                }
            }
            else if (!value.is_null())
            {
                slot.entries.push_back(make_entry(value, field, collection));
            }
            value = nullptr;
        }
        doc.slots_.push_back(std::move(slot));
    }

    doc.fields_ = std::move(object);
    return doc;
}

Document
Document::clone() const
{
    Document copy;
    copy.collection_ = collection_;
    copy.fields_ = fields_;
    copy.slots_.reserve(slots_.size());
    for (const auto& slot : slots_)
    {
        EmbeddedSlot slot_copy{slot.field, slot.present};
        slot_copy.entries.reserve(slot.entries.size());
        for (const auto& entry : slot.entries)
            slot_copy.entries.push_back(entry.clone());
        copy.slots_.push_back(std::move(slot_copy));
    }
    return copy;
}

boost::json::object
Document::to_json() const
{
    boost::json::object object = fields_;
    for (const auto& slot : slots_)
    {
        if (!slot.present)
            continue;

        auto entry_json = [](const EmbeddedEntry& entry) -> boost::json::value {
            if (entry.is_inline())
                return entry.document().to_json();
            return boost::json::string(entry.id());
        };

        if (slot.field->is_collection())
        {
            boost::json::array array;
            array.reserve(slot.entries.size());
            for (const auto& entry : slot.entries)
                array.push_back(entry_json(entry));
            object[slot.field->name] = std::move(array);
        }
        else if (slot.entries.empty())
        {
            object[slot.field->name] = nullptr;
        }
        else
        {
            object[slot.field->name] = entry_json(slot.entries.front());
        }
    }
    return object;
}

std::optional<std::string>
Document::string_field(std::string_view field) const
{
    auto value = fields_.if_contains(field);
    if (!value || !value->is_string())
        return std::nullopt;
    return std::string(value->as_string().c_str());
}

std::string
Document::id() const
{
    // from_json guarantees a string _id, but a transform hook may drop it
    auto id = string_field(ID_FIELD);
    if (!id)
    {
        throw SchemaError(
            "document in '" + collection_ + "' lost its string _id");
    }
    return *id;
}

std::optional<std::string>
Document::name() const
{
    auto name = string_field(NAME_FIELD);
    if (!name || name->empty())
        return std::nullopt;
    return name;
}

std::optional<std::string>
Document::folder() const
{
    auto folder = string_field(FOLDER_FIELD);
    if (!folder || folder->empty())
        return std::nullopt;
    return folder;
}

std::optional<std::string>
Document::key() const
{
    return string_field(KEY_FIELD);
}

void
Document::set_key(std::string key)
{
    fields_[KEY_FIELD] = std::move(key);
}

std::optional<std::string>
Document::take_key()
{
    auto key = string_field(KEY_FIELD);
    if (!fields_.contains(KEY_FIELD))
        return key;

    // object::erase moves the last member into the gap; rebuild instead so
    // the remaining fields keep their order
    boost::json::object rebuilt(fields_.storage());
    rebuilt.reserve(fields_.size() - 1);
    for (auto& member : fields_)
    {
        if (member.key() != KEY_FIELD)
            rebuilt.emplace(member.key(), std::move(member.value()));
    }
    fields_ = std::move(rebuilt);
    return key;
}

EmbeddedSlot*
Document::slot(std::string_view field)
{
    for (auto& slot : slots_)
    {
        if (slot.field->name == field)
            return &slot;
    }
    return nullptr;
}

const EmbeddedSlot*
Document::slot(std::string_view field) const
{
    for (const auto& slot : slots_)
    {
        if (slot.field->name == field)
            return &slot;
    }
    return nullptr;
}

}  // namespace cpak::document
