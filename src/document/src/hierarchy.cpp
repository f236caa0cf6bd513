#include "cpak/document/hierarchy.h"

#include <array>
#include <cstddef>

namespace cpak::document {

namespace {

constexpr EmbeddedKind C = EmbeddedKind::COLLECTION;
constexpr EmbeddedKind S = EmbeddedKind::SINGULAR;

constexpr std::array<EmbeddedField, 2> ACTOR_FIELDS{
    {{"items", C}, {"effects", C}}};
constexpr std::array<EmbeddedField, 1> CARDS_FIELDS{{{"cards", C}}};
constexpr std::array<EmbeddedField, 1> COMBAT_FIELDS{{{"combatants", C}}};
constexpr std::array<EmbeddedField, 2> DELTA_FIELDS{
    {{"items", C}, {"effects", C}}};
constexpr std::array<EmbeddedField, 1> ITEM_FIELDS{{{"effects", C}}};
constexpr std::array<EmbeddedField, 2> JOURNAL_FIELDS{
    {{"pages", C}, {"categories", C}}};
constexpr std::array<EmbeddedField, 1> PLAYLIST_FIELDS{{{"sounds", C}}};
constexpr std::array<EmbeddedField, 1> REGION_FIELDS{{{"behaviors", C}}};
constexpr std::array<EmbeddedField, 1> TABLE_FIELDS{{{"results", C}}};
constexpr std::array<EmbeddedField, 1> TOKEN_FIELDS{{{"delta", S}}};
constexpr std::array<EmbeddedField, 9> SCENE_FIELDS{
    {{"drawings", C},
     {"tokens", C},
     {"lights", C},
     {"notes", C},
     {"regions", C},
     {"sounds", C},
     {"templates", C},
     {"tiles", C},
     {"walls", C}}};

struct HierarchyEntry
{
    std::string_view collection;
    std::span<const EmbeddedField> fields;
};

constexpr std::array<HierarchyEntry, 11> HIERARCHY{{
    {"actors", ACTOR_FIELDS},
    {"cards", CARDS_FIELDS},
    {"combats", COMBAT_FIELDS},
    {"delta", DELTA_FIELDS},
    {"items", ITEM_FIELDS},
    {"journal", JOURNAL_FIELDS},
    {"playlists", PLAYLIST_FIELDS},
    {"regions", REGION_FIELDS},
    {"tables", TABLE_FIELDS},
    {"tokens", TOKEN_FIELDS},
    {"scenes", SCENE_FIELDS},
}};

constexpr std::array<DocumentTypeEntry, 15> DOCUMENT_TYPES{{
    {"Actor", "actors"},
    {"Adventure", "adventures"},
    {"Cards", "cards"},
    {"ChatMessage", "messages"},
    {"Combat", "combats"},
    {"FogExploration", "fog"},
    {"Folder", "folders"},
    {"Item", "items"},
    {"JournalEntry", "journal"},
    {"Macro", "macros"},
    {"Playlist", "playlists"},
    {"RollTable", "tables"},
    {"Scene", "scenes"},
    {"Setting", "settings"},
    {"User", "users"},
}};

}  // namespace

std::span<const EmbeddedField>
embedded_fields(std::string_view collection)
{
    for (const auto& entry : HIERARCHY)
    {
        if (entry.collection == collection)
            return entry.fields;
    }
    return {};
}

const EmbeddedField*
find_embedded_field(std::string_view collection, std::string_view field)
{
    for (const auto& embedded : embedded_fields(collection))
    {
        if (embedded.name == field)
            return &embedded;
    }
    return nullptr;
}

std::span<const DocumentTypeEntry>
document_types()
{
    return DOCUMENT_TYPES;
}

std::optional<std::string_view>
collection_for_type(std::string_view document_type)
{
    for (const auto& entry : DOCUMENT_TYPES)
    {
        if (entry.type == document_type)
            return entry.collection;
    }
    return std::nullopt;
}

}  // namespace cpak::document
