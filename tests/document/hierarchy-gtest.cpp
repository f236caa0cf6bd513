#include "cpak/document/hierarchy.h"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace cpak::document;

namespace {

std::vector<std::string>
field_names(std::string_view collection)
{
    std::vector<std::string> names;
    for (const auto& field : embedded_fields(collection))
        names.emplace_back(field.name);
    return names;
}

}  // namespace

TEST(Hierarchy, ActorEmbedsItemsThenEffects)
{
    EXPECT_EQ(
        field_names("actors"), (std::vector<std::string>{"items", "effects"}));
    for (const auto& field : embedded_fields("actors"))
        EXPECT_TRUE(field.is_collection());
}

TEST(Hierarchy, SceneEmbedsPlaceables)
{
    EXPECT_EQ(
        field_names("scenes"),
        (std::vector<std::string>{
            "drawings",
            "tokens",
            "lights",
            "notes",
            "regions",
            "sounds",
            "templates",
            "tiles",
            "walls"}));
}

TEST(Hierarchy, TokenDeltaIsSingular)
{
    auto field = find_embedded_field("tokens", "delta");
    ASSERT_NE(field, nullptr);
    EXPECT_EQ(field->kind, EmbeddedKind::SINGULAR);
    EXPECT_FALSE(field->is_collection());
}

TEST(Hierarchy, DeltaEmbedsLikeAnActor)
{
    EXPECT_EQ(
        field_names("delta"), (std::vector<std::string>{"items", "effects"}));
}

TEST(Hierarchy, RemainingTable)
{
    EXPECT_EQ(field_names("cards"), (std::vector<std::string>{"cards"}));
    EXPECT_EQ(
        field_names("combats"), (std::vector<std::string>{"combatants"}));
    EXPECT_EQ(field_names("items"), (std::vector<std::string>{"effects"}));
    EXPECT_EQ(
        field_names("journal"),
        (std::vector<std::string>{"pages", "categories"}));
    EXPECT_EQ(field_names("playlists"), (std::vector<std::string>{"sounds"}));
    EXPECT_EQ(field_names("regions"), (std::vector<std::string>{"behaviors"}));
    EXPECT_EQ(field_names("tables"), (std::vector<std::string>{"results"}));
}

TEST(Hierarchy, UnlistedCollectionsEmbedNothing)
{
    EXPECT_TRUE(embedded_fields("macros").empty());
    EXPECT_TRUE(embedded_fields("folders").empty());
    EXPECT_TRUE(embedded_fields("effects").empty());
    EXPECT_EQ(find_embedded_field("macros", "items"), nullptr);
    EXPECT_EQ(find_embedded_field("actors", "pages"), nullptr);
}

TEST(Hierarchy, DocumentTypeTable)
{
    EXPECT_EQ(document_types().size(), 15u);
    EXPECT_EQ(collection_for_type("Actor").value_or(""), "actors");
    EXPECT_EQ(collection_for_type("ChatMessage").value_or(""), "messages");
    EXPECT_EQ(collection_for_type("FogExploration").value_or(""), "fog");
    EXPECT_EQ(collection_for_type("JournalEntry").value_or(""), "journal");
    EXPECT_EQ(collection_for_type("RollTable").value_or(""), "tables");
    EXPECT_EQ(collection_for_type("Folder").value_or(""), "folders");
    EXPECT_FALSE(collection_for_type("actor").has_value());
    EXPECT_FALSE(collection_for_type("Spaceship").has_value());
}
