#include "cpak/core/errors.h"
#include "cpak/pack/compiler.h"
#include "cpak/store/memory-store.h"
#include "cpak/test-utils/test-utils.h"

#include <boost/json.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cpak;
using namespace cpak::pack;
namespace fs = boost::filesystem;

class CompilerTest : public ::testing::Test
{
protected:
    TempDir source_{"cpak-compile"};
    store::MemoryStore store_;

    void
    write_source(const std::string& name, const std::string& json)
    {
        write_text_file(source_ / name, json);
    }

    CompileResult
    compile(const CompileOptions& options = {})
    {
        return compile_pack(source_.path(), store_, options);
    }
};

TEST_F(CompilerTest, InlinesEmbeddedDocumentsUnderThePrimaryKey)
{
    write_source(
        "hero.json",
        R"({"_key": "!actors!abc", "_id": "abc", "name": "Hero",
            "items": [{"_id": "i1", "name": "Sword"}]})");

    auto result = compile();
    EXPECT_EQ(result.packed, 1u);
    EXPECT_EQ(store_.keys(), (std::vector<std::string>{"!actors!abc"}));
    EXPECT_FALSE(store_.get("!actors.items!abc.i1").has_value());

    auto value = store_.get("!actors!abc");
    ASSERT_TRUE(value.has_value());
    auto& actor = value->as_object();
    EXPECT_FALSE(actor.contains("_key"));
    EXPECT_EQ(actor.at("name").as_string(), "Hero");
    auto& items = actor.at("items").as_array();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].at("_id").as_string(), "i1");
    EXPECT_EQ(items[0].at("name").as_string(), "Sword");
}

TEST_F(CompilerTest, StripsEmbeddedKeysAndKeepsFieldOrder)
{
    write_source(
        "hero.json",
        R"({"_id": "abc", "items": [{"_id": "i1", "_key": "!actors.items!abc.i1",
            "effects": [{"_id": "e1", "_key": "!actors.items.effects!abc.i1.e1"}]}],
            "name": "Hero", "_key": "!actors!abc"})");
    compile();

    EXPECT_EQ(
        store_.get_raw("!actors!abc").value_or(""),
        R"({"_id":"abc","items":[{"_id":"i1","effects":[{"_id":"e1"}]}],"name":"Hero"})");
}

TEST_F(CompilerTest, DuplicateKeyAcrossFilesIsIntegrityError)
{
    write_source("a.json", R"({"_key": "!items!dup", "_id": "dup", "name": "A"})");
    write_source("b.json", R"({"_key": "!items!dup", "_id": "dup", "name": "B"})");

    try
    {
        compile();
        FAIL() << "expected an IntegrityError";
    }
    catch (const IntegrityError& e)
    {
        std::string message = e.what();
        EXPECT_NE(message.find("'!items!dup'"), std::string::npos);
        EXPECT_NE(message.find("b.json"), std::string::npos);
    }
    EXPECT_EQ(store_.write_count(), 0u);
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(CompilerTest, DuplicateEmbeddedIdIsIntegrityError)
{
    write_source(
        "hero.json",
        R"({"_key": "!actors!abc", "_id": "abc",
            "items": [{"_id": "i1"}, {"_id": "i1"}]})");
    EXPECT_THROW(compile(), IntegrityError);
    EXPECT_EQ(store_.write_count(), 0u);
}

TEST_F(CompilerTest, FailedRunLeavesStoreUnchanged)
{
    write_source("a.json", R"({"_key": "!items!a", "_id": "a"})");
    compile();
    ASSERT_EQ(store_.keys(), (std::vector<std::string>{"!items!a"}));

    write_source("b.json", "{ this is not json");
    EXPECT_THROW(compile(), ParseError);
    EXPECT_EQ(store_.write_count(), 1u);
    EXPECT_EQ(store_.keys(), (std::vector<std::string>{"!items!a"}));
}

TEST_F(CompilerTest, RemovesStaleKeys)
{
    write_source("a.json", R"({"_key": "!items!a", "_id": "a"})");
    write_source("b.json", R"({"_key": "!items!b", "_id": "b"})");
    compile();
    ASSERT_EQ(store_.size(), 2u);

    // A standalone embedded record written by another producer
    store::WriteBatch foreign;
    foreign.put("!items.effects!a.e1", boost::json::object{{"_id", "e1"}});
    store_.write(foreign);

    fs::remove(source_ / "b.json");
    auto result = compile();
    EXPECT_EQ(result.packed, 1u);
    EXPECT_EQ(result.removed, 2u);
    EXPECT_EQ(store_.keys(), (std::vector<std::string>{"!items!a"}));
}

TEST_F(CompilerTest, EmptySourceSetClearsTheStore)
{
    write_source("a.json", R"({"_key": "!items!a", "_id": "a"})");
    compile();
    fs::remove(source_ / "a.json");

    auto result = compile();
    EXPECT_EQ(result.removed, 1u);
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(CompilerTest, CompactsFirstToLastKey)
{
    write_source("b.json", R"({"_key": "!items!b", "_id": "b"})");
    write_source("a.json", R"({"_key": "!actors!a", "_id": "a"})");
    compile();

    ASSERT_EQ(store_.compactions().size(), 1u);
    EXPECT_EQ(store_.compactions()[0].first, "!actors!a");
    EXPECT_EQ(store_.compactions()[0].second, "!items!b");

    fs::remove(source_ / "a.json");
    fs::remove(source_ / "b.json");
    compile();
    // Nothing left to compact
    EXPECT_EQ(store_.compactions().size(), 1u);
}

TEST_F(CompilerTest, DiscardedEntriesReserveNoKey)
{
    write_source("a.json", R"({"_key": "!items!a", "_id": "a", "draft": true})");
    write_source("b.json", R"({"_key": "!items!a", "_id": "a", "draft": false})");

    CompileOptions options;
    options.transform_entry = [](document::Document& doc) {
        if (doc.fields().at("draft").as_bool())
            return EntryAction::DISCARD;
        doc.fields()["packed"] = true;
        return EntryAction::KEEP;
    };

    auto result = compile(options);
    EXPECT_EQ(result.packed, 1u);
    EXPECT_EQ(result.discarded, 1u);

    auto value = store_.get("!items!a");
    ASSERT_TRUE(value.has_value());
    EXPECT_FALSE(value->at("draft").as_bool());
    EXPECT_TRUE(value->at("packed").as_bool());
}

TEST_F(CompilerTest, TransformExceptionsAreWrapped)
{
    write_source("a.json", R"({"_key": "!items!a", "_id": "a"})");

    CompileOptions options;
    options.transform_entry = [](document::Document&) -> EntryAction {
        throw std::runtime_error("hook exploded");
    };

    try
    {
        compile(options);
        FAIL() << "expected a TransformError";
    }
    catch (const TransformError& e)
    {
        std::string message = e.what();
        EXPECT_NE(message.find("a.json"), std::string::npos);
        EXPECT_NE(message.find("hook exploded"), std::string::npos);
    }
}

TEST_F(CompilerTest, MissingOrEmbeddedKeyIsParseError)
{
    write_source("a.json", R"({"_id": "a"})");
    EXPECT_THROW(compile(), ParseError);

    fs::remove(source_ / "a.json");
    write_source("b.json", R"({"_key": "!actors.items!a.b", "_id": "b"})");
    EXPECT_THROW(compile(), ParseError);

    fs::remove(source_ / "b.json");
    write_source("c.json", R"([1, 2, 3])");
    EXPECT_THROW(compile(), ParseError);
}

TEST_F(CompilerTest, MisshapedEmbeddedFieldIsParseError)
{
    write_source(
        "a.json", R"({"_key": "!actors!a", "_id": "a", "items": {"_id": "x"}})");
    try
    {
        compile();
        FAIL() << "expected a ParseError";
    }
    catch (const ParseError& e)
    {
        EXPECT_NE(std::string(e.what()).find("a.json"), std::string::npos);
    }
}

TEST_F(CompilerTest, BareEmbeddedIdIsParseErrorAndKeepsStore)
{
    store::WriteBatch existing;
    existing.put("!actors!abc", boost::json::object{{"_id", "abc"}});
    existing.put(
        "!actors.items!abc.i1",
        boost::json::object{{"_id", "i1"}, {"name", "Sword"}});
    store_.write(existing);

    write_source(
        "hero.json", R"({"_key": "!actors!abc", "_id": "abc", "items": ["i1"]})");
    try
    {
        compile();
        FAIL() << "expected a ParseError";
    }
    catch (const ParseError& e)
    {
        std::string message = e.what();
        EXPECT_NE(message.find("hero.json"), std::string::npos);
        EXPECT_NE(message.find("'i1'"), std::string::npos);
    }

    EXPECT_EQ(store_.write_count(), 1u);
    EXPECT_EQ(
        store_.keys(),
        (std::vector<std::string>{"!actors!abc", "!actors.items!abc.i1"}));
}

TEST_F(CompilerTest, TransformMayNotChangeCollection)
{
    write_source(
        "a.json",
        R"({"_key": "!actors!a", "_id": "a", "items": [{"_id": "i"}]})");

    CompileOptions options;
    options.transform_entry = [](document::Document& doc) {
        doc.set_key("!items!a");
        return EntryAction::KEEP;
    };
    EXPECT_THROW(compile(options), ParseError);
    EXPECT_EQ(store_.write_count(), 0u);

    // Renaming within the collection is allowed
    options.transform_entry = [](document::Document& doc) {
        doc.set_key("!actors!b");
        return EntryAction::KEEP;
    };
    auto result = compile(options);
    EXPECT_EQ(result.packed, 1u);
    EXPECT_EQ(store_.keys(), (std::vector<std::string>{"!actors!b"}));
}

TEST_F(CompilerTest, RecursiveAndYamlSources)
{
    write_source("top.yml", "_key: '!macros!m1'\n_id: m1\nname: Top\n");
    write_source("nested/deep.yaml", "_key: '!macros!m2'\n_id: m2\n");
    write_source("ignored.json", R"({"_key": "!macros!m3", "_id": "m3"})");

    CompileOptions options;
    options.format = document::Format::YAML;
    compile(options);
    EXPECT_EQ(store_.keys(), (std::vector<std::string>{"!macros!m1"}));

    options.recursive = true;
    compile(options);
    EXPECT_EQ(
        store_.keys(), (std::vector<std::string>{"!macros!m1", "!macros!m2"}));
    EXPECT_EQ(store_.get("!macros!m1")->at("name").as_string(), "Top");
}

TEST_F(CompilerTest, NedbIsConfigurationError)
{
    CompileOptions options;
    options.nedb = true;
    EXPECT_THROW(compile(options), ConfigurationError);
    EXPECT_EQ(store_.write_count(), 0u);

    TempDir out("cpak-compile-out");
    EXPECT_THROW(
        compile_pack(source_.path(), out / "pack", options),
        ConfigurationError);
    EXPECT_FALSE(fs::exists(out / "pack"));
}

TEST_F(CompilerTest, CompilesFixturePack)
{
    auto fixtures = fs::path(TestDataPath::get_path("pack/fixtures/actors"));

    CompileOptions options;
    options.recursive = true;
    auto result = compile_pack(fixtures, store_, options);

    EXPECT_EQ(result.packed, 3u);
    EXPECT_EQ(
        store_.keys(),
        (std::vector<std::string>{
            "!actors!abc", "!actors!gob1", "!folders!fold1"}));
    auto hero = store_.get("!actors!abc");
    ASSERT_TRUE(hero.has_value());
    auto& sword = hero->at("items").as_array()[0].as_object();
    EXPECT_FALSE(sword.contains("_key"));
    EXPECT_EQ(sword.at("system").at("weight").as_double(), 3.5);
}
