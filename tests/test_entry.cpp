#include <gtest/gtest.h>
#include <deploy/entry.hpp>
#include <nlohmann/json.hpp>

TEST(EntryTest, ParsesFilesAndDirectories) {
    auto inv = parse_inventory(R"([
        {"path": "img", "type": "directory", "md5": false},
        {"path": "img/logo.png", "type": "file", "md5": "abc"}
    ])");
    ASSERT_TRUE(inv.is_ok()) << inv.error;
    ASSERT_EQ(inv.value.size(), 2u);
    EXPECT_EQ(inv.value[0], Entry::directory("img"));
    EXPECT_EQ(inv.value[1], Entry::file("img/logo.png", "abc"));
}

TEST(EntryTest, StripsLegacyLeadingSlash) {
    auto inv = parse_inventory(R"([{"path": "/css//site.css", "type": "file", "md5": "h"}])");
    ASSERT_TRUE(inv.is_ok());
    EXPECT_EQ(inv.value[0].path, "css/site.css");
}

TEST(EntryTest, RejectsMalformedInput) {
    EXPECT_TRUE(parse_inventory("{not json").is_err());
    EXPECT_TRUE(parse_inventory(R"({"revision": "r"})").is_err());
    EXPECT_TRUE(parse_inventory(R"([{"type": "file"}])").is_err());
    EXPECT_TRUE(parse_inventory(R"([{"path": "a", "type": "symlink"}])").is_err());
}

TEST(EntryTest, SerializedShape) {
    Inventory inv = {Entry::directory("img"), Entry::file("img/a.png", "h1")};
    auto j = nlohmann::json::parse(serialize_inventory(inv));

    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j[0]["type"], "directory");
    EXPECT_EQ(j[0]["md5"], false);
    EXPECT_EQ(j[1]["path"], "img/a.png");
    EXPECT_EQ(j[1]["md5"], "h1");

    auto list = nlohmann::json::parse(serialize_entry_list(inv));
    EXPECT_FALSE(list[1].contains("md5"));
    EXPECT_EQ(list[1]["type"], "file");
}
