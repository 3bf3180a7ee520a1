#include <gtest/gtest.h>

#include "update/manifest_parser.hpp"
#include "update/manifest_reader.hpp"
#include "testing.hpp"

namespace extupd {

TEST(ManifestParserTest, ParsesFullManifest) {
    const std::string json = R"({
        "id": "org.example.foo",
        "name": "Foo",
        "version": "1.2",
        "description": "Does foo",
        "depends": ["org.example.bar", {"id": "org.example.baz"}],
        "compatibility": {"since_build": "141.0", "until_build": "141.*"}
    })";

    auto d = ManifestParser().Parse(json);
    ASSERT_TRUE(d.has_value()) << d.error();
    EXPECT_EQ(d->id, "org.example.foo");
    EXPECT_EQ(d->name, "Foo");
    EXPECT_EQ(d->version, "1.2");
    EXPECT_EQ(d->description, "Does foo");
    ASSERT_EQ(d->depends.size(), 2u);
    EXPECT_EQ(d->depends[0], "org.example.bar");
    EXPECT_EQ(d->depends[1], "org.example.baz");
    EXPECT_EQ(d->since_build, "141.0");
    EXPECT_EQ(d->until_build, "141.*");
}

TEST(ManifestParserTest, NameDoublesAsId) {
    auto d = ManifestParser().Parse(R"({"name": "Legacy", "version": "0.1"})");
    ASSERT_TRUE(d.has_value()) << d.error();
    EXPECT_EQ(d->id, "Legacy");
}

TEST(ManifestParserTest, RejectsBadInput) {
    ManifestParser parser;
    EXPECT_FALSE(parser.Parse("").has_value());
    EXPECT_FALSE(parser.Parse("[1,2]").has_value());
    EXPECT_FALSE(parser.Parse("{not json").has_value());
    EXPECT_FALSE(parser.Parse(R"({"version": "1.0"})").has_value());
    EXPECT_FALSE(parser.Parse(R"({"id": "x", "depends": "y"})").has_value());
    EXPECT_FALSE(parser.Parse(R"({"id": "x", "compatibility": "141"})").has_value());
}

class ManifestReaderTest : public ::testing::Test {
protected:
    testutil::TemporaryDirectory temp_dir;
    PackageManifestReader reader;
};

TEST_F(ManifestReaderTest, ReadsRawPackage) {
    const std::string jar = temp_dir.Sub("foo.jar");
    testutil::WriteFile(jar, testutil::BuildRawPackage("foo", "1.0"));

    auto d = reader.ReadManifest(jar);
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->id, "foo");
    EXPECT_EQ(d->version, "1.0");
    EXPECT_EQ(d->path, jar);
}

TEST_F(ManifestReaderTest, ReadsUnpackedDirectory) {
    testutil::WriteFile(temp_dir.Sub("foo/META-INF/plugin.json"), testutil::ManifestJson("foo", "2.0"));

    auto d = reader.ReadManifest(temp_dir.Sub("foo"));
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->version, "2.0");
    EXPECT_EQ(d->path, temp_dir.Sub("foo"));
}

TEST_F(ManifestReaderTest, ReadsPackageInsideLib) {
    testutil::WriteFile(temp_dir.Sub("foo/lib/aaa-util.jar"), testutil::BuildArchive({{"util/X.class", "x"}}));
    testutil::WriteFile(temp_dir.Sub("foo/lib/foo.jar"), testutil::BuildRawPackage("foo", "3.1"));

    auto d = reader.ReadManifest(temp_dir.Sub("foo"));
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->id, "foo");
    EXPECT_EQ(d->version, "3.1");
}

TEST_F(ManifestReaderTest, NothingForPlainFilesOrMissingPaths) {
    testutil::WriteFile(temp_dir.Sub("notes.txt"), "hello");
    EXPECT_FALSE(reader.ReadManifest(temp_dir.Sub("notes.txt")).has_value());
    EXPECT_FALSE(reader.ReadManifest(temp_dir.Sub("missing")).has_value());
    EXPECT_FALSE(reader.ReadManifest(temp_dir.Path()).has_value());
}

TEST_F(ManifestReaderTest, InvalidManifestIsIgnored) {
    testutil::WriteFile(temp_dir.Sub("foo/META-INF/plugin.json"), "{broken");
    EXPECT_FALSE(reader.ReadManifest(temp_dir.Sub("foo")).has_value());
}

} // namespace extupd
