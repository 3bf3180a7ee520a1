#include <gtest/gtest.h>

#include "update/extension_registry.hpp"
#include "update/manifest_reader.hpp"
#include "testing.hpp"

#include <thread>
#include <vector>

namespace extupd {

namespace {

ExtensionDescriptor WithRange(const std::string& since, const std::string& until) {
    ExtensionDescriptor d;
    d.id = "foo";
    d.version = "1.0";
    d.since_build = since;
    d.until_build = until;
    return d;
}

BuildNumber Build(const char* text) {
    return *BuildNumber::Parse(text);
}

} // namespace

TEST(BuildRangeTest, InsideAndOutside) {
    EXPECT_FALSE(IsOutsideBuildRange(WithRange("141.0", "141.*"), Build("141.1234")));
    EXPECT_TRUE(IsOutsideBuildRange(WithRange("141.0", "141.*"), Build("142.1")));
    EXPECT_TRUE(IsOutsideBuildRange(WithRange("141.0", ""), Build("140.9")));
    EXPECT_FALSE(IsOutsideBuildRange(WithRange("", ""), Build("1.0")));
}

TEST(BuildRangeTest, UnparsableBoundsAreIgnored) {
    EXPECT_FALSE(IsOutsideBuildRange(WithRange("garbage", "also.garbage"), Build("141.1")));
    EXPECT_TRUE(IsOutsideBuildRange(WithRange("garbage", "140"), Build("141.1")));
}

TEST(BuildRangeTest, EmptyHostBuildMatchesEverything) {
    EXPECT_FALSE(IsOutsideBuildRange(WithRange("141.0", "141.1"), BuildNumber()));
}

TEST(BrokenListTest, LoadsFromFile) {
    testutil::TemporaryDirectory dir;
    testutil::WriteFile(dir.Sub("broken.json"), R"({"foo": ["1.0", "1.1"], "bar": []})");

    BrokenList list;
    auto res = BrokenList::LoadFromFile(dir.Sub("broken.json"), list);
    ASSERT_TRUE(res.is_ok()) << res.msg;
    EXPECT_EQ(list.Size(), 2u);
    EXPECT_TRUE(list.Contains("foo", "1.1"));
    EXPECT_FALSE(list.Contains("foo", "1.2"));
    EXPECT_FALSE(list.Contains("bar", "1.0"));
}

TEST(BrokenListTest, RejectsMalformedFiles) {
    testutil::TemporaryDirectory dir;
    BrokenList list;

    EXPECT_EQ(BrokenList::LoadFromFile(dir.Sub("missing.json"), list).kind, ErrorKind::IOFailure);

    testutil::WriteFile(dir.Sub("a.json"), "[]");
    EXPECT_EQ(BrokenList::LoadFromFile(dir.Sub("a.json"), list).kind, ErrorKind::ValidationFailure);

    testutil::WriteFile(dir.Sub("b.json"), R"({"foo": "1.0"})");
    EXPECT_EQ(BrokenList::LoadFromFile(dir.Sub("b.json"), list).kind, ErrorKind::ValidationFailure);

    testutil::WriteFile(dir.Sub("c.json"), R"({"foo": [1]})");
    EXPECT_EQ(BrokenList::LoadFromFile(dir.Sub("c.json"), list).kind, ErrorKind::ValidationFailure);
}

TEST(ExtensionRegistryTest, ScansExtensionsDirectory) {
    testutil::TemporaryDirectory dir;
    testutil::WriteFile(dir.Sub("foo/META-INF/plugin.json"), testutil::ManifestJson("foo", "1.0"));
    testutil::WriteFile(dir.Sub("bar.jar"), testutil::BuildRawPackage("bar", "2.1"));
    testutil::WriteFile(dir.Sub("notes.txt"), "not an extension");

    ExtensionRegistry registry;
    PackageManifestReader reader;
    ASSERT_TRUE(registry.ScanDirectory(dir.Path(), reader).is_ok());

    EXPECT_TRUE(registry.IsInstalled("foo"));
    EXPECT_TRUE(registry.IsInstalled("bar"));
    EXPECT_FALSE(registry.IsInstalled("notes"));

    auto bar = registry.GetInstalled("bar");
    ASSERT_TRUE(bar.has_value());
    EXPECT_EQ(bar->version, "2.1");
    EXPECT_EQ(bar->path, dir.Sub("bar.jar"));
}

TEST(ExtensionRegistryTest, MissingDirectoryIsEmpty) {
    testutil::TemporaryDirectory dir;
    ExtensionRegistry registry;
    PackageManifestReader reader;
    EXPECT_TRUE(registry.ScanDirectory(dir.Sub("nope"), reader).is_ok());
    EXPECT_FALSE(registry.IsInstalled("foo"));
}

TEST(ExtensionRegistryTest, SessionUpdatesAndBrokenReleases) {
    ExtensionRegistry registry;
    ExtensionDescriptor foo;
    foo.id = "foo";
    foo.version = "1.0";

    EXPECT_FALSE(registry.WasUpdatedThisSession("foo"));
    registry.MarkUpdated(foo);
    EXPECT_TRUE(registry.WasUpdatedThisSession("foo"));

    EXPECT_FALSE(registry.IsKnownBroken(foo));
    BrokenList broken;
    broken.Add("foo", "1.0");
    registry.SetBrokenList(std::move(broken));
    EXPECT_TRUE(registry.IsKnownBroken(foo));
}

TEST(ExtensionRegistryTest, ConcurrentReadersAndWriters) {
    ExtensionRegistry registry;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&registry, t] {
            for (int i = 0; i < 200; ++i) {
                ExtensionDescriptor d;
                d.id = "ext" + std::to_string(t) + "_" + std::to_string(i);
                d.version = "1.0";
                registry.AddInstalled(d);
                registry.MarkUpdated(d);
                (void)registry.IsInstalled(d.id);
                (void)registry.WasUpdatedThisSession(d.id);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_TRUE(registry.IsInstalled("ext3_199"));
    EXPECT_TRUE(registry.WasUpdatedThisSession("ext0_0"));
}

} // namespace extupd
