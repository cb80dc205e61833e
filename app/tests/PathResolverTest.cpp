#include <gtest/gtest.h>

#include "FakeFileSystem.hpp"
#include "PathResolver.hpp"

TEST(PathResolverTest, TemplateWithoutPlaceholdersIsVerbatim) {
    ResolvedDestination resolved = PathResolver::resolve("D:/sorted/static", nullptr);
    
    EXPECT_TRUE(resolved.resolved);
    EXPECT_EQ(resolved.folder, "D:/sorted/static");
}

TEST(PathResolverTest, ExpandsCapturesIntoFolder) {
    CaptureSet captures;
    captures.insert("label", "99999");
    captures.insert("id", "123456");
    
    ResolvedDestination resolved = PathResolver::resolve("D:/sorted/{label}/{id}", &captures);
    
    ASSERT_TRUE(resolved.resolved);
    EXPECT_EQ(resolved.folder, "D:/sorted/99999/123456");
}

TEST(PathResolverTest, SamePlaceholderTwice) {
    CaptureSet captures;
    captures.insert("year", "2025");
    
    ResolvedDestination resolved = PathResolver::resolve("/archive/{year}/backup-{year}", &captures);
    
    ASSERT_TRUE(resolved.resolved);
    EXPECT_EQ(resolved.folder, "/archive/2025/backup-2025");
}

TEST(PathResolverTest, ReservedCharactersInCapturesAreReplaced) {
    CaptureSet captures;
    captures.insert("label", "a:b/c");
    captures.insert("author", R"(x\y*z?"<>|)");
    
    ResolvedDestination resolved = PathResolver::resolve("/out/{label}/{author}", &captures);
    
    ASSERT_TRUE(resolved.resolved);
    EXPECT_EQ(resolved.folder, "/out/a_b_c/x_y_z_____");
}

TEST(PathResolverTest, DotOnlyCaptureCannotClimbOut) {
    EXPECT_EQ(PathResolver::sanitize_component(".."), "__");
    EXPECT_EQ(PathResolver::sanitize_component("v1.2"), "v1.2");
}

TEST(PathResolverTest, MissingCaptureIsUnresolved) {
    CaptureSet captures;
    captures.insert("label", "book");
    
    ResolvedDestination resolved = PathResolver::resolve("/out/{label}/{author}", &captures);
    
    EXPECT_FALSE(resolved.resolved);
    EXPECT_TRUE(resolved.reason.contains("author"));
}

TEST(PathResolverTest, EmptyCaptureIsUnresolved) {
    CaptureSet captures;
    captures.insert("label", "");
    
    ResolvedDestination resolved = PathResolver::resolve("/out/{label}", &captures);
    
    EXPECT_FALSE(resolved.resolved);
    EXPECT_TRUE(resolved.reason.contains("empty"));
}

TEST(PathResolverTest, PlaceholdersWithoutRegexFilterAreUnresolved) {
    ResolvedDestination resolved = PathResolver::resolve("/out/{label}", nullptr);
    
    EXPECT_FALSE(resolved.resolved);
    EXPECT_FALSE(resolved.reason.isEmpty());
}

TEST(PathResolverTest, PlaceholderDetection) {
    EXPECT_TRUE(PathResolver::has_placeholders("/out/{label}"));
    EXPECT_FALSE(PathResolver::has_placeholders("/out/plain"));
    EXPECT_FALSE(PathResolver::has_placeholders("/out/{}"));
    EXPECT_FALSE(PathResolver::has_placeholders("/out/{not valid}"));
    EXPECT_EQ(PathResolver::placeholder_names("/{a}/{b}/{a}"), QStringList({"a", "b"}));
}

TEST(PathResolverTest, EnsureFolderCreatesRecursively) {
    FakeFileSystem fs;
    PathResolver resolver(fs);
    
    EXPECT_TRUE(resolver.ensure_folder("/out/a/b/c").ok());
    EXPECT_TRUE(fs.is_directory("/out/a/b/c"));
    EXPECT_TRUE(fs.is_directory("/out/a"));
}

TEST(PathResolverTest, EnsureFolderReportsFailure) {
    FakeFileSystem fs;
    fs.make_path_errors.insert("/locked/out", FsErrorKind::PermissionDenied);
    PathResolver resolver(fs);
    
    FsStatus status = resolver.ensure_folder("/locked/out");
    EXPECT_EQ(status.kind, FsErrorKind::PermissionDenied);
}
