#include <gtest/gtest.h>
#include <filesystem>
#include "storage/path_resolver.hpp"
#include "storage/storage_error.hpp"
#include "test_utils.hpp"

using namespace vault::storage;
namespace fs = std::filesystem;

class PathResolverTest : public ::testing::Test {
protected:
  TempDir temp{"resolver_test"};
  std::unique_ptr<PathResolver> resolver;

  void SetUp() override {
    init_test_logging();
    resolver = std::make_unique<PathResolver>(temp.path());
  }

  fs::path client_dir(const std::string& client) const {
    return resolver->root() / client;
  }
};

TEST_F(PathResolverTest, ResolvesFlatFile) {
  write_file(client_dir("c1") / "flat.txt", "x");
  EXPECT_EQ(resolver->resolve("c1", "flat.txt").string(), (client_dir("c1") / "flat.txt").string());
}

TEST_F(PathResolverTest, ResolvesExplicitOwnerReference) {
  write_file(client_dir("c1") / "u42" / "doc.txt", "x");
  EXPECT_EQ(resolver->resolve("c1", "u42/doc.txt").string(), (client_dir("c1") / "u42" / "doc.txt").string());
}

TEST_F(PathResolverTest, FallsBackToOwnerDirectoriesForBareName) {
  write_file(client_dir("c1") / "u42" / "doc.txt", "x");
  EXPECT_EQ(resolver->resolve("c1", "doc.txt").string(), (client_dir("c1") / "u42" / "doc.txt").string());
}

TEST_F(PathResolverTest, FlatLayoutWinsOverOwnerLayout) {
  write_file(client_dir("c1") / "doc.txt", "flat");
  write_file(client_dir("c1") / "u42" / "doc.txt", "owned");
  EXPECT_EQ(resolver->resolve("c1", "doc.txt").string(), (client_dir("c1") / "doc.txt").string());
}

TEST_F(PathResolverTest, OwnerFallbackPicksFirstOwnerInLexicalOrder) {
  write_file(client_dir("c1") / "zed" / "doc.txt", "z");
  write_file(client_dir("c1") / "alice" / "doc.txt", "a");
  EXPECT_EQ(resolver->resolve("c1", "doc.txt").string(), (client_dir("c1") / "alice" / "doc.txt").string());
}

TEST_F(PathResolverTest, MissingFileIsNotFound) {
  EXPECT_THROW(resolver->resolve("c1", "nothing.txt"), NotFoundError);
  write_file(client_dir("c1") / "u1" / "a.txt", "x");
  EXPECT_THROW(resolver->resolve("c1", "nothing.txt"), NotFoundError);
  EXPECT_THROW(resolver->resolve("c1", "u2/a.txt"), NotFoundError);
  EXPECT_FALSE(resolver->try_resolve("c1", "nothing.txt").has_value());
}

TEST_F(PathResolverTest, DirectoriesAreNotFiles) {
  fs::create_directories(client_dir("c1") / "u1");
  EXPECT_THROW(resolver->resolve("c1", "u1"), NotFoundError);
}

TEST_F(PathResolverTest, TraversalIsInvalidArgumentNotNotFound) {
  write_file(temp.path() / "secret", "top secret");

  EXPECT_THROW(resolver->resolve("c1", "../secret"), InvalidArgumentError);
  EXPECT_THROW(resolver->resolve("c1", ".."), InvalidArgumentError);
  EXPECT_THROW(resolver->resolve("c1", "u1/../../secret"), InvalidArgumentError);
  EXPECT_THROW(resolver->resolve("c1", "/etc/passwd"), InvalidArgumentError);
  EXPECT_THROW(resolver->resolve("c1", "..\\secret"), InvalidArgumentError);
  EXPECT_THROW(resolver->resolve("c1", "a/b/c"), InvalidArgumentError);
  EXPECT_THROW(resolver->resolve("c1", "u1/"), InvalidArgumentError);
  EXPECT_THROW(resolver->resolve("c1", ""), InvalidArgumentError);
  EXPECT_THROW(resolver->resolve("..", "secret"), InvalidArgumentError);
  EXPECT_THROW(resolver->resolve("", "file"), InvalidArgumentError);
  EXPECT_THROW(resolver->resolve("a/b", "file"), InvalidArgumentError);
}

TEST_F(PathResolverTest, OwnerRootValidatesSegments) {
  EXPECT_EQ(resolver->owner_root("c1", "u42").string(), (client_dir("c1") / "u42").string());
  EXPECT_THROW(resolver->owner_root("c1", ".."), InvalidArgumentError);
  EXPECT_THROW(resolver->owner_root("c1", "a/b"), InvalidArgumentError);
  EXPECT_THROW(resolver->owner_root("c1", ".hidden"), InvalidArgumentError);
}

TEST_F(PathResolverTest, RelativeReferenceKeepsOwnerShape) {
  EXPECT_EQ(resolver->relative_reference("c1", client_dir("c1") / "u42" / "f.txt"), "u42/f.txt");
  EXPECT_EQ(resolver->relative_reference("c1", client_dir("c1") / "f.txt"), "f.txt");
  EXPECT_THROW(resolver->relative_reference("c1", client_dir("c2") / "f.txt"), InvalidArgumentError);
}
