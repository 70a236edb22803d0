// tests/driver/test_project_config.cpp - Unit tests for ivl.yaml handling
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "ivl/project/project_config.hpp"

using namespace ivl;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

}  // namespace

TEST(DriverProjectConfig, ParsesAllSections)
{
  const auto r = parse_project_config(
    "package:\n"
    "  name: demo\n"
    "  version: 1.2.3\n"
    "compiler:\n"
    "  entry_points: [src/a.bpl, b.bpl]\n"
    "  overlook_type_errors: true\n"
    "  extract_loops: yes\n",
    "/proj");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.package.name, "demo");
  EXPECT_EQ(r.config.package.version, "1.2.3");
  ASSERT_EQ(r.config.compiler.entry_points.size(), 2u);
  EXPECT_EQ(r.config.compiler.entry_points[0], std::filesystem::path("src/a.bpl"));
  EXPECT_TRUE(r.config.compiler.overlook_type_errors);
  EXPECT_TRUE(r.config.compiler.extract_loops);
  EXPECT_FALSE(r.config.compiler.print_resolved);
  EXPECT_EQ(r.config.project_root, std::filesystem::path("/proj"));
}

TEST(DriverProjectConfig, EmptyDocumentGivesDefaults)
{
  const auto r = parse_project_config("", "/proj");
  ASSERT_TRUE(r.success);
  EXPECT_TRUE(r.config.compiler.entry_points.empty());
  EXPECT_FALSE(r.config.compiler.extract_loops);
}

TEST(DriverProjectConfig, RejectsMalformedConfigurations)
{
  auto r = parse_project_config("- just\n- a list\n", "/proj");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "configuration root must be a map");

  r = parse_project_config("compiler:\n  entry_points: main.bpl\n", "/proj");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "compiler.entry_points must be a list");

  r = parse_project_config("compiler:\n  extract_loops: sometimes\n", "/proj");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, "compiler.extract_loops must be a boolean");

  r = parse_project_config("compiler: [unclosed\n", "/proj");
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error.rfind("failed to parse YAML", 0), 0u);
}

TEST(DriverProjectConfig, DefaultConfigRoundTrips)
{
  const std::string text = default_project_config("fresh");
  const auto r = parse_project_config(text, "/proj");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.package.name, "fresh");
  EXPECT_EQ(r.config.package.version, "0.1.0");
  ASSERT_EQ(r.config.compiler.entry_points.size(), 1u);
  EXPECT_EQ(r.config.compiler.entry_points[0], std::filesystem::path("src/main.bpl"));
  EXPECT_FALSE(r.config.compiler.overlook_type_errors);
  EXPECT_FALSE(r.config.compiler.print_resolved);
}

TEST(DriverProjectConfig, LoadAndFindOnDisk)
{
  namespace fs = std::filesystem;
  TempDir dir(fs::temp_directory_path() / "ivl_test_project_config");
  fs::create_directories(dir.path / "src" / "nested");
  {
    std::ofstream out(dir.path / k_project_config_file_name);
    out << "compiler:\n  entry_points: [src/main.bpl]\n  print_resolved: true\n";
  }

  const auto found = find_project_config(dir.path / "src" / "nested");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(dir.path / k_project_config_file_name));

  const auto r = load_project_config(*found);
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_TRUE(r.config.compiler.print_resolved);
  EXPECT_EQ(fs::canonical(r.config.project_root), fs::canonical(dir.path));

  const auto missing = load_project_config(dir.path / "absent.yaml");
  EXPECT_FALSE(missing.success);
  EXPECT_EQ(missing.error.rfind("configuration file not found", 0), 0u);
}
