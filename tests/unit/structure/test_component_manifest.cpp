// tests/unit/structure/test_component_manifest.cpp - Component manifest reader

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "ripple/basic/errors.hpp"
#include "ripple/structure/code_structure_provider.hpp"
#include "ripple/structure/component_manifest.hpp"

using namespace ripple;

namespace fs = std::filesystem;

namespace
{

std::vector<ComponentInfo> parse(const std::string & text)
{
  return ComponentManifestProvider::parse(text, "components.yaml");
}

std::string parse_error(const std::string & text)
{
  try {
    (void)parse(text);
  } catch (const CollaboratorError & e) {
    EXPECT_EQ(e.collaborator(), "component manifest");
    return e.what();
  }
  ADD_FAILURE() << "expected CollaboratorError";
  return {};
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = fs::temp_directory_path() / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

}  // namespace

TEST(ComponentManifest, ParsesComponentsInOrder)
{
  const auto components = parse(
    "components:\n"
    "  - name: Checkout\n"
    "    dependencies: [PaymentGateway, Inventory]\n"
    "  - name: PaymentGateway\n"
    "    dependencies:\n"
    "      - Ledger\n"
    "  - name: Inventory\n");

  ASSERT_EQ(components.size(), 3U);
  EXPECT_EQ(components[0].name, "Checkout");
  EXPECT_EQ(
    components[0].dependencies, (std::vector<std::string>{"PaymentGateway", "Inventory"}));
  EXPECT_EQ(components[1].name, "PaymentGateway");
  EXPECT_EQ(components[1].dependencies, (std::vector<std::string>{"Ledger"}));
  EXPECT_TRUE(components[2].dependencies.empty());
}

TEST(ComponentManifest, EmptyComponentList)
{
  EXPECT_TRUE(parse("components:\n").empty());
  EXPECT_TRUE(parse("components: []\n").empty());
}

TEST(ComponentManifest, NullDependenciesAreEmpty)
{
  const auto components = parse("components:\n  - name: A\n    dependencies:\n");
  ASSERT_EQ(components.size(), 1U);
  EXPECT_TRUE(components[0].dependencies.empty());
}

TEST(ComponentManifest, RejectsMissingComponentsKey)
{
  EXPECT_NE(parse_error("services: []\n").find("manifest must have a 'components' list"),
    std::string::npos);
  EXPECT_NE(parse_error("- A\n").find("manifest must have a 'components' list"),
    std::string::npos);
}

TEST(ComponentManifest, RejectsMalformedEntries)
{
  EXPECT_NE(
    parse_error("components: A\n").find("'components' must be a list"), std::string::npos);
  EXPECT_NE(
    parse_error("components:\n  - A\n").find("component entry must be a map"),
    std::string::npos);
  EXPECT_NE(
    parse_error("components:\n  - dependencies: [B]\n").find("must have a 'name'"),
    std::string::npos);
  EXPECT_NE(
    parse_error("components:\n  - name: A\n    dependencies: B\n")
      .find("'dependencies' of A must be a list"),
    std::string::npos);
  EXPECT_NE(
    parse_error("components:\n  - name: A\n    dependencies: [[B]]\n")
      .find("dependency names must be non-empty strings"),
    std::string::npos);
}

TEST(ComponentManifest, ErrorsCarryLocation)
{
  const std::string message = parse_error("components:\n  - name: A\n  - 42\n");
  EXPECT_EQ(message.rfind("components.yaml:3:", 0), 0U) << message;
}

TEST(ComponentManifest, RejectsInvalidYaml)
{
  EXPECT_NE(parse_error("components: [A\n").find("invalid YAML"), std::string::npos);
}

TEST(ComponentManifest, ReadsFromDisk)
{
  const fs::path dir = make_temp_dir("ripple_manifest");
  const fs::path file = dir / k_component_manifest_file_name;
  {
    std::ofstream out(file);
    out << "components:\n  - name: A\n    dependencies: [B]\n  - name: B\n";
  }

  ComponentManifestProvider provider(file);
  const auto components = provider.list_components();
  ASSERT_EQ(components.size(), 2U);
  EXPECT_EQ(components[0].dependencies, (std::vector<std::string>{"B"}));

  fs::remove_all(dir);
}

TEST(ComponentManifest, MissingFileThrows)
{
  ComponentManifestProvider provider(fs::temp_directory_path() / "ripple_no_such_manifest.yaml");
  EXPECT_THROW((void)provider.list_components(), CollaboratorError);
}

TEST(InMemoryStructureProvider, ReturnsCurrentComponents)
{
  InMemoryStructureProvider provider({{"A", {"B"}}});
  EXPECT_EQ(provider.list_components().size(), 1U);

  provider.set_components({{"A", {}}, {"B", {}}, {"C", {"A"}}});
  const auto components = provider.list_components();
  ASSERT_EQ(components.size(), 3U);
  EXPECT_EQ(components[2].dependencies, (std::vector<std::string>{"A"}));
}
