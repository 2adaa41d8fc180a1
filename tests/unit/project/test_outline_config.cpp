#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "hh_outline/project/outline_config.hpp"

using namespace hh_outline;
namespace fs = std::filesystem;

namespace
{

class TempDir
{
public:
  TempDir()
  {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = fs::temp_directory_path() / ("hh_outline_test_" + std::to_string(stamp));
    fs::create_directories(path_);
  }
  ~TempDir()
  {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  [[nodiscard]] const fs::path & path() const { return path_; }

private:
  fs::path path_;
};

void write_file(const fs::path & p, const std::string & content)
{
  std::ofstream out(p);
  out << content;
}

}  // namespace

TEST(ProjectOutlineConfig, EmptyDocumentUsesDefaults)
{
  const auto result = load_outline_config_from_string("");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.output.format, OutputFormat::Json);
  EXPECT_EQ(result.config.output.indent, -1);
  EXPECT_EQ(result.config.output.color, ColorMode::Auto);
}

TEST(ProjectOutlineConfig, ParsesOutputSection)
{
  const auto result = load_outline_config_from_string(
    "output:\n"
    "  format: legacy\n"
    "  indent: 2\n"
    "  color: never\n",
    "/work");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.output.format, OutputFormat::Legacy);
  EXPECT_EQ(result.config.output.indent, 2);
  EXPECT_EQ(result.config.output.color, ColorMode::Never);
  EXPECT_EQ(result.config.config_root, fs::path("/work"));
}

TEST(ProjectOutlineConfig, RejectsUnknownFormat)
{
  const auto result = load_outline_config_from_string("output:\n  format: xml\n");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "invalid output.format: 'xml' (must be 'json', 'legacy' or 'text')");
}

TEST(ProjectOutlineConfig, RejectsUnknownColor)
{
  const auto result = load_outline_config_from_string("output:\n  color: sometimes\n");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("output.color"), std::string::npos);
}

TEST(ProjectOutlineConfig, RejectsNegativeIndent)
{
  const auto result = load_outline_config_from_string("output:\n  indent: -4\n");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("output.indent"), std::string::npos);
}

TEST(ProjectOutlineConfig, RejectsNonIntegerIndent)
{
  const auto result = load_outline_config_from_string("output:\n  indent: wide\n");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("invalid configuration value"), std::string::npos);
}

TEST(ProjectOutlineConfig, RejectsNonMapRootAndSection)
{
  EXPECT_FALSE(load_outline_config_from_string("- a\n- b\n").success);
  EXPECT_FALSE(load_outline_config_from_string("output: 3\n").success);
}

TEST(ProjectOutlineConfig, MalformedYamlFails)
{
  const auto result = load_outline_config_from_string("output: [unclosed\n");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("failed to parse YAML"), std::string::npos);
}

TEST(ProjectOutlineConfig, ParseEnumsFromText)
{
  EXPECT_EQ(parse_output_format("text"), OutputFormat::Text);
  EXPECT_FALSE(parse_output_format("TEXT").has_value());
  EXPECT_EQ(parse_color_mode("always"), ColorMode::Always);
  EXPECT_FALSE(parse_color_mode("").has_value());
}

TEST(ProjectOutlineConfig, LoadFromFileAndSearchUpward)
{
  const TempDir tmp;
  const fs::path nested = tmp.path() / "src" / "deep";
  fs::create_directories(nested);
  write_file(tmp.path() / k_outline_config_file_name, "output:\n  format: text\n");
  write_file(nested / "a.php", "<?hh\n");

  const auto found = find_outline_config(nested / "a.php");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(tmp.path() / k_outline_config_file_name));

  const auto result = load_outline_config(*found);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.output.format, OutputFormat::Text);
  EXPECT_EQ(fs::canonical(result.config.config_root), fs::canonical(tmp.path()));
}

TEST(ProjectOutlineConfig, MissingFileFails)
{
  const TempDir tmp;
  const auto result = load_outline_config(tmp.path() / "nope.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("configuration file not found"), std::string::npos);
}
