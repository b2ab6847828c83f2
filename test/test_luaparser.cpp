#include "Errors.hpp"
#include "LuaParser.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

class LuaParserTest : public ::testing::Test {
 protected:
  fs::path scripts_dir_;
  fs::path scratch_dir_;

  static fs::path FindScriptsDir() {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (!ec) {
      auto dir = exe.parent_path();
      for (int i = 0; i < 8; ++i) {
        if (fs::exists(dir / "sample" / "scripts" / "common" / "init.lua"))
          return dir / "sample" / "scripts";
        dir = dir.parent_path();
      }
    }
    throw std::runtime_error("Could not locate scripts/common/init.lua");
  }

  void SetUp() override {
    scripts_dir_ = FindScriptsDir();
    scratch_dir_ = fs::temp_directory_path() /
                   ("rpgcrawler-lua-" + std::to_string(::getpid()));
    fs::create_directories(scratch_dir_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(scratch_dir_, ec);
  }

  void WriteScript(const std::string& feed, const std::string& source) {
    fs::create_directories(scratch_dir_ / feed);
    std::ofstream out(scratch_dir_ / feed / "init.lua");
    out << source;
  }
};

TEST_F(LuaParserTest, ParsesSpeedTowerRows) {
  SCOPED_TRACE("Extracts today's standings from the Speed Tower table.");
  RecordProperty("description",
                 "Two 'Today's #N' rows become objects with the trainer id "
                 "from the profile link and the floor and time columns.");

  LuaParser parser(scripts_dir_, "speedtower");
  ASSERT_TRUE(parser.HasScript());

  const std::string html = R"(
    <table>
      <tbody>
        <tr class="r0">
          <td>Today's #1</td>
          <td><a href="profile.php?id=3181487">the infinity stones</a></td><td>Team TPPC</td><td>45</td><td>00:40</td>
        </tr>
        <tr class="r1">
          <td>Today's #2</td>
          <td><a href="profile.php?id=3489027">Fried Shrimp</a></td><td>Team TPPC</td><td>46</td><td>01:16</td>
        </tr>
        <tr><td>Yesterday's #1</td><td>x</td><td>y</td><td>1</td><td>2</td></tr>
      </tbody>
    </table>
  )";

  nlohmann::json result_j =
    parser.Parse(html, "https://www.tppcrpg.net/speed_tower.php");
  ASSERT_TRUE(result_j.contains("rows"));
  const auto& rows = result_j.at("rows");
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].at("trainerId"), "3181487");
  EXPECT_EQ(rows[0].at("trainer"), "the infinity stones");
  EXPECT_EQ(rows[0].at("floor"), "45");
  EXPECT_EQ(rows[1].at("time"), "01:16");
}

TEST_F(LuaParserTest, ParsesSsAnneRanksTable) {
  SCOPED_TRACE("Reads the 'ranks' table and skips its header row.");
  RecordProperty("description",
                 "One ranked row becomes {rank, trainer, trainerId, faction, "
                 "wins}.");

  LuaParser parser(scripts_dir_, "ssanne");
  const std::string html = R"(
    <table class="ranks">
      <tbody>
        <tr><th>Standing</th><th>Trainer Name</th><th>Faction</th><th>Wins</th></tr>
        <tr class="r0">
          <td class="Team TPPC">1</td>
          <td class="Team TPPC"><a href="profile.php?id=3181487">the infinity stones</a></td>
          <td class="Team TPPC">Team TPPC</td>
          <td class="Team TPPC">28</td>
        </tr>
      </tbody>
    </table>
  )";

  nlohmann::json result_j = parser.Parse(html, "https://www.tppcrpg.net/");
  const nlohmann::json expected = {{"rank", "1"},
                                   {"trainer", "the infinity stones"},
                                   {"trainerId", "3181487"},
                                   {"faction", "Team TPPC"},
                                   {"wins", "28"}};
  ASSERT_EQ(result_j.at("rows").size(), 1u);
  EXPECT_EQ(result_j.at("rows")[0], expected);
}

TEST_F(LuaParserTest, EmptyResultsStayLists) {
  SCOPED_TRACE("A page without rows yields an empty list, not null.");
  RecordProperty("description",
                 "Parsing a page with no ranks table gives {\"rows\": []}.");

  LuaParser parser(scripts_dir_, "ssanne");
  nlohmann::json result_j =
    parser.Parse("<html><body>maintenance</body></html>", "");
  ASSERT_TRUE(result_j.at("rows").is_array());
  EXPECT_TRUE(result_j.at("rows").empty());
}

TEST_F(LuaParserTest, ReadsPowerPlantController) {
  SCOPED_TRACE("Finds the team named in the Power Plant notice.");
  RecordProperty("description",
                 "The <strong> text of the centered notice is the "
                 "controller; a page without it has none.");

  LuaParser parser(scripts_dir_, "powerplant");
  nlohmann::json found = parser.Parse(
    R"(<p class="center">The Power Plant is currently controlled by )"
    R"(<strong>Team Rocket</strong>.</p>)",
    "");
  EXPECT_EQ(found.at("controller"), "Team Rocket");
  EXPECT_EQ(found.at("found"), true);

  nlohmann::json missing = parser.Parse("<p class=\"center\">Closed</p>", "");
  EXPECT_FALSE(missing.contains("controller"));
}

TEST_F(LuaParserTest, MissingScriptIsParseError) {
  SCOPED_TRACE("A feed without init.lua has no parser.");
  RecordProperty("description",
                 "HasScript() is false and Parse throws ParseError.");

  LuaParser parser(scripts_dir_, "no_such_feed");
  EXPECT_FALSE(parser.HasScript());
  EXPECT_THROW(parser.Parse("<html></html>", ""), ParseError);
}

TEST_F(LuaParserTest, ScriptFailuresAreParseErrors) {
  SCOPED_TRACE("Runtime errors and non-table results are reported.");
  RecordProperty("description",
                 "A script that calls error() and one that returns a string "
                 "both raise ParseError; one with a syntax error never "
                 "loads.");

  WriteScript("raises", "function parse(content, url) error('bad row') end");
  WriteScript("stringy", "function parse(content, url) return 'rows' end");
  WriteScript("broken", "function parse(content, url) return {");

  LuaParser raises(scratch_dir_, "raises");
  ASSERT_TRUE(raises.HasScript());
  EXPECT_THROW(raises.Parse("x", ""), ParseError);

  LuaParser stringy(scratch_dir_, "stringy");
  EXPECT_THROW(stringy.Parse("x", ""), ParseError);

  LuaParser broken(scratch_dir_, "broken");
  EXPECT_FALSE(broken.HasScript());
}

TEST_F(LuaParserTest, ConvertsLuaValues) {
  SCOPED_TRACE("Lua numbers, booleans, lists and maps map onto JSON.");
  RecordProperty("description",
                 "Whole numbers stay integers, fractions stay doubles, and "
                 "the url argument is passed through.");

  WriteScript("values", R"(
    function parse(content, url)
      return { count = 3, ratio = 0.5, ok = true, url = url,
               list = { "a", "b" }, nested = { depth = 2 } }
    end
  )");

  LuaParser parser(scratch_dir_, "values");
  nlohmann::json j = parser.Parse("", "https://www.tppcrpg.net/x.php");
  EXPECT_TRUE(j.at("count").is_number_integer());
  EXPECT_EQ(j.at("count"), 3);
  EXPECT_DOUBLE_EQ(j.at("ratio").get<double>(), 0.5);
  EXPECT_EQ(j.at("ok"), true);
  EXPECT_EQ(j.at("url"), "https://www.tppcrpg.net/x.php");
  EXPECT_EQ(j.at("list"), nlohmann::json::array({"a", "b"}));
  EXPECT_EQ(j.at("nested").at("depth"), 2);
}
