#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "assistant.hpp"
#include "cli.hpp"
#include "test_fixtures.hpp"

class RunCliTest : public TempDirTest
{
protected:
    int RunWith(std::vector<std::string> args, bool confirm_answer = false)
    {
        args.insert(args.begin(), "nflz");
        std::vector<const char *> argv;
        for (const auto &arg : args)
        {
            argv.push_back(arg.c_str());
        }

        auto confirm = [this, confirm_answer](const nflz::Assistant &assistant)
        {
            ++confirm_calls;
            confirmed_count = assistant.FilesToRename().size();
            return confirm_answer;
        };

        out.str("");
        err.str("");
        return nflz::RunCli(static_cast<int>(argv.size()), argv.data(), confirm, out, err);
    }

    std::string Dir() const { return tempTestDir.string(); }

    std::ostringstream out;
    std::ostringstream err;
    int confirm_calls = 0;
    std::size_t confirmed_count = 0;
};

TEST_F(RunCliTest, EmptyDirectory)
{
    EXPECT_EQ(RunWith({Dir()}), nflz::kExitOk);
    EXPECT_EQ(confirm_calls, 0);
    EXPECT_TRUE(err.str().empty());
}

TEST_F(RunCliTest, AlreadyPadded)
{
    CreateDummyFiles({"img (4).jpg", "img (5).jpg", "notes.txt"});

    EXPECT_EQ(RunWith({Dir()}), nflz::kExitOk);
    EXPECT_EQ(confirm_calls, 0);
    EXPECT_NE(out.str().find("2 个文件都已经是正确的名字"), std::string::npos);
}

TEST_F(RunCliTest, AmbiguousPrefixRenamesNothing)
{
    CreateDummyFiles({"img (1).jpg", "IMG (20).jpg"});

    EXPECT_EQ(RunWith({"--yes", Dir()}), nflz::kExitFailure);
    EXPECT_TRUE(Exists("img (1).jpg"));
    EXPECT_FALSE(Exists("img (01).jpg"));
    EXPECT_TRUE(Exists("IMG (20).jpg"));
    EXPECT_FALSE(err.str().empty());
}

TEST_F(RunCliTest, ConflictListsPaths)
{
    CreateDummyFile("img (1).jpg", "one");
    CreateDummyFile("img (01).jpg", "existing");
    CreateDummyFile("img (10).jpg", "ten");

    EXPECT_EQ(RunWith({"-y", Dir()}), nflz::kExitFailure);
    EXPECT_NE(err.str().find("  • " + (tempTestDir / "img (01).jpg").string()), std::string::npos);
    EXPECT_EQ(ReadFile("img (1).jpg"), "one");
    EXPECT_EQ(ReadFile("img (01).jpg"), "existing");
}

TEST_F(RunCliTest, UnreadableDirectory)
{
    EXPECT_EQ(RunWith({(tempTestDir / "missing").string()}), nflz::kExitFailure);
    EXPECT_FALSE(err.str().empty());
}

TEST_F(RunCliTest, BadOption)
{
    CreateDummyFiles({"img (1).jpg", "img (10).jpg"});

    EXPECT_EQ(RunWith({"--bogus", Dir()}), nflz::kExitUsage);
    EXPECT_NE(err.str().find("未知选项：--bogus"), std::string::npos);
    EXPECT_NE(err.str().find("用法: nflz"), std::string::npos);
    EXPECT_TRUE(Exists("img (1).jpg"));
}

TEST_F(RunCliTest, TwoDirectories)
{
    EXPECT_EQ(RunWith({Dir(), Dir()}), nflz::kExitUsage);
}

TEST_F(RunCliTest, HelpAndVersion)
{
    EXPECT_EQ(RunWith({"--help"}), nflz::kExitOk);
    EXPECT_NE(out.str().find("用法: nflz"), std::string::npos);

    EXPECT_EQ(RunWith({"--version"}), nflz::kExitOk);
    EXPECT_EQ(out.str(), std::string("nflz ") + NFLZ_VERSION + "\n");
}

TEST_F(RunCliTest, DryRunLeavesDirectoryUnchanged)
{
    CreateDummyFiles(ParisFilenames());

    EXPECT_EQ(RunWith({"--dry-run", Dir()}, true), nflz::kExitOk);
    EXPECT_EQ(confirm_calls, 0);
    EXPECT_NE(out.str().find("paris (1).jpg -> paris (001).jpg"), std::string::npos);
    EXPECT_TRUE(Exists("paris (1).jpg"));
    EXPECT_FALSE(Exists("paris (001).jpg"));
}

TEST_F(RunCliTest, CancelLeavesDirectoryUnchanged)
{
    CreateDummyFiles(ParisFilenames());

    EXPECT_EQ(RunWith({Dir()}, false), nflz::kExitOk);
    EXPECT_EQ(confirm_calls, 1);
    EXPECT_EQ(confirmed_count, 10u);
    EXPECT_TRUE(Exists("paris (1).jpg"));
    EXPECT_FALSE(Exists("paris (001).jpg"));
}

TEST_F(RunCliTest, ConfirmRenames)
{
    CreateDummyFiles(ParisFilenames());

    EXPECT_EQ(RunWith({Dir()}, true), nflz::kExitOk);
    EXPECT_EQ(confirm_calls, 1);
    EXPECT_TRUE(Exists("paris (001).jpg"));
    EXPECT_TRUE(Exists("paris (010).jpg"));
    EXPECT_FALSE(Exists("paris (1).jpg"));
    EXPECT_TRUE(Exists("invalid (100) (19231).jpg"));

    // 第二次运行无需操作
    EXPECT_EQ(RunWith({Dir()}, true), nflz::kExitOk);
    EXPECT_EQ(confirm_calls, 1);
}

TEST_F(RunCliTest, AssumeYesSkipsConfirmation)
{
    CreateDummyFiles({"img (1).jpg", "img (10).jpg"});

    EXPECT_EQ(RunWith({"-y", Dir()}), nflz::kExitOk);
    EXPECT_EQ(confirm_calls, 0);
    EXPECT_TRUE(Exists("img (01).jpg"));
    EXPECT_TRUE(Exists("img (10).jpg"));
}
