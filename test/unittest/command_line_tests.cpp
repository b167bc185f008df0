#include <configuration/command_line.h>
#include <configuration/config.h>
#include <cstdlib>
#include <filesystem>
#include <gtest/gtest.h>
#include <vector>

using cdpr::cfg::CommandLineRegistry;
using cdpr::cfg::CommandLineResult;
using cdpr::cfg::ParseErrorType;
using cdpr::cfg::RelayConfiguration;

struct ParsedCommandLine
{
  CommandLineRegistry mParser{};
  std::unique_ptr<RelayConfiguration> mConfig{RelayConfiguration::ConfigureWithParser(mParser)};
  CommandLineResult mResult{};

  explicit ParsedCommandLine(std::vector<const char *> args)
  {
    args.insert(args.begin(), "cdpr");
    mResult = mParser.Parse(static_cast<int>(args.size()), args.data());
  }
};

TEST(CommandLine, DefaultsWithoutArguments)
{
  ParsedCommandLine cli{{}};
  ASSERT_TRUE(cli.mResult.mErrors.empty());
  EXPECT_FALSE(cli.mResult.mExitRequested);
  const auto &config = *cli.mConfig;
  EXPECT_EQ(config.mApiPort, 8080);
  EXPECT_EQ(config.mProxyPort, 8888);
  EXPECT_EQ(config.mInspectPort, 9229);
  EXPECT_EQ(config.mInspectHost, "127.0.0.1");
  EXPECT_EQ(config.mBindAddress, "127.0.0.1");
  EXPECT_EQ(config.mDebuggeeExecutable, "node");
  EXPECT_FALSE(config.mBreakOnStart);
  EXPECT_EQ(config.CommandTimeout(), std::chrono::milliseconds{5000});
  EXPECT_EQ(config.HandshakeTimeout(), std::chrono::milliseconds{10000});
  EXPECT_EQ(config.KillGrace(), std::chrono::milliseconds{5000});
  EXPECT_EQ(config.mWorkspaceRoot, std::filesystem::current_path());
}

TEST(CommandLine, SeparateAndInlineValues)
{
  ParsedCommandLine cli{{"--port", "9000", "--proxy-port=9001", "--node", "/usr/bin/node", "--break-on-start"}};
  ASSERT_TRUE(cli.mResult.mErrors.empty());
  EXPECT_EQ(cli.mConfig->mApiPort, 9000);
  EXPECT_EQ(cli.mConfig->mProxyPort, 9001);
  EXPECT_EQ(cli.mConfig->mDebuggeeExecutable, "/usr/bin/node");
  EXPECT_TRUE(cli.mConfig->mBreakOnStart);
}

TEST(CommandLine, ShortNames)
{
  const auto tmp = std::filesystem::temp_directory_path().string();
  ParsedCommandLine cli{{"-p", "7000", "-w", tmp.c_str()}};
  ASSERT_TRUE(cli.mResult.mErrors.empty());
  EXPECT_EQ(cli.mConfig->mApiPort, 7000);
  EXPECT_EQ(cli.mConfig->mWorkspaceRoot, std::filesystem::path{tmp});
}

TEST(CommandLine, PortOutOfRange)
{
  ParsedCommandLine cli{{"--port", "70000"}};
  ASSERT_EQ(cli.mResult.mErrors.size(), 1);
  EXPECT_EQ(cli.mResult.mErrors.front().mError, ParseErrorType::PortOutOfRange);
}

TEST(CommandLine, MalformedNumber)
{
  ParsedCommandLine cli{{"--timeout", "5s"}};
  ASSERT_EQ(cli.mResult.mErrors.size(), 1);
  EXPECT_EQ(cli.mResult.mErrors.front().mError, ParseErrorType::InvalidFormat);
}

TEST(CommandLine, MissingValue)
{
  ParsedCommandLine cli{{"--inspect-port"}};
  ASSERT_EQ(cli.mResult.mErrors.size(), 1);
  EXPECT_EQ(cli.mResult.mErrors.front().mError, ParseErrorType::MissingArgValue);
}

TEST(CommandLine, UnknownArgumentIsReported)
{
  ParsedCommandLine cli{{"--frobnicate", "--port", "9000"}};
  ASSERT_EQ(cli.mResult.mErrors.size(), 1);
  EXPECT_EQ(cli.mResult.mErrors.front().mError, ParseErrorType::UnrecognizedArgument);
  // Parsing carries on after the bad argument.
  EXPECT_EQ(cli.mConfig->mApiPort, 9000);
}

TEST(CommandLine, WorkspaceMustExist)
{
  ParsedCommandLine cli{{"--workspace", "/this/directory/does/not/exist"}};
  ASSERT_EQ(cli.mResult.mErrors.size(), 1);
  EXPECT_EQ(cli.mResult.mErrors.front().mError, ParseErrorType::DirectoryDoesNotExist);
}

TEST(CommandLine, HelpRequestsExit)
{
  ParsedCommandLine cli{{"--help"}};
  EXPECT_TRUE(cli.mResult.mErrors.empty());
  EXPECT_TRUE(cli.mResult.mExitRequested);
}

TEST(CommandLine, LogEnvironmentVariableSelectsChannels)
{
  setenv("LOG", "relay, cdp,bogus", 1);
  ParsedCommandLine cli{{}};
  unsetenv("LOG");
  ASSERT_EQ(cli.mConfig->mLogChannels.size(), 2);
  EXPECT_EQ(cli.mConfig->mLogChannels[0], Channel::relay);
  EXPECT_EQ(cli.mConfig->mLogChannels[1], Channel::cdp);
}

TEST(CommandLine, LogAllOpensEveryChannel)
{
  setenv("LOG", "all", 1);
  ParsedCommandLine cli{{}};
  unsetenv("LOG");
  EXPECT_EQ(cli.mConfig->mLogChannels.size(), Enum<Channel>::Count());
}

TEST(CommandLine, NoLogEnvironmentVariableMeansAllChannels)
{
  unsetenv("LOG");
  ParsedCommandLine cli{{}};
  // Empty selects every channel when logging is configured.
  EXPECT_TRUE(cli.mConfig->mLogChannels.empty());
}
