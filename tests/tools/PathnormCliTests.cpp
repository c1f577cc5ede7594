// File: tests/tools/PathnormCliTests.cpp
// Purpose: Drive the pathnorm CLI end to end with captured streams.
// Key invariants: Usage errors exit 2; --check exits 1 only for unstable input.
// Ownership/Lifetime: Test owns argument storage, stream buffers and any
//                     temporary manifest it writes.
// Links: src/tools/pathnorm/cli.cpp

#include <gtest/gtest.h>

#include "tools/pathnorm/cli.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

using namespace pathnorm::tools;

namespace
{

/// @brief Captured result of one runCLI() invocation.
struct RunResult
{
    int rc = 0;
    std::string out;
    std::string err;
};

RunResult run(std::vector<std::string> args,
              const std::string &input = {},
              const std::map<std::string, std::string> &vars = {})
{
    args.insert(args.begin(), "pathnorm");
    std::vector<char *> argv;
    for (auto &arg : args)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    EnvLookup env = [&vars](const char *name) -> const char * {
        auto it = vars.find(name);
        return it == vars.end() ? nullptr : it->second.c_str();
    };

    std::istringstream in(input);
    std::ostringstream out;
    std::ostringstream err;
    RunResult result;
    result.rc = runCLI(static_cast<int>(args.size()), argv.data(), in, out, err, env);
    result.out = out.str();
    result.err = err.str();
    return result;
}

} // namespace

TEST(PathnormCli, NormalizesArguments)
{
    auto r = run({"C:/MyGame/Assets/MyFolder", "Assets\\Levels"});
    EXPECT_EQ(r.rc, kExitOk);
    EXPECT_EQ(r.out, "Assets/MyFolder/\nAssets/Levels/\n");
    EXPECT_TRUE(r.err.empty());
}

TEST(PathnormCli, ReadsStdinWhenNoPathsGiven)
{
    auto r = run({"--root", "resources"}, "C:/MyGame/Assets/Resources/Sfx\r\n/Resources/Ui/\n");
    EXPECT_EQ(r.rc, kExitOk);
    EXPECT_EQ(r.out, "Sfx\nUi/\n");
}

TEST(PathnormCli, DoubleDashEndsOptions)
{
    auto r = run({"--root", "filesystem", "--", "--trace"});
    EXPECT_EQ(r.rc, kExitOk);
    EXPECT_EQ(r.out, "--trace/\n");
    EXPECT_TRUE(r.err.empty());
}

TEST(PathnormCli, CheckReportsUnstableInputs)
{
    auto clean = run({"--check", "Assets/MyFolder/", "Assets/Levels/"});
    EXPECT_EQ(clean.rc, kExitOk);
    EXPECT_TRUE(clean.out.empty());

    auto dirty = run({"--check", "Assets/MyFolder/", "C:/MyGame/Assets/Levels"});
    EXPECT_EQ(dirty.rc, kExitFailure);
    EXPECT_EQ(dirty.out, "C:/MyGame/Assets/Levels -> Assets/Levels/\n");
}

TEST(PathnormCli, TraceGoesToErrorStream)
{
    auto r = run({"--trace", "C:/MyGame/Assets/MyFolder"});
    EXPECT_EQ(r.rc, kExitOk);
    EXPECT_EQ(r.out, "Assets/MyFolder/\n");
    EXPECT_NE(r.err.find("trace: input \"C:/MyGame/Assets/MyFolder\"\n"), std::string::npos);
    EXPECT_NE(r.err.find("trace: pass 1 resolve-root: \"Assets/MyFolder\"\n"), std::string::npos);
    EXPECT_NE(r.err.find("trace: pass 1 trailing-slash: \"Assets/MyFolder/\"\n"), std::string::npos);
    EXPECT_EQ(r.err.find("trace: pass 2"), std::string::npos);
}

TEST(PathnormCli, ShowConfigPrintsResolvedOptions)
{
    auto r = run({"--show-config", "--slashes", "unix"}, {}, {{"PATHNORM_ROOT", "streaming_assets"}});
    EXPECT_EQ(r.rc, kExitOk);
    EXPECT_EQ(r.out, "root=streamingassets slashes=backward leading=omit trailing=include\n");
}

TEST(PathnormCli, HelpAndVersion)
{
    auto help = run({"--help"});
    EXPECT_EQ(help.rc, kExitOk);
    EXPECT_NE(help.out.find("Usage: pathnorm"), std::string::npos);
    EXPECT_NE(help.out.find("filesystem|assets|resources|streamingassets"), std::string::npos);

    auto version = run({"--version"});
    EXPECT_EQ(version.rc, kExitOk);
    EXPECT_EQ(version.out.rfind("pathnorm v", 0), 0u);
}

TEST(PathnormCli, UsageErrorsExitTwo)
{
    auto unknown = run({"--sideways"});
    EXPECT_EQ(unknown.rc, kExitUsage);
    EXPECT_NE(unknown.err.find("unknown option '--sideways'"), std::string::npos);
    EXPECT_NE(unknown.err.find("Try 'pathnorm --help'"), std::string::npos);

    auto missing = run({"--root"});
    EXPECT_EQ(missing.rc, kExitUsage);
    EXPECT_NE(missing.err.find("missing value for --root"), std::string::npos);

    auto invalid = run({"--trailing", "sometimes"});
    EXPECT_EQ(invalid.rc, kExitUsage);
    EXPECT_NE(invalid.err.find("invalid value 'sometimes' for --trailing"), std::string::npos);
    EXPECT_TRUE(invalid.out.empty());
}

TEST(PathnormCli, BadEnvironmentValueWarnsAndContinues)
{
    auto r = run({"C:/MyGame/Assets/MyFolder"}, {}, {{"PATHNORM_SLASHES", "zigzag"}});
    EXPECT_EQ(r.rc, kExitOk);
    EXPECT_EQ(r.out, "Assets/MyFolder/\n");
    EXPECT_NE(r.err.find("pathnorm: warning: ignoring PATHNORM_SLASHES='zigzag'"), std::string::npos);
}

TEST(PathnormCli, ConfigErrorsExitOne)
{
    auto missing = run({"--config", "/nonexistent/pathnorm.config", "Assets/x"});
    EXPECT_EQ(missing.rc, kExitFailure);
    EXPECT_TRUE(missing.out.empty());
    EXPECT_NE(missing.err.find("cannot open config: /nonexistent/pathnorm.config"), std::string::npos);

    namespace fs = std::filesystem;
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path manifest = fs::temp_directory_path() / ("pathnorm-cli-" + std::to_string(stamp) + ".config");
    {
        std::ofstream ofs(manifest);
        ofs << "root resources\nleading maybe\n";
    }
    auto broken = run({"Assets/x"}, {}, {{"PATHNORM_CONFIG", manifest.string()}});
    fs::remove(manifest);

    EXPECT_EQ(broken.rc, kExitFailure);
    EXPECT_NE(broken.err.find(manifest.string() + ":2: error: invalid leading 'maybe'"), std::string::npos);
}
