#include "diagpack/collect/path_resolver.hpp"
#include "testing.hpp"

#include <algorithm>
#include <filesystem>
#include <gtest/gtest.h>
#include <map>

namespace diagpack {
namespace {

class PathResolverTests : public ::testing::Test {
  protected:
    testutil::TemporaryDirectory tmp;
    std::map<std::string, std::string> env;

    PathResolver MakeResolver() {
        return PathResolver([this](const std::string& name) -> std::optional<std::string> {
            auto it = env.find(name);
            if (it == env.end())
                return std::nullopt;
            return it->second;
        });
    }

    std::string MakeFile(const std::string& rel, const std::string& contents = "x") {
        const std::filesystem::path p = std::filesystem::path(tmp.Path()) / rel;
        std::filesystem::create_directories(p.parent_path());
        testutil::WriteTextFile(p.string(), contents);
        return p.string();
    }
};

TEST_F(PathResolverTests, ExpandsAllReferenceForms) {
    env["LOGROOT"] = "/var/log";
    env["APP"] = "svc";
    env["PROGRAMDATA"] = "/opt/data";

    const PathResolver r = MakeResolver();
    EXPECT_EQ(r.ExpandEnvironment("$LOGROOT/x"), "/var/log/x");
    EXPECT_EQ(r.ExpandEnvironment("${LOGROOT}/${APP}.log"), "/var/log/svc.log");
    EXPECT_EQ(r.ExpandEnvironment("%LOGROOT%\\%APP%"), "/var/log\\svc");
    // %name% retries in upper case.
    EXPECT_EQ(r.ExpandEnvironment("%ProgramData%/a"), "/opt/data/a");
}

TEST_F(PathResolverTests, UnknownReferencesStayVerbatim) {
    const PathResolver r = MakeResolver();
    EXPECT_EQ(r.ExpandEnvironment("$NOPE/a"), "$NOPE/a");
    EXPECT_EQ(r.ExpandEnvironment("${NOPE}/a"), "${NOPE}/a");
    EXPECT_EQ(r.ExpandEnvironment("%NOPE%/a"), "%NOPE%/a");
    EXPECT_EQ(r.ExpandEnvironment("100% sure"), "100% sure");
    EXPECT_EQ(r.ExpandEnvironment("cost $5"), "cost $5");
}

TEST_F(PathResolverTests, ResolvesLiteralFile) {
    const std::string f = MakeFile("logs/app.log");
    env["ROOT"] = tmp.Path();

    const auto out = MakeResolver().Resolve("  \"$ROOT/logs/app.log\" ");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], f);
}

TEST_F(PathResolverTests, GlobMatchesOnlyRegularFiles) {
    const std::string a = MakeFile("logs/a.log");
    const std::string b = MakeFile("logs/b.log");
    MakeFile("logs/c.txt");
    std::filesystem::create_directories(std::filesystem::path(tmp.Path()) / "logs/dir.log");

    auto out = MakeResolver().Resolve(tmp.Path() + "/logs/*.log");
    std::sort(out.begin(), out.end());
    ASSERT_EQ(out.size(), 2u);
    EXPECT_EQ(out[0], a);
    EXPECT_EQ(out[1], b);
}

TEST_F(PathResolverTests, BackslashesBecomeSeparators) {
    const std::string f = MakeFile("win/style/file.txt");
    env["ROOT"] = tmp.Path();

    const auto out = MakeResolver().Resolve("%ROOT%\\win\\style\\*.txt");
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0], f);
}

TEST_F(PathResolverTests, MissingOrEmptyYieldsNothing) {
    const PathResolver r = MakeResolver();
    EXPECT_TRUE(r.Resolve(tmp.Path() + "/missing.log").empty());
    EXPECT_TRUE(r.Resolve(tmp.Path() + "/none/*.log").empty());
    EXPECT_TRUE(r.Resolve(tmp.Path()).empty());
    EXPECT_TRUE(r.Resolve("   ").empty());
}

} // namespace
} // namespace diagpack
