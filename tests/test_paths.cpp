// tests/test_paths.cpp
//
// Per-user data locations. POSIX only: the overrides are set with setenv().

#include <doctest/doctest.h>

#if !defined(_WIN32)

#include "core/Paths.h"

#include "test_support/TempDir.h"

#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace {

// Sets or clears an environment variable for the lifetime of the guard.
class EnvGuard
{
public:
    EnvGuard(const char* name, const char* value) : m_name(name)
    {
        if (const char* old = std::getenv(name))
            m_old = std::string(old);
        if (value)
            ::setenv(name, value, 1);
        else
            ::unsetenv(name);
    }

    ~EnvGuard()
    {
        if (m_old)
            ::setenv(m_name, m_old->c_str(), 1);
        else
            ::unsetenv(m_name);
    }

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

private:
    const char*                m_name;
    std::optional<std::string> m_old;
};

} // namespace

TEST_CASE("MINEFIELD_HOME overrides the data directory")
{
    minefield::test::TempDir dir("paths_home");
    EnvGuard home("MINEFIELD_HOME", dir.path().string().c_str());

    const fs::path root = paths::user_data_dir();
    CHECK(fs::equivalent(root, dir.path()));
    CHECK(paths::high_scores_file() == root / "highscores.json");
    CHECK(paths::logs_dir() == root / "logs");
    CHECK(paths::config_dir() == root);
}

TEST_CASE("XDG_DATA_HOME is used when MINEFIELD_HOME is unset")
{
    minefield::test::TempDir dir("paths_xdg");
    EnvGuard home("MINEFIELD_HOME", nullptr);
    EnvGuard xdg("XDG_DATA_HOME", dir.path().string().c_str());

    CHECK(paths::user_data_dir().filename() == "minefield");
    CHECK(fs::equivalent(paths::user_data_dir().parent_path(), dir.path()));
}

TEST_CASE("HOME/.minefield is the last configured fallback")
{
    minefield::test::TempDir dir("paths_dot");
    EnvGuard home("MINEFIELD_HOME", nullptr);
    EnvGuard xdg("XDG_DATA_HOME", "");
    EnvGuard user("HOME", dir.path().string().c_str());

    CHECK(paths::user_data_dir().filename() == ".minefield");
}

#endif // !_WIN32
