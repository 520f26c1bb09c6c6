#include <doctest/doctest.h>
#include <filerix/path_utils.hpp>
#include <filerix/platform.hpp>

#include "test_support.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using namespace filerix;

// ============================================================================
// Resolution
// ============================================================================

TEST_CASE("resolve empty path to working directory") {
    auto r = resolve_path("");
    REQUIRE(r.ok);
    CHECK(fs::equivalent(r.value, fs::current_path()));

    auto dot = resolve_path(".");
    REQUIRE(dot.ok);
    CHECK(r.value == dot.value);
}

TEST_CASE("resolve rejects NUL bytes") {
    std::string bad = std::string("dir/\0file", 9);
    auto r = resolve_path(bad);
    CHECK_FALSE(r.ok);
    CHECK(r.error.kind == ErrorKind::InvalidInputKind);
}

TEST_CASE("resolve makes relative path absolute") {
    auto r = resolve_path("some_relative_name.txt");
    REQUIRE(r.ok);
    CHECK(fs::path(r.value).is_absolute());
    CHECK(fs::path(r.value).filename() == "some_relative_name.txt");
}

TEST_CASE("resolve collapses dot and dotdot segments of missing paths") {
    TempTestDir temp_dir;
    auto r = resolve_path(temp_dir.path + "/a/./b/../c");
    REQUIRE(r.ok);
    CHECK(r.value == (fs::path(temp_dir.path) / "a" / "c").string());
}

TEST_CASE("resolve drops trailing separator") {
    TempTestDir temp_dir;
    auto r = resolve_path(temp_dir.path + "/sub/");
    REQUIRE(r.ok);
    CHECK(r.value == (fs::path(temp_dir.path) / "sub").string());
}

#ifndef _WIN32
TEST_CASE("resolve follows symlinks in the existing prefix") {
    TempTestDir temp_dir;
    fs::create_directories(temp_dir.file("real"));
    fs::create_directory_symlink(temp_dir.file("real"), temp_dir.file("link"));

    auto r = resolve_path(temp_dir.file("link") + "/missing.txt");
    REQUIRE(r.ok);
    CHECK(r.value == (fs::path(temp_dir.path) / "real" / "missing.txt").string());
}
#endif

// ============================================================================
// Home Expansion
// ============================================================================

TEST_CASE("expand_user leaves plain paths alone") {
    CHECK(expand_user("/etc/hosts") == "/etc/hosts");
    CHECK(expand_user("relative/~file") == "relative/~file");
    CHECK(expand_user("") == "");
}

TEST_CASE("expand_user replaces tilde with home directory") {
    auto home = get_home_directory();
    REQUIRE(home.has_value());

    SUBCASE("bare tilde") {
        CHECK(fs::path(expand_user("~")) == fs::path(*home));
    }

    SUBCASE("tilde with rest") {
        CHECK(fs::path(expand_user("~/docs/file.txt")) == fs::path(*home) / "docs" / "file.txt");
    }
}

TEST_CASE("expand_user keeps unknown user shorthand") {
    CHECK(expand_user("~no_such_user_filerix_42/x") == "~no_such_user_filerix_42/x");
}

TEST_CASE("resolve expands home shorthand") {
    auto home = get_home_directory();
    REQUIRE(home.has_value());
    auto r = resolve_path("~/filerix_not_there.txt");
    REQUIRE(r.ok);
    auto expected = resolve_path(*home + "/filerix_not_there.txt");
    REQUIRE(expected.ok);
    CHECK(r.value == expected.value);
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("validate existing file") {
    TempTestDir temp_dir;
    std::string file = temp_dir.write("file.txt", "content");

    ValidationConstraints c;
    c.expected_kind = ExpectedKind::File;
    auto r = validate_path(file, c);
    REQUIRE(r.ok);
    CHECK(r.value == file);
}

TEST_CASE("validate missing path") {
    TempTestDir temp_dir;
    std::string missing = temp_dir.file("missing.txt");

    SUBCASE("must_exist fails with resolved path") {
        auto r = validate_path(missing);
        CHECK_FALSE(r.ok);
        CHECK(r.error.kind == ErrorKind::NotFound);
        CHECK(r.error.path == missing);
        CHECK_FALSE(r.error.reason.empty());
    }

    SUBCASE("without must_exist succeeds") {
        ValidationConstraints c;
        c.must_exist = false;
        auto r = validate_path(missing, c);
        REQUIRE(r.ok);
        CHECK(r.value == missing);
    }
}

TEST_CASE("validate expected kind") {
    TempTestDir temp_dir;
    std::string file = temp_dir.write("file.txt", "x");

    SUBCASE("directory where file expected") {
        ValidationConstraints c;
        c.expected_kind = ExpectedKind::File;
        auto r = validate_path(temp_dir.path, c);
        CHECK_FALSE(r.ok);
        CHECK(r.error.kind == ErrorKind::WrongKind);
    }

    SUBCASE("file where directory expected") {
        ValidationConstraints c;
        c.expected_kind = ExpectedKind::Directory;
        auto r = validate_path(file, c);
        CHECK_FALSE(r.ok);
        CHECK(r.error.kind == ErrorKind::WrongKind);
    }

    SUBCASE("directory where directory expected") {
        ValidationConstraints c;
        c.expected_kind = ExpectedKind::Directory;
        CHECK(validate_path(temp_dir.path, c).ok);
    }
}

TEST_CASE("validate hidden paths") {
    TempTestDir temp_dir;
    std::string hidden = temp_dir.write(".hidden", "...");
    std::string visible = temp_dir.write("visible.txt", "...");

    ValidationConstraints reject_hidden;
    reject_hidden.allow_hidden = false;

    SUBCASE("rejected when hidden not allowed") {
        auto r = validate_path(hidden, reject_hidden);
        CHECK_FALSE(r.ok);
        CHECK(r.error.kind == ErrorKind::HiddenRejected);
    }

    SUBCASE("visible path passes the same constraints") {
        CHECK(validate_path(visible, reject_hidden).ok);
    }

    SUBCASE("allowed by default") {
        CHECK(validate_path(hidden).ok);
    }

    SUBCASE("hidden directory component does not count") {
        fs::create_directories(temp_dir.file(".config"));
        std::string inside = temp_dir.write(".config/settings.json", "{}");
        CHECK(validate_path(inside, reject_hidden).ok);
    }
}

TEST_CASE("validate reports first failing check") {
    TempTestDir temp_dir;

    SUBCASE("missing wins over hidden") {
        ValidationConstraints c;
        c.allow_hidden = false;
        auto r = validate_path(temp_dir.file(".ghost"), c);
        CHECK(r.error.kind == ErrorKind::NotFound);
    }

    SUBCASE("wrong kind wins over hidden") {
        fs::create_directories(temp_dir.file(".dir"));
        ValidationConstraints c;
        c.allow_hidden = false;
        c.expected_kind = ExpectedKind::File;
        auto r = validate_path(temp_dir.file(".dir"), c);
        CHECK(r.error.kind == ErrorKind::WrongKind);
    }
}

TEST_CASE("validate access permissions") {
    TempTestDir temp_dir;
    std::string file = temp_dir.write("readonly.txt", "content");
    fs::permissions(file, fs::perms::owner_read, fs::perm_options::replace);

    SUBCASE("read-only file is readable") {
        ValidationConstraints c;
        c.readable = true;
        CHECK(validate_path(file, c).ok);
    }

    SUBCASE("read-only file is not writable") {
        if (running_as_root()) {
            MESSAGE("skipped: root bypasses write permission");
            return;
        }
        ValidationConstraints c;
        c.writable = true;
        auto r = validate_path(file, c);
        CHECK_FALSE(r.ok);
        CHECK(r.error.kind == ErrorKind::NotWritable);
    }

    SUBCASE("unreadable file") {
        if (running_as_root()) {
            MESSAGE("skipped: root bypasses read permission");
            return;
        }
        fs::permissions(file, fs::perms::none, fs::perm_options::replace);
        ValidationConstraints c;
        c.readable = true;
        auto r = validate_path(file, c);
        CHECK_FALSE(r.ok);
        CHECK(r.error.kind == ErrorKind::NotReadable);
    }
}

TEST_CASE("error message names kind path and reason") {
    auto r = validate_path("/filerix/definitely/not/here");
    REQUIRE_FALSE(r.ok);
    std::string msg = r.error.message();
    CHECK(msg.find("[not_found]") == 0);
    CHECK(msg.find("/filerix/definitely/not/here") != std::string::npos);
}
