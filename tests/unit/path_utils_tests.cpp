#include <doctest/doctest.h>
#include <pathguard/path_utils.hpp>

#include <filesystem>
#include <string>

using pathguard::contains_nul;
using pathguard::has_parent_reference;
using pathguard::is_within_root;
using pathguard::join_relative;
using pathguard::split_components;

TEST_CASE("split simple relative path") {
    auto parts = split_components("2024/01/01/abc.jpg");
    REQUIRE(parts.size() == 4);
    CHECK(parts[0] == "2024");
    CHECK(parts[3] == "abc.jpg");
}

TEST_CASE("split treats backslash as a separator") {
    auto parts = split_components("..\\..\\windows\\system32");
    REQUIRE(parts.size() == 4);
    CHECK(parts[0] == "..");
    CHECK(parts[2] == "windows");
}

TEST_CASE("split drops empty components from repeated and leading separators") {
    auto parts = split_components("//bin//subdir///file/");
    REQUIRE(parts.size() == 3);
    CHECK(parts[0] == "bin");
    CHECK(parts[2] == "file");
}

TEST_CASE("parent reference detected as a whole component") {
    CHECK(has_parent_reference("../../etc/passwd"));
    CHECK(has_parent_reference("uploads/../../../etc/passwd"));
    CHECK(has_parent_reference("a/b/.."));
    CHECK(has_parent_reference("..\\..\\windows\\system32\\config\\sam"));
    CHECK(has_parent_reference("mixed/..\\up"));
}

TEST_CASE("dots inside a component are not parent references") {
    CHECK_FALSE(has_parent_reference("archive..tar"));
    CHECK_FALSE(has_parent_reference("..hidden"));
    CHECK_FALSE(has_parent_reference("name.."));
    CHECK_FALSE(has_parent_reference("./current/./file"));
    CHECK_FALSE(has_parent_reference("..."));
}

TEST_CASE("NUL bytes detected") {
    CHECK(contains_nul(std::string("bin/\0app", 8)));
    CHECK_FALSE(contains_nul("bin/app"));
}

// ============================================================================
// Containment
// ============================================================================

TEST_CASE("path under root is contained") {
    CHECK(is_within_root("/data/uploads", "/data/uploads/2024/01/01/abc.jpg"));
    CHECK(is_within_root("/data/uploads", "/data/uploads"));
}

TEST_CASE("sibling sharing a string prefix is not contained") {
    CHECK_FALSE(is_within_root("/uploads", "/uploads-evil/file"));
    CHECK_FALSE(is_within_root("/data/uploads", "/data/uploads2"));
}

TEST_CASE("parent of root is not contained") {
    CHECK_FALSE(is_within_root("/data/uploads", "/data"));
    CHECK_FALSE(is_within_root("/data/uploads", "/etc/passwd"));
}

TEST_CASE("trailing separator on root does not change containment") {
    CHECK(is_within_root("/data/uploads/", "/data/uploads/a.jpg"));
    CHECK_FALSE(is_within_root("/data/uploads/", "/data/uploads-evil/a.jpg"));
}

TEST_CASE("filesystem root contains everything absolute") {
    CHECK(is_within_root("/", "/etc/passwd"));
}

// ============================================================================
// Relative keys
// ============================================================================

TEST_CASE("join relative builds a forward-slash key") {
    CHECK(join_relative({"components", "text", "default.html"}) == "components/text/default.html");
}
