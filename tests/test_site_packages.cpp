#include <catch2/catch.hpp>
#include <strata/consts.hpp>
#include <strata/site_packages.hpp>
#include "test_helpers.hpp"

using namespace strata;

static void add_dist(TempDir& tmp, const std::string& dir, const std::string& installer) {
    tmp.write_file("site-packages/" + dir + "/METADATA", "Name: x\n");
    if (!installer.empty()) {
        tmp.write_file("site-packages/" + dir + "/INSTALLER", installer);
    }
}

TEST_CASE("dist-info directory names", "[site_packages]") {
    TempDir tmp;
    add_dist(tmp, "requests-2.31.0.dist-info", "");
    tmp.write_file("site-packages/not_a_dist/__init__.py", "");

    auto dist = InstalledDist::try_from_path(tmp.path / "site-packages" / "requests-2.31.0.dist-info");
    REQUIRE(dist);
    REQUIRE(dist->name == "requests");
    REQUIRE(dist->version == "2.31.0");

    REQUIRE_FALSE(InstalledDist::try_from_path(tmp.path / "site-packages" / "not_a_dist"));
    REQUIRE_FALSE(InstalledDist::try_from_path(tmp.path / "site-packages" / "gone-1.0.dist-info"));
}

TEST_CASE("installer file is trimmed", "[site_packages]") {
    TempDir tmp;
    add_dist(tmp, "rich-13.7.0.dist-info", "uv-strata\n");
    add_dist(tmp, "six-1.16.0.dist-info", "");

    auto rich = InstalledDist::try_from_path(tmp.path / "site-packages" / "rich-13.7.0.dist-info");
    auto who = rich->installer();
    REQUIRE(who.is_ok());
    REQUIRE(who.value() == std::optional<std::string>("uv-strata"));

    auto six = InstalledDist::try_from_path(tmp.path / "site-packages" / "six-1.16.0.dist-info");
    REQUIRE(six->installer().is_ok());
    REQUIRE_FALSE(six->installer().value().has_value());
}

TEST_CASE("list installed dists sorted by name", "[site_packages]") {
    TempDir tmp;
    add_dist(tmp, "zope-5.0.dist-info", "pip");
    add_dist(tmp, "attrs-23.1.0.dist-info", "pip");

    auto dists = list_installed_dists(tmp.path / "site-packages");
    REQUIRE(dists.is_ok());
    REQUIRE(dists.value().size() == 2);
    REQUIRE(dists.value()[0].name == "attrs");
    REQUIRE(dists.value()[1].name == "zope");
}

TEST_CASE("only dists of our installer are selected", "[site_packages]") {
    TempDir tmp;
    add_dist(tmp, "ours-1.0.dist-info", std::string(UV_INSTALLER) + "\n");
    add_dist(tmp, "pipped-1.0.dist-info", "pip\n");
    add_dist(tmp, "conda_pkg-1.0.dist-info", "conda");
    add_dist(tmp, "unknown-1.0.dist-info", "");

    auto ours = find_dists_installed_by(tmp.path / "site-packages", UV_INSTALLER);
    REQUIRE(ours.is_ok());
    REQUIRE(ours.value().size() == 1);
    REQUIRE(ours.value()[0].name == "ours");
}

TEST_CASE("missing site-packages is an error", "[site_packages]") {
    TempDir tmp;
    auto r = list_installed_dists(tmp.path / "nope");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::IO);
}
