#include <catch2/catch.hpp>
#include <strata/feature.hpp>
#include <strata/manifest.hpp>

using namespace strata;

static PackageName pkg(const char* n) {
    return PackageName::parse(n).value();
}

static Manifest parse_manifest(const std::string& toml) {
    auto r = Manifest::parse(toml, "strata.toml");
    if (r.is_err()) FAIL(r.error().format());
    return std::move(r).value();
}

static const Feature& named_feature(const Manifest& m, const char* name) {
    const Feature* f = m.feature(FeatureName::named(name).value());
    REQUIRE(f != nullptr);
    return *f;
}

static const char* EMPTY_HOST_MANIFEST = R"(
[project]
name = "test"
platforms = ["linux-64", "osx-arm64", "win-64"]

[dependencies]
foo = "1.0"

[host-dependencies]
foo = "2.0"

[feature.bla.host-dependencies]

[environments]
bla = ["bla"]
)";

TEST_CASE("empty host table of a feature is an explicit override", "[feature]") {
    auto m = parse_manifest(EMPTY_HOST_MANIFEST);
    const Feature& bla = named_feature(m, "bla");

    for (Platform p : {Platform::Linux64, Platform::OsxArm64, Platform::Win64}) {
        auto host = bla.dependencies(SpecType::Host, p);
        REQUIRE(host);
        REQUIRE(host->get().empty());
        REQUIRE(host->is_borrowed());
    }

    // The feature alone declares no run dependencies
    REQUIRE_FALSE(bla.dependencies(SpecType::Run, std::nullopt));
}

TEST_CASE("environment inherits run dependencies from the default feature", "[feature]") {
    auto m = parse_manifest(EMPTY_HOST_MANIFEST);
    auto env = m.environment(EnvironmentName::from_str("bla"));
    REQUIRE(env.is_ok());

    auto run = env.value().dependencies(SpecType::Run, Platform::Linux64);
    REQUIRE(run);
    REQUIRE(run->get().size() == 1);
    REQUIRE(run->get().at(pkg("foo")).version == "1.0");

    // The feature's empty host table adds nothing to the default's
    auto host = env.value().dependencies(SpecType::Host, Platform::Linux64);
    REQUIRE(host);
    REQUIRE(host->get().size() == 1);
    REQUIRE(host->get().at(pkg("foo")).version == "2.0");
}

TEST_CASE("empty platform table keeps inherited dependencies", "[feature]") {
    auto m = parse_manifest(R"(
[project]
name = "test"
platforms = ["linux-64", "win-64"]

[host-dependencies]
gcc = "12"

[pypi-dependencies]
requests = "*"

[target.linux-64.host-dependencies]

[target.linux-64.pypi-dependencies]
)");
    const Feature& def = m.default_feature();

    auto host = def.dependencies(SpecType::Host, Platform::Linux64);
    REQUIRE(host);
    REQUIRE(host->get().size() == 1);
    REQUIRE(host->get().at(pkg("gcc")).version == "12");

    auto pypi = def.pypi_dependencies(Platform::Linux64);
    REQUIRE(pypi);
    REQUIRE(pypi->get().size() == 1);
    REQUIRE(pypi->get().contains(PypiPackageName::parse("requests").value()));
}

TEST_CASE("activation scripts follow the platform layer", "[feature]") {
    auto m = parse_manifest(R"(
[project]
name = "test"
platforms = ["linux-64", "win-64"]

[activation]
scripts = ["run.bat"]

[target.win-64.activation]
scripts = ["x.bat"]
)");
    const Feature& def = m.default_feature();

    const auto* win = def.activation_scripts(Platform::Win64);
    REQUIRE(win);
    REQUIRE(win->size() == 1);
    REQUIRE(win->front() == "x.bat");

    const auto* none = def.activation_scripts(std::nullopt);
    REQUIRE(none);
    REQUIRE(none->front() == "run.bat");

    const auto* other = def.activation_scripts(Platform::Linux64);
    REQUIRE(other);
    REQUIRE(other->front() == "run.bat");
}

TEST_CASE("activation scripts are not merged with the default layer", "[feature]") {
    auto m = parse_manifest(R"(
[project]
name = "test"

[activation]
scripts = ["a.sh", "b.sh"]

[target.linux-64.activation]
scripts = ["c.sh"]
)");
    const auto* scripts = m.default_feature().activation_scripts(Platform::Linux64);
    REQUIRE(scripts);
    REQUIRE(scripts->size() == 1);
    REQUIRE(scripts->front() == "c.sh");
}

TEST_CASE("single contributing layer is borrowed", "[feature]") {
    auto m = parse_manifest(R"(
[project]
name = "test"

[dependencies]
python = "3.11.*"
numpy = ">=1.26"
)");
    const Feature& def = m.default_feature();
    auto run = def.dependencies(SpecType::Run, Platform::Linux64);
    REQUIRE(run);
    REQUIRE(run->is_borrowed());
    REQUIRE(&run->get() == def.targets.default_target().dependencies_of(SpecType::Run));
}

TEST_CASE("platform layer overrides the default layer by key", "[feature]") {
    auto m = parse_manifest(R"(
[project]
name = "test"

[dependencies]
python = "3.10.*"
pip = "*"

[target.osx-arm64.dependencies]
python = "3.12.*"
clang = "17"
)");
    const Feature& def = m.default_feature();

    auto arm = def.dependencies(SpecType::Run, Platform::OsxArm64);
    REQUIRE(arm);
    REQUIRE(arm->is_owned());
    REQUIRE(arm->get().size() == 3);
    REQUIRE(arm->get().at(pkg("python")).version == "3.12.*");
    REQUIRE(arm->get().at(pkg("pip")).version == "*");
    REQUIRE(arm->get().at(pkg("clang")).version == "17");

    auto other = def.dependencies(SpecType::Run, Platform::Linux64);
    REQUIRE(other);
    REQUIRE(other->is_borrowed());
    REQUIRE(other->get().at(pkg("python")).version == "3.10.*");
}

TEST_CASE("combined kind merges run, host and build", "[feature]") {
    auto m = parse_manifest(R"(
[project]
name = "test"

[dependencies]
foo = "1.0"

[host-dependencies]
foo = "2.0"
bar = "*"

[build-dependencies]
cmake = "3.28"
)");
    auto all = m.default_feature().dependencies(std::nullopt, std::nullopt);
    REQUIRE(all);
    REQUIRE(all->get().size() == 3);
    REQUIRE(all->get().at(pkg("foo")).version == "2.0");
}

TEST_CASE("activation env merges with the most specific value first", "[feature]") {
    auto m = parse_manifest(R"(
[project]
name = "test"

[activation.env]
SHARED = "default"
ONLY_DEFAULT = "1"

[target.linux-64.activation.env]
SHARED = "linux"
ONLY_LINUX = "2"
)");
    auto env = m.default_feature().activation_env(Platform::Linux64);
    REQUIRE(env.size() == 3);
    REQUIRE(env.at("SHARED") == "linux");
    REQUIRE(env.at("ONLY_DEFAULT") == "1");
    REQUIRE(env.at("ONLY_LINUX") == "2");

    auto plain = m.default_feature().activation_env(std::nullopt);
    REQUIRE(plain.at("SHARED") == "default");
    REQUIRE_FALSE(plain.contains("ONLY_LINUX"));
}

TEST_CASE("pypi dependencies use the dependency algebra", "[feature]") {
    auto m = parse_manifest(R"(
[project]
name = "test"

[pypi-dependencies]
requests = "*"
flask = ">=3"

[target.win-64.pypi-dependencies]
flask = "==3.0.0"
)");
    const Feature& def = m.default_feature();
    auto pypi = def.pypi_dependencies(Platform::Win64);
    REQUIRE(pypi);
    REQUIRE(pypi->get().size() == 2);

    auto flask = PypiPackageName::parse("flask").value();
    REQUIRE(pypi->get().at(flask).version == std::optional<std::string>("==3.0.0"));

    auto requests = PypiPackageName::parse("requests").value();
    REQUIRE_FALSE(pypi->get().at(requests).version.has_value());

    REQUIRE(def.has_pypi_dependencies());
}

TEST_CASE("has_pypi_dependencies looks at every layer", "[feature]") {
    Feature f;
    REQUIRE_FALSE(f.has_pypi_dependencies());

    Target& layer = f.targets.for_target_mut(TargetSelector(Platform::Linux64));
    layer.pypi_dependencies.emplace();
    REQUIRE_FALSE(f.has_pypi_dependencies());

    layer.pypi_dependencies->insert(PypiPackageName::parse("rich").value(), PypiRequirement{});
    REQUIRE(f.has_pypi_dependencies());
}

TEST_CASE("add and remove channels", "[feature]") {
    Feature f;
    REQUIRE_FALSE(f.channels.has_value());

    f.add_channels({{"conda-forge", std::nullopt}, {"bioconda", 5}});
    REQUIRE(f.channels->size() == 2);

    // Re-adding keeps position and updates the priority
    f.add_channels({{"conda-forge", 1}});
    REQUIRE(f.channels->size() == 2);
    REQUIRE((*f.channels)[0].channel == "conda-forge");
    REQUIRE((*f.channels)[0].priority == std::optional<int>(1));

    REQUIRE(f.remove_channels({{"conda-forge", std::nullopt}}) == 1);
    REQUIRE(f.channels->size() == 1);
    REQUIRE(f.channels->front().channel == "bioconda");

    REQUIRE(f.remove_channels({{"missing", std::nullopt}}) == 0);
}

TEST_CASE("platforms_mut and channels_mut create the lists", "[feature]") {
    Feature f(FeatureName::named("cuda").value());
    REQUIRE_FALSE(f.is_default());
    f.platforms_mut().push_back(Platform::Linux64);
    REQUIRE(f.platforms.has_value());
    REQUIRE(f.platforms->size() == 1);

    f.channels_mut();
    REQUIRE(f.channels.has_value());
    REQUIRE(f.channels->empty());
}
