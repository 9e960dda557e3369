#include <catch2/catch.hpp>
#include <strata/manifest.hpp>
#include "test_helpers.hpp"

using namespace strata;

static PackageName pkg(const char* n) {
    return PackageName::parse(n).value();
}

// ===== Project section =====

TEST_CASE("parse project section", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "demo"
version = "0.3.0"
description = "A demo project"
platforms = ["linux-64", "osx-arm64"]
channels = ["conda-forge", { channel = "bioconda", priority = 2 }]
channel-priority = "disabled"
)");
    REQUIRE(r.is_ok());
    auto& m = r.value();
    REQUIRE(m.project.name == "demo");
    REQUIRE(m.project.version == std::optional<std::string>("0.3.0"));
    REQUIRE(m.project.description == std::optional<std::string>("A demo project"));

    const Feature& def = m.default_feature();
    REQUIRE(def.is_default());
    REQUIRE(def.platforms->size() == 2);
    REQUIRE((*def.platforms)[1] == Platform::OsxArm64);
    REQUIRE(def.channels->size() == 2);
    REQUIRE((*def.channels)[0].channel == "conda-forge");
    REQUIRE_FALSE((*def.channels)[0].priority.has_value());
    REQUIRE((*def.channels)[1].priority == std::optional<int>(2));
    REQUIRE(def.channel_priority == std::optional<ChannelPriority>(ChannelPriority::Disabled));
}

TEST_CASE("minimal manifest has default feature and environment", "[manifest]") {
    auto r = Manifest::parse("[project]\nname = \"x\"\n");
    REQUIRE(r.is_ok());
    auto& m = r.value();
    REQUIRE(m.features.size() == 1);
    REQUIRE(m.environments.size() == 1);
    REQUIRE(m.default_feature().platforms.has_value());
    REQUIRE(m.default_feature().platforms->empty());
    REQUIRE(m.default_environment().name().is_default());
}

TEST_CASE("missing project table", "[manifest]") {
    auto r = Manifest::parse("[dependencies]\nfoo = \"1\"\n", "strata.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::Manifest);
    REQUIRE(r.error().file == "strata.toml");
}

TEST_CASE("project without name", "[manifest]") {
    auto r = Manifest::parse("[project]\nversion = \"1.0\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("no name") != std::string::npos);
}

TEST_CASE("TOML syntax error reports the line", "[manifest]") {
    auto r = Manifest::parse("[project]\nname = \"x\"\nbroken = \n", "strata.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::Parse);
    REQUIRE(r.error().file == "strata.toml");
    REQUIRE(r.error().line == 3);
}

TEST_CASE("unknown top-level field", "[manifest]") {
    auto r = Manifest::parse("[project]\nname = \"x\"\n\n[depndencies]\nfoo = \"1\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == StrataError::Manifest);
    REQUIRE(r.error().message.find("depndencies") != std::string::npos);
    REQUIRE(r.error().line == 4);
}

TEST_CASE("unknown platform in project", "[manifest]") {
    auto r = Manifest::parse("[project]\nname = \"x\"\nplatforms = [\"linux-65\"]\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("linux-65") != std::string::npos);
    REQUIRE(r.error().line == 3);
}

TEST_CASE("duplicate channel", "[manifest]") {
    auto r = Manifest::parse(
        "[project]\nname = \"x\"\nchannels = [\"conda-forge\", \"conda-forge\"]\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("listed twice") != std::string::npos);
}

TEST_CASE("invalid channel priority", "[manifest]") {
    auto r = Manifest::parse("[project]\nname = \"x\"\nchannel-priority = \"loose\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("loose") != std::string::npos);
}

// ===== Dependencies =====

TEST_CASE("parse dependency tables", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[dependencies]
python = "3.11.*"
pytorch = { version = ">=2.0", channel = "pytorch", build = "*cuda*" }
mylib = { path = "../mylib" }

[host-dependencies]
cmake = "*"
)");
    REQUIRE(r.is_ok());
    const Target& t = r.value().default_feature().targets.default_target();

    const DependencyMap* run = t.dependencies_of(SpecType::Run);
    REQUIRE(run);
    REQUIRE(run->size() == 3);
    REQUIRE(run->at(pkg("python")).version == "3.11.*");

    const DependencySpec& torch = run->at(pkg("pytorch"));
    REQUIRE(torch.version == ">=2.0");
    REQUIRE(torch.channel == std::optional<std::string>("pytorch"));
    REQUIRE(torch.build == std::optional<std::string>("*cuda*"));
    REQUIRE(torch.to_string() == "pytorch::>=2.0 *cuda*");

    const DependencySpec& mylib = run->at(pkg("mylib"));
    REQUIRE(mylib.is_source());
    REQUIRE(mylib.version == "*");

    REQUIRE(t.dependencies_of(SpecType::Host));
    REQUIRE_FALSE(t.dependencies_of(SpecType::Build));
}

TEST_CASE("empty dependency table is kept", "[manifest]") {
    auto r = Manifest::parse("[project]\nname = \"x\"\n\n[build-dependencies]\n");
    REQUIRE(r.is_ok());
    const DependencyMap* build =
        r.value().default_feature().targets.default_target().dependencies_of(SpecType::Build);
    REQUIRE(build);
    REQUIRE(build->empty());
}

TEST_CASE("dependency with two sources", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[dependencies]
foo = { path = "../foo", git = "https://example.com/foo.git" }
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("more than one source") != std::string::npos);
}

TEST_CASE("unknown dependency field", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[dependencies]
foo = { verison = "1.0" }
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("verison") != std::string::npos);
    REQUIRE_FALSE(r.error().hint.empty());
}

TEST_CASE("package names collide case-insensitively", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[dependencies]
Foo = "1"
foo = "2"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("listed twice") != std::string::npos);
}

TEST_CASE("parse pypi dependencies", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[pypi-dependencies]
requests = "*"
rich = { version = ">=13", extras = ["jupyter"] }
mypkg = { path = ".", editable = true }
tool = { git = "https://example.com/tool.git", tag = "v1" }
)");
    REQUIRE(r.is_ok());
    const auto& pypi = *r.value().default_feature().targets.default_target().pypi_dependencies;
    REQUIRE(pypi.size() == 4);

    REQUIRE_FALSE(pypi.at(PypiPackageName::parse("requests").value()).version);

    const auto& rich = pypi.at(PypiPackageName::parse("rich").value());
    REQUIRE(rich.version == std::optional<std::string>(">=13"));
    REQUIRE(rich.extras.size() == 1);

    const auto& mypkg = pypi.at(PypiPackageName::parse("mypkg").value());
    REQUIRE(mypkg.editable);
    REQUIRE(mypkg.path == std::optional<std::string>("."));

    const auto& tool = pypi.at(PypiPackageName::parse("tool").value());
    REQUIRE(tool.rev == std::optional<std::string>("v1"));
}

TEST_CASE("editable pypi dependency needs a path", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[pypi-dependencies]
foo = { version = "1.0", editable = true }
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("editable") != std::string::npos);
}

TEST_CASE("git revision without git", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[pypi-dependencies]
foo = { branch = "main" }
)");
    REQUIRE(r.is_err());
}

// ===== Activation, tasks, settings =====

TEST_CASE("parse activation and tasks", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[activation]
scripts = ["setup.sh"]
env = { DATA_DIR = "data" }

[tasks]
build = "cmake --build build"
test = { cmd = "ctest", depends-on = "build", cwd = "build" }
all = { depends-on = ["build", "test"] }
)");
    REQUIRE(r.is_ok());
    const Target& t = r.value().default_feature().targets.default_target();
    REQUIRE(t.activation);
    REQUIRE(t.activation->scripts->front() == "setup.sh");
    REQUIRE(t.activation->env->at("DATA_DIR") == "data");

    REQUIRE(t.tasks.size() == 3);
    REQUIRE(t.tasks.at("build").cmd == "cmake --build build");
    const Task& test = t.tasks.at("test");
    REQUIRE(test.depends_on.size() == 1);
    REQUIRE(test.cwd == std::optional<std::string>("build"));
    REQUIRE(t.tasks.at("all").depends_on.size() == 2);
    REQUIRE(t.tasks.at("all").cmd.empty());
}

TEST_CASE("task without command or dependencies", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[tasks]
nothing = { description = "does nothing" }
)");
    REQUIRE(r.is_err());
}

TEST_CASE("unknown activation field", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[activation]
script = ["a.sh"]
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().hint.find("scripts") != std::string::npos);
}

TEST_CASE("parse system requirements", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[system-requirements]
linux = "4.18"
cuda = 12
libc = { family = "musl", version = "1.2" }
)");
    REQUIRE(r.is_ok());
    const auto& req = r.value().default_feature().system_requirements;
    REQUIRE(req.linux_kernel == std::optional<std::string>("4.18"));
    REQUIRE(req.cuda == std::optional<std::string>("12"));
    REQUIRE(req.libc->family == "musl");
    REQUIRE(req.libc->version == "1.2");
    REQUIRE_FALSE(req.macos);
}

TEST_CASE("unknown system requirement", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[system-requirements]
windows = "10"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("windows") != std::string::npos);
}

TEST_CASE("parse pypi options", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[pypi-options]
index-url = "https://pypi.example.com/simple"
extra-index-urls = ["https://extra.example.com/simple"]
find-links = [{ path = "./wheels" }, "https://example.com/links"]
no-build-isolation = ["detectron2"]
)");
    REQUIRE(r.is_ok());
    const auto& opts = *r.value().default_feature().pypi_options;
    REQUIRE(opts.index_url == std::optional<std::string>("https://pypi.example.com/simple"));
    REQUIRE(opts.extra_index_urls.size() == 1);
    REQUIRE(opts.find_links.size() == 2);
    REQUIRE(opts.find_links[0] == "./wheels");
    REQUIRE(opts.no_build_isolation->front() == "detectron2");
}

// ===== Targets =====

TEST_CASE("parse target tables", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"
platforms = ["linux-64", "win-64"]

[target.win-64.dependencies]
pywin32 = "*"

[target.linux-64.host-dependencies]
gcc = "13"
)");
    REQUIRE(r.is_ok());
    const Targets& targets = r.value().default_feature().targets;
    REQUIRE(targets.user_defined().size() == 2);

    const Target* win = targets.for_target(TargetSelector(Platform::Win64));
    REQUIRE(win);
    REQUIRE(win->dependencies_of(SpecType::Run)->contains(pkg("pywin32")));
}

TEST_CASE("unknown target platform", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[target.beos.dependencies]
foo = "*"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("beos") != std::string::npos);
}

TEST_CASE("unknown field in target table", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[target.linux-64]
platforms = ["linux-64"]
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("platforms") != std::string::npos);
}

// ===== Features and environments =====

static const char* MULTI_ENV_MANIFEST = R"(
[project]
name = "x"
platforms = ["linux-64", "osx-arm64"]
channels = ["conda-forge"]

[dependencies]
python = "3.11.*"

[feature.test.dependencies]
pytest = "*"

[feature.cuda]
platforms = ["linux-64"]
channels = ["nvidia"]
system-requirements = { cuda = "12" }

[feature.cuda.dependencies]
cuda-toolkit = "12.*"

[environments]
test = ["test"]
gpu = { features = ["cuda", "test"], solve-group = "main" }
lean = { features = ["test"], no-default-feature = true }
)";

TEST_CASE("parse features and environments", "[manifest]") {
    auto r = Manifest::parse(MULTI_ENV_MANIFEST);
    REQUIRE(r.is_ok());
    auto& m = r.value();

    REQUIRE(m.features.size() == 3);
    const Feature* cuda = m.feature(FeatureName::named("cuda").value());
    REQUIRE(cuda);
    REQUIRE(cuda->platforms->size() == 1);
    REQUIRE(cuda->channels->front().channel == "nvidia");
    REQUIRE(cuda->system_requirements.cuda == std::optional<std::string>("12"));

    REQUIRE(m.environments.size() == 4);
    const EnvironmentSpec* gpu = m.environments.find(EnvironmentName::from_str("gpu"));
    REQUIRE(gpu);
    REQUIRE(gpu->features.size() == 2);
    REQUIRE(gpu->features[0].as_str() == "cuda");
    REQUIRE(gpu->solve_group == std::optional<std::string>("main"));

    const EnvironmentSpec* lean = m.environments.find(EnvironmentName::from_str("lean"));
    REQUIRE(lean->no_default_feature);

    REQUIRE(m.all_environments().size() == 4);
}

TEST_CASE("unknown environment lists the known ones", "[manifest]") {
    auto r = Manifest::parse(MULTI_ENV_MANIFEST);
    REQUIRE(r.is_ok());
    auto env = r.value().environment(EnvironmentName::from_str("prod"));
    REQUIRE(env.is_err());
    REQUIRE(env.error().code == StrataError::NotFound);
    REQUIRE(env.error().hint.find("gpu") != std::string::npos);
}

TEST_CASE("feature named default is rejected", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[feature.default.dependencies]
foo = "*"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("reserved") != std::string::npos);
}

TEST_CASE("environment using an undefined feature", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[environments]
dev = ["missing"]
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("undefined feature 'missing'") != std::string::npos);
}

TEST_CASE("environment listing a feature twice", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[feature.a.dependencies]
foo = "*"

[environments]
dev = ["a", "a"]
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("listed twice") != std::string::npos);
}

TEST_CASE("environment names are restricted", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[environments]
Dev_Env = []
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("Dev_Env") != std::string::npos);
}

TEST_CASE("unknown field in feature table", "[manifest]") {
    auto r = Manifest::parse(R"(
[project]
name = "x"

[feature.a]
plattforms = ["linux-64"]
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find("plattforms") != std::string::npos);
}

// ===== Mutation =====

TEST_CASE("add and remove channels through the manifest", "[manifest]") {
    auto r = Manifest::parse(MULTI_ENV_MANIFEST);
    REQUIRE(r.is_ok());
    auto& m = r.value();

    REQUIRE(m.add_channels({{"bioconda", std::nullopt}}, FeatureName::default_name()).is_ok());
    REQUIRE(m.default_feature().channels->size() == 2);

    auto cuda = FeatureName::named("cuda").value();
    REQUIRE(m.remove_channels({{"nvidia", std::nullopt}}, cuda).is_ok());
    REQUIRE(m.feature(cuda)->channels->empty());

    auto missing = m.add_channels({{"x", std::nullopt}}, FeatureName::named("nope").value());
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == StrataError::NotFound);
}

TEST_CASE("load manifest from disk", "[manifest]") {
    TempDir tmp;
    tmp.write_file("strata.toml", "[project]\nname = \"ondisk\"\n");
    auto r = Manifest::load(tmp.path / "strata.toml");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().project.name == "ondisk");

    auto missing = Manifest::load(tmp.path / "nope.toml");
    REQUIRE(missing.is_err());
    REQUIRE(missing.error().code == StrataError::IO);
}
