#include <strata/site_packages.hpp>
#include <strata/log.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace strata {

namespace fs = std::filesystem;

std::optional<InstalledDist> InstalledDist::try_from_path(const fs::path& dir) {
    if (dir.extension() != ".dist-info") return std::nullopt;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) return std::nullopt;

    // Names are escaped so the first dash separates name from version
    std::string stem = dir.stem().string();
    auto dash = stem.find('-');
    if (dash == std::string::npos || dash == 0 || dash + 1 == stem.size()) {
        return std::nullopt;
    }

    InstalledDist dist;
    dist.name = stem.substr(0, dash);
    dist.version = stem.substr(dash + 1);
    dist.dist_info = dir;
    return dist;
}

Result<std::optional<std::string>> InstalledDist::installer() const {
    fs::path path = dist_info / "INSTALLER";

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<std::optional<std::string>>::ok(std::nullopt);
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return StrataError{StrataError::IO, "cannot read " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();

    std::string text = ss.str();
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    text.erase(text.begin(), std::find_if(text.begin(), text.end(), not_space));
    text.erase(std::find_if(text.rbegin(), text.rend(), not_space).base(), text.end());
    return Result<std::optional<std::string>>::ok(std::move(text));
}

Result<std::vector<InstalledDist>> list_installed_dists(const fs::path& site_packages) {
    std::vector<InstalledDist> dists;

    std::error_code ec;
    for (fs::directory_iterator it(site_packages, ec), end; !ec && it != end; it.increment(ec)) {
        if (auto dist = InstalledDist::try_from_path(it->path())) {
            dists.push_back(std::move(*dist));
        }
    }
    if (ec) {
        return StrataError{StrataError::IO,
            "cannot list " + site_packages.string() + ": " + ec.message()};
    }

    std::sort(dists.begin(), dists.end(),
        [](const InstalledDist& a, const InstalledDist& b) { return a.name < b.name; });
    return Result<std::vector<InstalledDist>>::ok(std::move(dists));
}

Result<std::vector<InstalledDist>> find_dists_installed_by(const fs::path& site_packages,
                                                           const std::string& installer) {
    auto all = list_installed_dists(site_packages);
    if (all.is_err()) return std::move(all).error();

    std::vector<InstalledDist> ours;
    for (auto& dist : all.value()) {
        auto who = dist.installer();
        if (who.is_err()) {
            // Without the installer we cannot tell whether we own it
            log::warn("could not get installer for %s: %s, will not remove distribution",
                      dist.name.c_str(), who.error().message.c_str());
            continue;
        }
        if (who.value().value_or("") == installer) {
            ours.push_back(std::move(dist));
        }
    }
    return Result<std::vector<InstalledDist>>::ok(std::move(ours));
}

} // namespace strata
