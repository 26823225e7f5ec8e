#include "store/packages.h"
#include <regex>

namespace testsieve {

std::string format_packages(const std::map<std::string, std::string>& packages) {
    std::string manifest;
    for (const auto& [name, version] : packages) {
        if (!manifest.empty()) manifest += ", ";
        manifest += name;
        if (!version.empty()) {
            manifest += ' ';
            manifest += version;
        }
    }
    return manifest;
}

std::map<std::string, std::string> parse_packages(const std::string& manifest) {
    std::map<std::string, std::string> packages;
    size_t pos = 0;
    while (pos <= manifest.size()) {
        size_t sep = manifest.find(", ", pos);
        std::string item = manifest.substr(pos, sep == std::string::npos ? std::string::npos : sep - pos);
        size_t first = item.find_first_not_of(" \t");
        size_t last = item.find_last_not_of(" \t");
        if (first != std::string::npos) {
            item = item.substr(first, last - first + 1);
            size_t space = item.rfind(' ');
            if (space == std::string::npos) {
                packages[item] = "";
            } else {
                packages[item.substr(0, space)] = item.substr(space + 1);
            }
        }
        if (sep == std::string::npos) break;
        pos = sep + 2;
    }
    return packages;
}

std::string drop_patch_version(const std::string& manifest) {
    static const std::regex patch_pattern(R"(\b([\w_-]+\s\d+\.\d+)\.\w+\b)");
    return std::regex_replace(manifest, patch_pattern, "$1");
}

std::set<std::string> compute_changed_packages(const std::string& old_manifest,
                                               const std::string& new_manifest) {
    auto old_packages = parse_packages(old_manifest);
    auto new_packages = parse_packages(new_manifest);

    std::set<std::string> changed;
    for (const auto& [name, version] : new_packages) {
        auto it = old_packages.find(name);
        if (it == old_packages.end() || it->second != version) changed.insert(name);
    }
    for (const auto& [name, version] : old_packages) {
        if (!new_packages.count(name)) changed.insert(name);
    }
    return changed;
}

}  // namespace testsieve
