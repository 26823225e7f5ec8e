#pragma once
#ifndef TESTSIEVE_PACKAGES_H
#define TESTSIEVE_PACKAGES_H

#include <map>
#include <set>
#include <string>

namespace testsieve {

// Package manifests are "name version" items joined by ", ", sorted by name.

std::string format_packages(const std::map<std::string, std::string>& packages);

std::map<std::string, std::string> parse_packages(const std::string& manifest);

// "numpy 1.21.3" -> "numpy 1.21"
std::string drop_patch_version(const std::string& manifest);

// Names added, removed or with a different version.
std::set<std::string> compute_changed_packages(const std::string& old_manifest,
                                               const std::string& new_manifest);

}  // namespace testsieve

#endif  // TESTSIEVE_PACKAGES_H
