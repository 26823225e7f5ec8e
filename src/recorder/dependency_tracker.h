#pragma once
#ifndef TESTSIEVE_DEPENDENCY_TRACKER_H
#define TESTSIEVE_DEPENDENCY_TRACKER_H

#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>
#include "recorder/resource_observer.h"
#include "store/types.h"

namespace testsieve {

// What one test touched besides the lines it executed.
struct TrackedDependencies {
    std::set<FileDependency> files;
    // Root-relative source files imported while the test ran.
    std::set<std::string> local_imports;
    // Top-level names of third-party packages imported while the test ran.
    std::set<std::string> external_imports;
    std::string test_file;
};

// Captures non-coverage dependencies of the running test: project data
// files it reads and modules it imports. One test context is active at a
// time; callbacks outside a context are ignored.
class DependencyTracker : public ResourceAccessObserver {
public:
    explicit DependencyTracker(std::filesystem::path root);

    void on_file_read(const std::string& path) override;
    void on_module_import(const std::string& module_name,
                          const std::optional<std::string>& module_file) override;

    void start(const std::string& context, const std::string& test_file = "");
    TrackedDependencies stop();
    std::optional<std::string> current_context() const;

    // Root-relative path when the file is inside the project and not under
    // an ignored directory.
    std::optional<std::string> project_path(const std::string& path);

    // True when the project itself provides a top-level package or module
    // with this name, so it is not a third-party dependency.
    bool is_local_package(const std::string& name);
    bool is_stdlib_module(const std::string& module_name,
                          const std::optional<std::string>& module_file = std::nullopt) const;

    // Root-relative source file for a dotted module name, if the project has one.
    std::optional<std::string> resolve_module(const std::string& module_name);

    // Project modules imported by a project module.
    std::set<std::string> module_imports(const std::string& module_path);
    // Third-party packages imported by a project module.
    std::set<std::string> module_external_imports(const std::string& module_path);

    // Restricts external packages to these names. Empty accepts any name
    // that is neither local nor standard library.
    void set_installed_packages(std::set<std::string> names);
    void set_stdlib_paths(std::vector<std::filesystem::path> paths);

    const std::filesystem::path& root() const { return root_; }

    void close();

private:
    std::filesystem::path root_;
    mutable std::recursive_mutex mutex_;

    std::optional<std::string> context_;
    TrackedDependencies current_;

    std::unordered_map<std::string, std::optional<std::string>> path_cache_;
    struct HashedFile {
        std::optional<int64_t> mtime;
        std::optional<std::string> sha;
    };

    // Entries are dropped when the file's mtime moves.
    std::unordered_map<std::string, HashedFile> sha_cache_;
    std::unordered_map<std::string, bool> local_packages_;
    std::set<std::string> installed_packages_;
    std::vector<std::filesystem::path> stdlib_paths_;

    std::optional<std::string> file_sha(const std::string& relpath);
    std::optional<std::string> read_source(const std::string& relpath) const;
    std::optional<std::string> resolve_relative(const std::string& module_path, int level,
                                                const std::string& module);
    std::optional<std::string> module_file_at(const std::filesystem::path& base);
};

}  // namespace testsieve

#endif  // TESTSIEVE_DEPENDENCY_TRACKER_H
