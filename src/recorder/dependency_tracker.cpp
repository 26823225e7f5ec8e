#include "recorder/dependency_tracker.h"
#include "common/hashing.h"
#include "fingerprint/module.h"
#include "fingerprint/source_tree.h"
#include "recorder/imports.h"
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace testsieve {

namespace {

const std::set<std::string> SKIP_DIRS = {
    ".venv", "venv", ".tox", "site-packages", ".git", "__pycache__",
    ".pytest_cache", ".mypy_cache", "node_modules", ".eggs",
};

const std::vector<std::string> PACKAGE_SEARCH_DIRS = {"", "src", "lib", "source", "packages"};

// Top-level standard library modules.
const std::set<std::string> STDLIB_MODULES = {
    "abc", "argparse", "array", "ast", "asyncio", "atexit", "base64", "binascii", "bisect",
    "builtins", "bz2", "calendar", "cmath", "codecs", "collections", "concurrent", "configparser",
    "contextlib", "contextvars", "copy", "copyreg", "csv", "ctypes", "dataclasses", "datetime",
    "decimal", "difflib", "dis", "email", "enum", "errno", "faulthandler", "fcntl", "filecmp",
    "fnmatch", "fractions", "functools", "gc", "getpass", "gettext", "glob", "gzip", "hashlib",
    "heapq", "hmac", "html", "http", "importlib", "inspect", "io", "ipaddress", "itertools",
    "json", "keyword", "linecache", "locale", "logging", "lzma", "marshal", "math", "mimetypes",
    "multiprocessing", "numbers", "operator", "os", "pathlib", "pickle", "pkgutil", "platform",
    "pprint", "queue", "random", "re", "reprlib", "secrets", "select", "selectors", "shlex",
    "shutil", "signal", "site", "socket", "sqlite3", "ssl", "stat", "statistics", "string",
    "struct", "subprocess", "sys", "sysconfig", "tempfile", "textwrap", "threading", "time",
    "timeit", "tokenize", "traceback", "types", "typing", "unittest", "urllib", "uuid",
    "warnings", "weakref", "xml", "zipfile", "zlib", "zoneinfo",
};

std::string top_level_name(const std::string& module_name) {
    return module_name.substr(0, module_name.find('.'));
}

bool has_prefix(const std::filesystem::path& path, const std::filesystem::path& prefix) {
    auto it = path.begin();
    for (const auto& part : prefix) {
        if (part.empty()) continue;
        if (it == path.end() || *it != part) return false;
        ++it;
    }
    return true;
}

}  // namespace

DependencyTracker::DependencyTracker(std::filesystem::path root)
    : root_(std::filesystem::absolute(root).lexically_normal()) {}

void DependencyTracker::start(const std::string& context, const std::string& test_file) {
    std::lock_guard lock(mutex_);
    context_ = context;
    current_ = TrackedDependencies{};
    current_.test_file = test_file;
}

TrackedDependencies DependencyTracker::stop() {
    std::lock_guard lock(mutex_);
    TrackedDependencies result = std::move(current_);
    current_ = TrackedDependencies{};
    context_.reset();
    return result;
}

std::optional<std::string> DependencyTracker::current_context() const {
    std::lock_guard lock(mutex_);
    return context_;
}

void DependencyTracker::on_file_read(const std::string& path) {
    std::lock_guard lock(mutex_);
    if (!context_) return;

    auto relpath = project_path(path);
    if (!relpath || is_source_file(*relpath)) return;

    auto sha = file_sha(*relpath);
    if (!sha) return;
    current_.files.insert({*relpath, *sha});
}

void DependencyTracker::on_module_import(const std::string& module_name,
                                         const std::optional<std::string>& module_file) {
    std::lock_guard lock(mutex_);
    if (!context_) return;

    if (module_file) {
        std::string source = *module_file;
        if (source.size() > 4 && source.compare(source.size() - 4, 4, ".pyc") == 0) source.pop_back();
        if (auto relpath = project_path(source)) {
            current_.local_imports.insert(*relpath);
            return;
        }
    } else {
        // builtin
        return;
    }

    if (is_stdlib_module(module_name, module_file)) return;
    std::string package = top_level_name(module_name);
    if (package.empty() || package[0] == '_' || is_local_package(package)) return;
    current_.external_imports.insert(package);
}

std::optional<std::string> DependencyTracker::project_path(const std::string& path) {
    std::lock_guard lock(mutex_);
    auto cached = path_cache_.find(path);
    if (cached != path_cache_.end()) return cached->second;

    std::filesystem::path candidate(path);
    if (candidate.is_relative()) candidate = root_ / candidate;
    auto relative = candidate.lexically_normal().lexically_relative(root_);

    std::optional<std::string> result;
    if (!relative.empty() && *relative.begin() != ".." && relative.is_relative()) {
        bool skipped = false;
        for (const auto& part : relative) {
            std::string name = part.string();
            if (SKIP_DIRS.count(name) ||
                (name.size() > 9 && name.compare(name.size() - 9, 9, ".egg-info") == 0)) {
                skipped = true;
                break;
            }
        }
        if (!skipped) result = relative.generic_string();
    }
    path_cache_.emplace(path, result);
    return result;
}

bool DependencyTracker::is_local_package(const std::string& name) {
    std::lock_guard lock(mutex_);
    auto cached = local_packages_.find(name);
    if (cached != local_packages_.end()) return cached->second;

    bool local = false;
    std::error_code ec;
    for (const auto& dir : PACKAGE_SEARCH_DIRS) {
        std::filesystem::path base = dir.empty() ? root_ / name : root_ / dir / name;
        if (std::filesystem::is_regular_file(base / "__init__.py", ec) ||
            std::filesystem::is_regular_file(base.string() + SOURCE_EXTENSION, ec)) {
            local = true;
            break;
        }
    }
    local_packages_.emplace(name, local);
    return local;
}

bool DependencyTracker::is_stdlib_module(const std::string& module_name,
                                         const std::optional<std::string>& module_file) const {
    std::lock_guard lock(mutex_);
    if (STDLIB_MODULES.count(top_level_name(module_name))) return true;
    if (!module_file) return false;

    auto file = std::filesystem::path(*module_file).lexically_normal();
    for (const auto& stdlib : stdlib_paths_) {
        if (has_prefix(file, stdlib.lexically_normal())) return true;
    }
    return false;
}

std::optional<std::string> DependencyTracker::module_file_at(const std::filesystem::path& base) {
    std::error_code ec;
    std::filesystem::path module_file = root_ / (base.string() + SOURCE_EXTENSION);
    if (std::filesystem::is_regular_file(module_file, ec)) return project_path(module_file.string());

    std::filesystem::path package_init = root_ / base / "__init__.py";
    if (std::filesystem::is_regular_file(package_init, ec)) return project_path(package_init.string());
    return std::nullopt;
}

std::optional<std::string> DependencyTracker::resolve_module(const std::string& module_name) {
    std::lock_guard lock(mutex_);
    if (module_name.empty()) return std::nullopt;
    std::filesystem::path relative;
    size_t begin = 0;
    while (begin <= module_name.size()) {
        size_t end = module_name.find('.', begin);
        if (end == std::string::npos) end = module_name.size();
        relative /= module_name.substr(begin, end - begin);
        begin = end + 1;
    }

    for (const auto& dir : PACKAGE_SEARCH_DIRS) {
        auto found = module_file_at(dir.empty() ? relative : std::filesystem::path(dir) / relative);
        if (found) return found;
    }
    return std::nullopt;
}

std::optional<std::string> DependencyTracker::resolve_relative(const std::string& module_path, int level,
                                                               const std::string& module) {
    std::filesystem::path base = std::filesystem::path(module_path).parent_path();
    for (int i = 1; i < level; ++i) base = base.parent_path();

    std::filesystem::path target = base;
    size_t begin = 0;
    while (!module.empty() && begin <= module.size()) {
        size_t end = module.find('.', begin);
        if (end == std::string::npos) end = module.size();
        target /= module.substr(begin, end - begin);
        begin = end + 1;
    }
    return module_file_at(target);
}

std::optional<std::string> DependencyTracker::read_source(const std::string& relpath) const {
    std::ifstream in(root_ / relpath, std::ios::binary);
    if (!in) return std::nullopt;
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::set<std::string> DependencyTracker::module_imports(const std::string& module_path) {
    std::lock_guard lock(mutex_);
    std::set<std::string> imports;
    auto source = read_source(module_path);
    if (!source) return imports;

    for (const auto& statement : scan_imports(*source)) {
        std::vector<std::optional<std::string>> resolved;
        if (statement.level == 0) {
            resolved.push_back(resolve_module(statement.module));
            // from pkg import submodule
            for (const auto& name : statement.names) {
                if (name != "*") resolved.push_back(resolve_module(statement.module + "." + name));
            }
        } else if (!statement.module.empty()) {
            resolved.push_back(resolve_relative(module_path, statement.level, statement.module));
            for (const auto& name : statement.names) {
                if (name != "*") {
                    resolved.push_back(resolve_relative(module_path, statement.level, statement.module + "." + name));
                }
            }
        } else {
            // from . import name: each name may be a sibling module.
            bool any = false;
            for (const auto& name : statement.names) {
                auto sibling = resolve_relative(module_path, statement.level, name);
                if (sibling) {
                    resolved.push_back(sibling);
                    any = true;
                }
            }
            if (!any) resolved.push_back(resolve_relative(module_path, statement.level, ""));
        }
        for (const auto& file : resolved) {
            if (file && *file != module_path) imports.insert(*file);
        }
    }
    return imports;
}

std::set<std::string> DependencyTracker::module_external_imports(const std::string& module_path) {
    std::lock_guard lock(mutex_);
    std::set<std::string> packages;
    auto source = read_source(module_path);
    if (!source) return packages;

    for (const auto& statement : scan_imports(*source)) {
        if (statement.level != 0) continue;
        std::string package = top_level_name(statement.module);
        if (package.empty() || package[0] == '_') continue;
        if (is_local_package(package) || resolve_module(statement.module)) continue;
        if (is_stdlib_module(statement.module)) continue;
        if (!installed_packages_.empty() && !installed_packages_.count(package)) continue;
        packages.insert(package);
    }
    return packages;
}

std::optional<std::string> DependencyTracker::file_sha(const std::string& relpath) {
    auto mtime = stat_mtime_ns(root_ / relpath);
    auto cached = sha_cache_.find(relpath);
    if (cached != sha_cache_.end() && cached->second.mtime == mtime) return cached->second.sha;

    std::optional<std::string> sha;
    if (auto content = read_source(relpath)) {
        sha = git_blob_sha(*content);
    } else {
        spdlog::debug("Cannot hash file dependency {}", relpath);
    }
    sha_cache_[relpath] = HashedFile{mtime, sha};
    return sha;
}

void DependencyTracker::set_installed_packages(std::set<std::string> names) {
    std::lock_guard lock(mutex_);
    installed_packages_ = std::move(names);
}

void DependencyTracker::set_stdlib_paths(std::vector<std::filesystem::path> paths) {
    std::lock_guard lock(mutex_);
    stdlib_paths_ = std::move(paths);
}

void DependencyTracker::close() {
    std::lock_guard lock(mutex_);
    context_.reset();
    current_ = TrackedDependencies{};
    path_cache_.clear();
    sha_cache_.clear();
    local_packages_.clear();
}

}  // namespace testsieve
