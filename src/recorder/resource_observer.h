#pragma once
#ifndef TESTSIEVE_RESOURCE_OBSERVER_H
#define TESTSIEVE_RESOURCE_OBSERVER_H

#include <optional>
#include <string>

namespace testsieve {

// Called synchronously by the test harness around resource access of the
// code under test. Implementations may be re-entered from inside a
// callback (a read can trigger an import and vice versa).
class ResourceAccessObserver {
public:
    virtual ~ResourceAccessObserver() = default;

    // A file is about to be opened for reading. Relative paths are relative
    // to the project root.
    virtual void on_file_read(const std::string& path) = 0;

    // A module finished importing. module_file is its source path, or
    // nullopt for modules not backed by a file (builtins).
    virtual void on_module_import(const std::string& module_name,
                                  const std::optional<std::string>& module_file) = 0;
};

}  // namespace testsieve

#endif  // TESTSIEVE_RESOURCE_OBSERVER_H
