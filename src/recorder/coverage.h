#pragma once
#ifndef TESTSIEVE_COVERAGE_H
#define TESTSIEVE_COVERAGE_H

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace testsieve {

// Executed line numbers per root-relative filename.
using FilesLines = std::map<std::string, std::set<int>>;
// FilesLines per context label (one context per test).
using ContextLines = std::map<std::string, FilesLines>;

// Line coverage collector. Lines executed while started are attributed to
// the current context.
class CoverageProvider {
public:
    virtual ~CoverageProvider() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual bool started() const = 0;
    virtual void switch_context(const std::string& context) = 0;

    virtual ContextLines data() const = 0;
    virtual void erase() = 0;

    // Merge lines measured elsewhere into the current context.
    virtual void add_lines(const FilesLines& lines) = 0;
};

// Collector fed directly by the harness: the instrumented runtime reports
// every executed line through record().
class InMemoryCoverage : public CoverageProvider {
public:
    void start() override;
    void stop() override;
    bool started() const override;
    void switch_context(const std::string& context) override;

    ContextLines data() const override;
    void erase() override;
    void add_lines(const FilesLines& lines) override;

    // Ignored while stopped.
    void record(const std::string& filename, int line);
    void record(const std::string& filename, const std::set<int>& lines);

    std::string context() const;

private:
    mutable std::mutex mutex_;
    bool started_ = false;
    std::string context_;
    ContextLines data_;
};

// Collectors currently nested in the process. Only the top one runs.
class CoverageStack {
public:
    // Pauses the current top and starts the collector on top of it.
    void push(CoverageProvider& coverage);

    // Stops and pops everything above and including the collector, then
    // resumes the new top. No-op when the collector is not on the stack.
    void release(CoverageProvider& coverage);

    bool contains(const CoverageProvider& coverage) const;
    CoverageProvider* top() const;
    // Collector directly below the top, or nullptr.
    CoverageProvider* parent() const;
    size_t size() const { return entries_.size(); }

    std::vector<CoverageProvider*> snapshot() const { return entries_; }

private:
    std::vector<CoverageProvider*> entries_;
};

}  // namespace testsieve

#endif  // TESTSIEVE_COVERAGE_H
