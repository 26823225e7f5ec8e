#include "recorder/coverage.h"
#include <algorithm>

namespace testsieve {

void InMemoryCoverage::start() {
    std::lock_guard lock(mutex_);
    started_ = true;
}

void InMemoryCoverage::stop() {
    std::lock_guard lock(mutex_);
    started_ = false;
}

bool InMemoryCoverage::started() const {
    std::lock_guard lock(mutex_);
    return started_;
}

void InMemoryCoverage::switch_context(const std::string& context) {
    std::lock_guard lock(mutex_);
    context_ = context;
}

std::string InMemoryCoverage::context() const {
    std::lock_guard lock(mutex_);
    return context_;
}

ContextLines InMemoryCoverage::data() const {
    std::lock_guard lock(mutex_);
    return data_;
}

void InMemoryCoverage::erase() {
    std::lock_guard lock(mutex_);
    data_.clear();
}

void InMemoryCoverage::add_lines(const FilesLines& lines) {
    std::lock_guard lock(mutex_);
    auto& files = data_[context_];
    for (const auto& [filename, numbers] : lines) {
        files[filename].insert(numbers.begin(), numbers.end());
    }
}

void InMemoryCoverage::record(const std::string& filename, int line) {
    std::lock_guard lock(mutex_);
    if (!started_) return;
    data_[context_][filename].insert(line);
}

void InMemoryCoverage::record(const std::string& filename, const std::set<int>& lines) {
    std::lock_guard lock(mutex_);
    if (!started_) return;
    data_[context_][filename].insert(lines.begin(), lines.end());
}

void CoverageStack::push(CoverageProvider& coverage) {
    if (!entries_.empty() && entries_.back() != &coverage) {
        entries_.back()->stop();
    }
    if (entries_.empty() || entries_.back() != &coverage) {
        entries_.push_back(&coverage);
    }
    if (!coverage.started()) coverage.start();
}

void CoverageStack::release(CoverageProvider& coverage) {
    if (!contains(coverage)) return;
    while (entries_.back() != &coverage) {
        entries_.back()->stop();
        entries_.pop_back();
    }
    if (coverage.started()) coverage.stop();
    entries_.pop_back();
    if (!entries_.empty()) entries_.back()->start();
}

bool CoverageStack::contains(const CoverageProvider& coverage) const {
    return std::find(entries_.begin(), entries_.end(), &coverage) != entries_.end();
}

CoverageProvider* CoverageStack::top() const {
    return entries_.empty() ? nullptr : entries_.back();
}

CoverageProvider* CoverageStack::parent() const {
    return entries_.size() < 2 ? nullptr : entries_[entries_.size() - 2];
}

}  // namespace testsieve
