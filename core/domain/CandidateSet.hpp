#pragma once

#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace visits::domain {

// Indices returned by one spatial index query; read-only once built.
class CandidateSet {
public:
    CandidateSet() = default;

    explicit CandidateSet(std::vector<std::size_t> indices) : indices_(std::move(indices)) {
        std::sort(indices_.begin(), indices_.end());
        indices_.erase(std::unique(indices_.begin(), indices_.end()), indices_.end());
    }

    bool contains(std::size_t index) const {
        return std::binary_search(indices_.begin(), indices_.end(), index);
    }

    bool empty() const { return indices_.empty(); }
    std::size_t size() const { return indices_.size(); }

    // Undefined when empty.
    std::size_t first() const { return indices_.front(); }
    std::size_t last() const { return indices_.back(); }

private:
    std::vector<std::size_t> indices_;
};

} // namespace visits::domain
