#pragma once
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace docnet {

// A lazy view over a container owned by someone else. Every element of the
// source goes through `step`, which either maps it to a Value or drops it
// (std::nullopt). Nothing is computed until the range is iterated, and each
// begin() starts a fresh pass.
//
// The range only borrows the source: mutating the source invalidates it.
template <typename Source, typename Value>
class LazyRange {
public:
    using SourceIter = typename Source::const_iterator;
    using Step = std::function<std::optional<Value>(const typename Source::value_type&)>;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Value;
        using difference_type = std::ptrdiff_t;
        using pointer = const Value*;
        using reference = const Value&;

        iterator() = default;
        iterator(SourceIter it, SourceIter end, const Step* step)
            : it_(it), end_(end), step_(step) {
            skip();
        }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++() {
            ++it_;
            skip();
            return *this;
        }
        iterator operator++(int) {
            iterator tmp = *this;
            ++(*this);
            return tmp;
        }

        friend bool operator==(const iterator& a, const iterator& b) { return a.it_ == b.it_; }
        friend bool operator!=(const iterator& a, const iterator& b) { return !(a == b); }

    private:
        // Moves forward until `step` accepts an element or the source ends
        void skip() {
            current_.reset();
            for (; it_ != end_; ++it_) {
                current_ = (*step_)(*it_);
                if (current_) return;
            }
        }

        SourceIter it_{};
        SourceIter end_{};
        const Step* step_ = nullptr;
        std::optional<Value> current_;
    };

    LazyRange(const Source& source, Step step)
        : source_(&source), step_(std::move(step)) {}

    iterator begin() const { return iterator(source_->begin(), source_->end(), &step_); }
    iterator end() const { return iterator(source_->end(), source_->end(), &step_); }

    // Runs the whole pass and keeps the results
    std::vector<Value> collect() const {
        std::vector<Value> out;
        for (const auto& v : *this) out.push_back(v);
        return out;
    }

private:
    const Source* source_;
    Step step_;
};

}
