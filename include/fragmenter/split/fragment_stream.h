#pragma once

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fragmenter::split {

/**
 * @brief Producer side of a lazy fragment sequence
 *
 * Each implementation owns the source text and all scanning state of exactly one
 * split operation. next() computes fragments on demand and returns std::nullopt
 * once the source is exhausted.
 */
class FragmentSource {
public:
    virtual ~FragmentSource() = default;

    virtual std::optional<std::string> next() = 0;
};

/**
 * @brief Forward-only, single-pass sequence of fragments
 *
 * Move-only. A fragment is computed only when the consumer asks for it, so a
 * consumer that stops early leaves the rest of the source unscanned.
 */
class FragmentStream {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        iterator() = default;
        explicit iterator(FragmentStream* stream);

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        iterator& operator++();
        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& a, const iterator& b) {
            return a.stream_ == b.stream_;
        }
        friend bool operator!=(const iterator& a, const iterator& b) { return !(a == b); }

    private:
        void advance();

        FragmentStream* stream_ = nullptr;
        std::optional<std::string> current_;
    };

    FragmentStream() = default;
    explicit FragmentStream(std::unique_ptr<FragmentSource> source);

    FragmentStream(const FragmentStream&) = delete;
    FragmentStream& operator=(const FragmentStream&) = delete;
    FragmentStream(FragmentStream&&) noexcept = default;
    FragmentStream& operator=(FragmentStream&&) noexcept = default;

    // Next fragment, or std::nullopt when the sequence is exhausted
    std::optional<std::string> next();

    // Number of fragments handed out so far
    size_t produced() const { return produced_; }

    bool exhausted() const { return source_ == nullptr; }

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

    // Drain all remaining fragments
    std::vector<std::string> toVector();

private:
    std::unique_ptr<FragmentSource> source_;
    size_t produced_ = 0;
};

} // namespace fragmenter::split
