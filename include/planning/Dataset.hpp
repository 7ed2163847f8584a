/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DATASET_HPP
#define DATASET_HPP

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace Amortize {

/**
 * @brief Input sequence for planning and execution
 *
 * Either a finite vector or a single-pass generator. Items pulled from a
 * generator for inspection (sampling, counting) are kept in a prefix
 * buffer, and next() always yields the buffered prefix first and then the
 * untouched remainder, so every original item is delivered exactly once and
 * in order no matter how much was inspected beforehand.
 */
template <typename T> class Dataset {
public:
    using Generator = std::function<std::optional<T>()>;

    static Dataset fromVector(std::vector<T> items) {
        Dataset dataset;
        dataset.m_items = std::move(items);
        dataset.m_exhausted = true;
        return dataset;
    }

    /**
     * @param generator Returns std::nullopt once exhausted
     * @param lengthHint Caller-supplied total length, if known
     */
    static Dataset fromGenerator(Generator generator,
                                 std::optional<size_t> lengthHint = std::nullopt) {
        Dataset dataset;
        dataset.m_generator = std::move(generator);
        dataset.m_singlePass = true;
        dataset.m_exhausted = !dataset.m_generator;
        dataset.m_lengthHint = lengthHint;
        return dataset;
    }

    bool isSinglePass() const { return m_singlePass; }

    // Exact length, available once nothing is left in the generator
    std::optional<size_t> knownSize() const {
        if (m_exhausted) {
            return m_items.size() + m_streamed;
        }
        return std::nullopt;
    }

    std::optional<size_t> lengthHint() const { return m_lengthHint; }

    /**
     * @brief Make the first n items inspectable via at()
     * @return number of items available, at most n
     */
    size_t buffer(size_t n) {
        requireNotStreaming();
        while (m_items.size() < n && pullOne()) {
        }
        return std::min(n, m_items.size());
    }

    /**
     * @brief Buffer every remaining item
     * @return total length of the dataset
     */
    size_t bufferAll() {
        requireNotStreaming();
        while (pullOne()) {
        }
        return m_items.size();
    }

    size_t bufferedCount() const { return m_items.size(); }

    const T& at(size_t index) const { return m_items.at(index); }

    /**
     * @brief Next item in original order: buffered prefix, then live remainder
     */
    std::optional<T> next() {
        if (m_cursor < m_items.size()) {
            return m_items[m_cursor++];
        }
        if (m_exhausted) {
            return std::nullopt;
        }
        std::optional<T> item = m_generator();
        if (!item) {
            m_exhausted = true;
            return std::nullopt;
        }
        ++m_streamed;
        return item;
    }

    /**
     * @brief Collect every item not yet returned by next()
     */
    std::vector<T> takeRemaining() {
        std::vector<T> out;
        if (m_singlePass && m_cursor == 0 && m_streamed == 0) {
            // Nothing handed out yet: the whole buffer moves over
            bufferAll();
            out = std::move(m_items);
            m_items.clear();
            m_streamed = out.size();
            return out;
        }
        if (auto known = knownSize()) {
            out.reserve(*known - m_cursor);
        }
        while (auto item = next()) {
            out.push_back(std::move(*item));
        }
        return out;
    }

    // Rewind a replayable dataset to its first item
    void rewind() {
        if (m_streamed > 0) {
            throw std::logic_error("single-pass dataset already streamed past its buffer");
        }
        m_cursor = 0;
    }

private:
    Dataset() = default;

    bool pullOne() {
        if (m_exhausted) {
            return false;
        }
        std::optional<T> item = m_generator();
        if (!item) {
            m_exhausted = true;
            return false;
        }
        m_items.push_back(std::move(*item));
        return true;
    }

    void requireNotStreaming() const {
        if (m_streamed > 0) {
            throw std::logic_error("cannot buffer a single-pass dataset after streaming began");
        }
    }

    std::vector<T> m_items;   // whole dataset, or the prefix buffer of a generator
    Generator m_generator;
    std::optional<size_t> m_lengthHint;
    size_t m_cursor{0};
    size_t m_streamed{0};     // generator items handed out past the buffer
    bool m_singlePass{false};
    bool m_exhausted{false};
};

} // namespace Amortize

#endif // DATASET_HPP
