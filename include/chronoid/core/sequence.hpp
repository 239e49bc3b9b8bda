/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file sequence.hpp
 * @brief An unbounded, lazy stream of identifiers over one generator.
 *
 * @details
 * A `Sequence` takes exclusive ownership of a generator and pulls one identifier
 * per step. It never ends and cannot be rewound: every pull advances the owned
 * generator, so a fresh stream requires a fresh generator.
 */

#pragma once

#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>

namespace chronoid::core {

/**
 * @class Sequence
 * @brief Infinite input range over `Generator::create()`.
 *
 * @tparam Generator `RawGenerator` or `StringGenerator`.
 *
 * Iterators point back at the sequence that made them, so a sequence can be
 * neither copied nor moved. Bind the prvalue returned by `into_sequence()`
 * directly to a variable.
 *
 * @code
 * auto ids = NodeId::random().string_generator().into_sequence();
 * for (const auto& id : ids) {
 *     if (done(id))
 *         break;
 * }
 * @endcode
 */
template <typename Generator> class Sequence {
  public:
    using value_type = decltype(std::declval<Generator&>().create());

    /**
     * @class iterator
     * @brief Single-pass iterator; never compares equal to `end()`.
     */
    class iterator {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Sequence::value_type;
        using difference_type = std::ptrdiff_t;
        using pointer = const value_type*;
        using reference = const value_type&;

        iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++()
        {
            current_ = owner_->next();
            return *this;
        }

        void operator++(int) { ++*this; }

        friend bool operator==(const iterator& lhs, const iterator& rhs)
        {
            return lhs.owner_ == rhs.owner_;
        }

        friend bool operator!=(const iterator& lhs, const iterator& rhs) { return !(lhs == rhs); }

      private:
        friend class Sequence;

        explicit iterator(Sequence* owner) : owner_(owner), current_(owner->next()) {}

        Sequence* owner_ = nullptr;
        value_type current_{};
    };

    explicit Sequence(Generator generator) : generator_(std::move(generator)) {}

    Sequence(const Sequence&) = delete;
    Sequence& operator=(const Sequence&) = delete;
    Sequence(Sequence&&) = delete;
    Sequence& operator=(Sequence&&) = delete;

    /// Produces the next identifier. Always succeeds unless a reseed fails.
    value_type next() { return generator_.create(); }

    /// Pulls the next `count` identifiers, in production order.
    std::vector<value_type> take(std::size_t count)
    {
        std::vector<value_type> out;
        out.reserve(count);
        for (std::size_t i = 0; i < count; ++i) {
            out.push_back(next());
        }
        return out;
    }

    /// Starts iteration; pulls the first identifier immediately.
    iterator begin() { return iterator(this); }

    /// Sentinel that no live iterator ever reaches.
    iterator end() { return iterator(); }

    const Generator& generator() const { return generator_; }

  private:
    Generator generator_;
};

} // namespace chronoid::core
