//! # Arenas and Interners
//!
//! Append-only stores addressed by typed integer handles.
//!
//! ## Overview
//!
//! - `Index<T>`: an opaque, copyable handle to a `T` stored in some arena.
//!   Handles compare by value; they are never dereferenced directly.
//! - `Arena<T>`: appends values and hands out stable handles. There is no
//!   removal, so a handle stays valid for the lifetime of its arena.
//! - `Interner<T>`: an arena that deduplicates. Inserting a value equal to
//!   one already stored returns the existing handle.
//!
//! Indexing with a handle the store never issued is a broken compiler
//! invariant and raises `InternalError`.

#pragma once

#include "common.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace spark::arena {

/// Typed handle into an `Arena<T>` or `Interner<T>`.
template <typename T> class Index {
public:
    /// Builds a handle from a raw slot number. Only the owning store and the
    /// fixed-handle tables (such as the primitive type ids) should do this.
    [[nodiscard]] static constexpr auto from_raw(uint32_t raw) -> Index {
        return Index(raw);
    }

    [[nodiscard]] constexpr auto raw() const -> uint32_t {
        return raw_;
    }

    [[nodiscard]] constexpr auto operator==(const Index& other) const -> bool = default;
    [[nodiscard]] constexpr auto operator<(const Index& other) const -> bool {
        return raw_ < other.raw_;
    }

private:
    constexpr explicit Index(uint32_t raw) : raw_(raw) {}

    uint32_t raw_;
};

/// Append-only store of `T` values.
template <typename T> class Arena {
public:
    Arena() = default;

    // Handles would silently alias between copies.
    Arena(const Arena&) = delete;
    Arena& operator=(const Arena&) = delete;
    Arena(Arena&&) noexcept = default;
    Arena& operator=(Arena&&) noexcept = default;

    /// Appends `value` and returns its handle.
    auto insert(T value) -> Index<T> {
        items_.push_back(std::move(value));
        return Index<T>::from_raw(static_cast<uint32_t>(items_.size() - 1));
    }

    [[nodiscard]] auto index(Index<T> idx) const -> const T& {
        check(idx);
        return items_[idx.raw()];
    }

    [[nodiscard]] auto index_mut(Index<T> idx) -> T& {
        check(idx);
        return items_[idx.raw()];
    }

    [[nodiscard]] auto operator[](Index<T> idx) const -> const T& {
        return index(idx);
    }

    [[nodiscard]] auto operator[](Index<T> idx) -> T& {
        return index_mut(idx);
    }

    [[nodiscard]] auto contains(Index<T> idx) const -> bool {
        return idx.raw() < items_.size();
    }

    [[nodiscard]] auto size() const -> size_t {
        return items_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return items_.empty();
    }

    /// All issued handles in insertion order.
    [[nodiscard]] auto ids() const -> std::vector<Index<T>> {
        std::vector<Index<T>> out;
        out.reserve(items_.size());
        for (uint32_t i = 0; i < items_.size(); ++i) {
            out.push_back(Index<T>::from_raw(i));
        }
        return out;
    }

private:
    void check(Index<T> idx) const {
        if (idx.raw() >= items_.size()) {
            internal_error("ir", "arena handle " + std::to_string(idx.raw()) +
                                     " out of range (size " + std::to_string(items_.size()) +
                                     ")");
        }
    }

    std::vector<T> items_;
};

/// Deduplicating store of `T` values.
///
/// `Hash` and `Eq` define value identity. A handle, once issued, always
/// refers to the same logical value.
template <typename T, typename Hash = std::hash<T>, typename Eq = std::equal_to<T>>
class Interner {
public:
    Interner() = default;

    Interner(const Interner&) = delete;
    Interner& operator=(const Interner&) = delete;
    Interner(Interner&&) noexcept = default;
    Interner& operator=(Interner&&) noexcept = default;

    /// Returns the handle of a stored value equal to `value`, storing it first
    /// if no such value exists.
    auto insert(T value) -> Index<T> {
        auto it = lookup_.find(value);
        if (it != lookup_.end()) {
            return it->second;
        }
        auto idx = Index<T>::from_raw(static_cast<uint32_t>(items_.size()));
        items_.push_back(value);
        lookup_.emplace(std::move(value), idx);
        return idx;
    }

    /// Returns the handle of a stored value equal to `value`, if any.
    [[nodiscard]] auto find(const T& value) const -> std::optional<Index<T>> {
        auto it = lookup_.find(value);
        if (it == lookup_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] auto index(Index<T> idx) const -> const T& {
        if (idx.raw() >= items_.size()) {
            internal_error("ir", "interned handle " + std::to_string(idx.raw()) +
                                     " out of range (size " + std::to_string(items_.size()) +
                                     ")");
        }
        return items_[idx.raw()];
    }

    [[nodiscard]] auto operator[](Index<T> idx) const -> const T& {
        return index(idx);
    }

    /// Replaces the stored value at `idx` with `value`, which must be equal to
    /// it under `Eq` (same identity, more information). Used to complete
    /// nominal types whose definition refers back to themselves.
    void refine(Index<T> idx, T value) {
        const T& current = index(idx);
        if (!Eq{}(current, value)) {
            internal_error("ir", "refining interned handle " + std::to_string(idx.raw()) +
                                     " would change its identity");
        }
        lookup_.erase(current);
        items_[idx.raw()] = value;
        lookup_.emplace(std::move(value), idx);
    }

    [[nodiscard]] auto contains(Index<T> idx) const -> bool {
        return idx.raw() < items_.size();
    }

    [[nodiscard]] auto size() const -> size_t {
        return items_.size();
    }

private:
    std::vector<T> items_;
    std::unordered_map<T, Index<T>, Hash, Eq> lookup_;
};

} // namespace spark::arena

template <typename T> struct std::hash<spark::arena::Index<T>> {
    auto operator()(const spark::arena::Index<T>& idx) const noexcept -> size_t {
        return std::hash<uint32_t>{}(idx.raw());
    }
};
