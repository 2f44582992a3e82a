#pragma once

#include <any>
#include <cstddef>
#include <optional>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>

namespace relay {

// ─────────────────────────────────────────────────────────────────────────────
// Extensions
// ─────────────────────────────────────────────────────────────────────────────
// Per-request bag of values keyed by their type. One instance lives for one
// logical request: it is created before the first middleware runs, shared
// by reference through every middleware and every retry attempt, and
// destroyed with the final result.
//
// Wrap plain values in a dedicated struct so unrelated middleware don't
// collide on e.g. `int`:
//
//   struct RequestLabel { std::string value; };
//   extensions.insert(RequestLabel{"checkout"});
//   if (auto* label = extensions.get<RequestLabel>()) { ... }
//
// Stored types must be copy-constructible.

class Extensions {
public:
    Extensions() = default;

    Extensions(const Extensions&) = default;
    Extensions& operator=(const Extensions&) = default;
    Extensions(Extensions&&) noexcept = default;
    Extensions& operator=(Extensions&&) noexcept = default;

    /// Store `value`, returning the previous value of the same type.
    template <typename T>
    std::optional<std::decay_t<T>> insert(T&& value) {
        using Stored = std::decay_t<T>;
        std::optional<Stored> previous;
        auto it = values_.find(typeid(Stored));
        if (it != values_.end()) {
            previous = std::any_cast<Stored>(std::move(it->second));
            it->second = Stored(std::forward<T>(value));
        } else {
            values_.emplace(typeid(Stored), Stored(std::forward<T>(value)));
        }
        return previous;
    }

    template <typename T>
    [[nodiscard]] T* get() noexcept {
        auto it = values_.find(typeid(T));
        if (it == values_.end()) {
            return nullptr;
        }
        return std::any_cast<T>(&it->second);
    }

    template <typename T>
    [[nodiscard]] const T* get() const noexcept {
        auto it = values_.find(typeid(T));
        if (it == values_.end()) {
            return nullptr;
        }
        return std::any_cast<T>(&it->second);
    }

    /// The stored value, default-constructing it first if absent.
    template <typename T>
    T& get_or_insert_default() {
        if (auto* existing = get<T>()) {
            return *existing;
        }
        auto [it, inserted] = values_.emplace(typeid(T), T{});
        return *std::any_cast<T>(&it->second);
    }

    template <typename T>
    [[nodiscard]] bool contains() const noexcept {
        return values_.contains(typeid(T));
    }

    template <typename T>
    std::optional<T> remove() {
        auto it = values_.find(typeid(T));
        if (it == values_.end()) {
            return std::nullopt;
        }
        std::optional<T> removed = std::any_cast<T>(std::move(it->second));
        values_.erase(it);
        return removed;
    }

    /// Move every entry of `other` into this bag; entries from `other` win.
    void extend(Extensions other) {
        for (auto& [type, value] : other.values_) {
            values_.insert_or_assign(type, std::move(value));
        }
    }

    void clear() noexcept { values_.clear(); }

    [[nodiscard]] std::size_t size() const noexcept { return values_.size(); }
    [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

private:
    std::unordered_map<std::type_index, std::any> values_;
};

}  // namespace relay
