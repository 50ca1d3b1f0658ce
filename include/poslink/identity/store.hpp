#pragma once

#include <concepts>
#include <optional>
#include <string>
#include <string_view>


namespace poslink::identity {

/*
===============================================================================
 identity::StoreConcept
===============================================================================

Persistence backend for the terminal identity.

  load()   → the stored id, or nullopt when nothing usable is stored
  save(id) → true once the id is durable
  clear()  → true when no id remains stored (also when none existed)

Implementations report failures through their return values and logs; they
never throw.
===============================================================================
*/

template<class S>
concept StoreConcept =
    requires(S store, std::string_view id) {
        { store.load() } -> std::same_as<std::optional<std::string>>;
        { store.save(id) } -> std::same_as<bool>;
        { store.clear() } -> std::same_as<bool>;
    };


// In-process store (tests, kiosks without writable storage)
class MemoryStore {
public:
    [[nodiscard]]
    std::optional<std::string> load() {
        ++loads_;
        return value_;
    }

    [[nodiscard]]
    bool save(std::string_view id) {
        ++saves_;
        value_ = std::string(id);
        return true;
    }

    [[nodiscard]]
    bool clear() {
        value_.reset();
        return true;
    }

    [[nodiscard]]
    int loads() const noexcept { return loads_; }

    [[nodiscard]]
    int saves() const noexcept { return saves_; }

private:
    std::optional<std::string> value_;
    int loads_{0};
    int saves_{0};
};

} // namespace poslink::identity
