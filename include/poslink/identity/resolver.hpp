#pragma once

#include <cctype>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "poslink/identity/store.hpp"
#include "poslink/log/logger.hpp"


namespace poslink::identity {

/*
===============================================================================
 identity::Resolver
===============================================================================

Derives the stable identity this terminal announces about itself.

  • resolve() loads the stored id on first use; when none exists it generates
    "POS-" + uppercase base36(Unix epoch milliseconds) and persists it
  • The result is cached for the lifetime of the resolver
  • A failing store never blocks the terminal: the generated id is still
    returned (and logged) even if it could not be made durable
  • reset() is the only way an id is ever discarded

The store is not owned and must outlive the resolver.
===============================================================================
*/

template<StoreConcept Store>
class Resolver {
public:
    explicit Resolver(Store& store) noexcept
        : store_(store)
    {}

    [[nodiscard]]
    const std::string& resolve() {
        if (cached_) {
            return *cached_;
        }
        if (auto stored = store_.load(); stored && !stored->empty()) {
            PL_DEBUG("[IDENTITY] Loaded terminal identity " << *stored);
            cached_ = std::move(stored);
            return *cached_;
        }
        std::string id = generate(std::chrono::system_clock::now());
        if (store_.save(id)) {
            PL_INFO("[IDENTITY] Generated terminal identity " << id);
        } else {
            PL_WARN("[IDENTITY] Generated terminal identity " << id << " could not be persisted");
        }
        cached_ = std::move(id);
        return *cached_;
    }

    // Forget the identity; the next resolve() generates a new one
    bool reset() {
        cached_.reset();
        const bool cleared = store_.clear();
        if (!cleared) {
            PL_WARN("[IDENTITY] Stored identity could not be cleared");
        }
        return cleared;
    }

    [[nodiscard]]
    static std::string generate(std::chrono::system_clock::time_point when) {
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count();
        char buf[32];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), static_cast<std::uint64_t>(ms < 0 ? 0 : ms), 36);
        std::string id = "POS-";
        for (const char* p = buf; p != ptr; ++p) {
            id += static_cast<char>(std::toupper(static_cast<unsigned char>(*p)));
        }
        return id;
    }

private:
    Store& store_;
    std::optional<std::string> cached_;
};

} // namespace poslink::identity
