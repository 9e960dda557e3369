#pragma once

#include <optional>
#include <utility>

namespace strata {

// Either a borrowed view into storage owned elsewhere, or an owned value.
// Merges that touch a single layer hand out the layer's own map; merges that
// combine layers own the result. Readers go through get() and never need to
// know which one they hold.
//
// A borrowed MaybeOwned must not outlive the object it points into.
template<typename T>
class MaybeOwned {
public:
    static MaybeOwned borrowed(const T& ref) {
        MaybeOwned m;
        m.borrowed_ = &ref;
        return m;
    }

    static MaybeOwned owned(T value) {
        MaybeOwned m;
        m.owned_ = std::move(value);
        return m;
    }

    bool is_borrowed() const { return borrowed_ != nullptr; }
    bool is_owned() const { return owned_.has_value(); }

    const T& get() const { return borrowed_ ? *borrowed_ : *owned_; }
    const T& operator*() const { return get(); }
    const T* operator->() const { return &get(); }

    // Copy-on-write access; a borrowed value is cloned on first use
    T& to_mut() {
        if (borrowed_) {
            owned_ = *borrowed_;
            borrowed_ = nullptr;
        }
        return *owned_;
    }

    T into_owned() && {
        if (borrowed_) return *borrowed_;
        return std::move(*owned_);
    }

private:
    MaybeOwned() = default;

    const T* borrowed_ = nullptr;
    std::optional<T> owned_;
};

} // namespace strata
