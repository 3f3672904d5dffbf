#pragma once

#include <string>
#include <string_view>
#include <optional>
#include <variant>

namespace treeish {

// Text that is either a view into a caller's buffer or an owned copy.
//
// A borrowed MaybeOwned is only valid while the buffer it views is alive.
// into_owned() detaches it; calling it on owned text is a no-op.
class MaybeOwned {
public:
    MaybeOwned() : data_(std::string_view()) {}

    static MaybeOwned borrowed(std::string_view text) { return MaybeOwned(text); }
    static MaybeOwned owned(std::string text) { return MaybeOwned(std::move(text)); }

    bool is_owned() const { return std::holds_alternative<std::string>(data_); }
    bool is_borrowed() const { return !is_owned(); }

    std::string_view view() const {
        if (is_owned()) return std::get<std::string>(data_);
        return std::get<std::string_view>(data_);
    }

    bool empty() const { return view().empty(); }
    size_t size() const { return view().size(); }
    std::string str() const { return std::string(view()); }

    // Borrowed text yields a borrowed slice of the same buffer; owned text
    // yields an owned copy of the slice.
    MaybeOwned substr(size_t pos, size_t count = std::string_view::npos) const {
        auto piece = view().substr(pos, count);
        if (is_owned()) return owned(std::string(piece));
        return borrowed(piece);
    }

    MaybeOwned into_owned() && {
        if (is_owned()) return std::move(*this);
        return owned(std::string(std::get<std::string_view>(data_)));
    }

    MaybeOwned into_owned() const& {
        return owned(str());
    }

    friend bool operator==(const MaybeOwned& a, const MaybeOwned& b) {
        return a.view() == b.view();
    }
    friend bool operator!=(const MaybeOwned& a, const MaybeOwned& b) {
        return !(a == b);
    }

private:
    explicit MaybeOwned(std::string_view v) : data_(v) {}
    explicit MaybeOwned(std::string s) : data_(std::move(s)) {}

    std::variant<std::string_view, std::string> data_;
};

// Wrap `value` in an optional unless it is empty.
template<typename T>
std::optional<T> non_empty(T value) {
    if (value.empty()) return std::nullopt;
    return std::optional<T>(std::move(value));
}

} // namespace treeish
