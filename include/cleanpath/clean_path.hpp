#pragma once

#include "cleanpath/export.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace cleanpath {

// ============================================================================
// Cleaned Path Result
// ============================================================================

// Result of clean_path(): either a view into the caller's input (nothing had
// to be rewritten) or a freshly owned string.
//
// A borrowed result is only valid while the input it was produced from is
// alive.
class CLEANPATH_API CleanedPath {
public:
    static CleanedPath borrowed(std::string_view view) {
        return CleanedPath(Value(std::in_place_index<0>, view));
    }

    static CleanedPath owned(std::string value) {
        return CleanedPath(Value(std::in_place_index<1>, std::move(value)));
    }

    bool is_borrowed() const { return value_.index() == 0; }
    bool is_owned() const { return value_.index() == 1; }

    std::string_view view() const {
        if (is_borrowed()) {
            return std::get<0>(value_);
        }
        return std::get<1>(value_);
    }

    // Copy (borrowed) or move (owned) the path out.
    std::string str() const& { return std::string(view()); }
    std::string str() && {
        if (is_owned()) {
            return std::move(std::get<1>(value_));
        }
        return std::string(std::get<0>(value_));
    }

    std::size_t size() const { return view().size(); }

    friend bool operator==(const CleanedPath& a, std::string_view b) { return a.view() == b; }
    friend bool operator!=(const CleanedPath& a, std::string_view b) { return a.view() != b; }

private:
    using Value = std::variant<std::string_view, std::string>;

    explicit CleanedPath(Value value) : value_(std::move(value)) {}

    Value value_;
};

// ============================================================================
// Normalization
// ============================================================================

// Return the canonical absolute form of a URL path, eliminating "." and ".."
// segments and runs of slashes. Purely lexical, total over all inputs.
//
// Rules, applied in one left-to-right pass:
//   1. Replace multiple slashes with a single slash.
//   2. Eliminate each "." segment.
//   3. Eliminate each inner ".." segment along with the non-".." segment
//      that precedes it.
//   4. Eliminate ".." segments that begin a rooted path ("/.." -> "/").
//   5. A missing leading slash is added; a trailing slash is kept, and a
//      trailing lone "." produces one.
//
// The empty string becomes "/". If the input is already canonical (or a
// canonical prefix of it suffices) the result borrows from the input and
// nothing is allocated.
CLEANPATH_API CleanedPath clean_path(std::string_view path);

// Owning variant of clean_path().
CLEANPATH_API std::string normalize(std::string_view path);

// True if path is already in canonical form, i.e. clean_path(path) would
// return the input unchanged.
CLEANPATH_API bool is_clean(std::string_view path);

} // namespace cleanpath
