#include "cleanpath/clean_path.hpp"

#include <array>
#include <cstring>
#include <string>

namespace cleanpath {

namespace {

constexpr char kSeparator = '/';
constexpr std::string_view kRoot = "/";

// Output of one clean_path() call. Until the first byte that differs from
// the input is written, the output is the input's prefix [0, w) and nothing
// is stored; after that the prefix is copied into the scratch region and all
// writes go there.
//
// The scratch region is either caller-provided inline storage of at least
// input.size() + 1 bytes, or a heap string allocated on materialization.
class LazyBuffer {
public:
    LazyBuffer(std::string_view input, char* inline_storage)
        : input_(input), storage_(inline_storage) {}

    // Byte i of the output written so far.
    char at(std::size_t i) const {
        return materialized_ ? storage_[i] : input_[i];
    }

    void put(std::size_t w, char c) {
        if (!materialized_) {
            if (w < input_.size() && input_[w] == c) {
                return;
            }
            materialize(w);
        }
        storage_[w] = c;
    }

    // Start output with a synthesized root separator that is not part of
    // the input.
    void put_root() {
        materialize(0);
        storage_[0] = kSeparator;
    }

    CleanedPath finish(std::size_t w) {
        if (!materialized_) {
            return CleanedPath::borrowed(input_.substr(0, w));
        }
        if (storage_ == heap_.data()) {
            heap_.resize(w);
            return CleanedPath::owned(std::move(heap_));
        }
        return CleanedPath::owned(std::string(storage_, w));
    }

private:
    void materialize(std::size_t prefix) {
        if (storage_ == nullptr) {
            heap_.resize(input_.size() + 1);
            storage_ = heap_.data();
        }
        std::memcpy(storage_, input_.data(), prefix);
        materialized_ = true;
    }

    std::string_view input_;
    char* storage_;
    std::string heap_;
    bool materialized_ = false;
};

CleanedPath scan(std::string_view p, LazyBuffer& buf) {
    const std::size_t n = p.size();

    // r: next input byte to read, w: next output byte to write
    std::size_t r = 1;
    std::size_t w = 1;

    if (p[0] != kSeparator) {
        r = 0;
        buf.put_root();
    }

    bool trailing = n > 1 && p[n - 1] == kSeparator;

    while (r < n) {
        if (p[r] == kSeparator) {
            // empty segment, the trailing slash is re-added at the end
            ++r;
        } else if (p[r] == '.' && r + 1 == n) {
            trailing = true;
            ++r;
        } else if (p[r] == '.' && p[r + 1] == kSeparator) {
            r += 2;
        } else if (p[r] == '.' && p[r + 1] == '.' &&
                   (r + 2 == n || p[r + 2] == kSeparator)) {
            // ".." removes the last segment; never above the root
            r += 3;

            if (w > 1) {
                --w;
                while (w > 1 && buf.at(w) != kSeparator) {
                    --w;
                }
            }
        } else {
            if (w > 1) {
                buf.put(w, kSeparator);
                ++w;
            }

            for (; r < n && p[r] != kSeparator; ++r, ++w) {
                buf.put(w, p[r]);
            }
        }
    }

    if (trailing && w > 1) {
        buf.put(w, kSeparator);
        ++w;
    }

    return buf.finish(w);
}

template <std::size_t Capacity>
CleanedPath clean_path_inline(std::string_view path) {
    static_assert(Capacity > 1, "inline storage too small");
    std::array<char, Capacity> storage;
    LazyBuffer buf(path, storage.data());
    return scan(path, buf);
}

CleanedPath clean_path_heap(std::string_view path) {
    LazyBuffer buf(path, nullptr);
    return scan(path, buf);
}

} // namespace

CleanedPath clean_path(std::string_view path) {
    if (path.empty()) {
        return CleanedPath::borrowed(kRoot);
    }

    // Inline tiers hold at least path.size() + 1 bytes.
    const std::size_t n = path.size();
    if (n < 64) {
        return clean_path_inline<64>(path);
    }
    if (n < 256) {
        return clean_path_inline<256>(path);
    }
    if (n < 1024) {
        return clean_path_inline<1024>(path);
    }
    return clean_path_heap(path);
}

std::string normalize(std::string_view path) {
    return clean_path(path).str();
}

bool is_clean(std::string_view path) {
    if (path.empty()) {
        return false;
    }
    auto cleaned = clean_path(path);
    return cleaned.is_borrowed() && cleaned.size() == path.size();
}

} // namespace cleanpath
