#pragma once

#include <algorithm>
#include <array>
#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace f1telem {

/**
 * @brief Fixed-capacity text field stored as raw bytes
 *
 * The binary layer never interprets the contents, so decode/encode of a
 * FixedText round-trips every byte (including anything after the first NUL).
 * Interpretation as text happens through str(), which stops at the first
 * NUL byte.
 *
 * @tparam N Field width in bytes
 */
template <size_t N>
struct FixedText {
    static constexpr size_t capacity = N;

    std::array<uint8_t, N> bytes{};

    /**
     * @brief Build a field from text, NUL-padding the remainder
     *
     * Text longer than N bytes is cut at N bytes.
     */
    static FixedText from(std::string_view text) noexcept {
        FixedText out;
        size_t count = std::min(text.size(), N);
        for (size_t i = 0; i < count; ++i) {
            out.bytes[i] = static_cast<uint8_t>(text[i]);
        }
        return out;
    }

    // View of the contents up to (not including) the first NUL byte
    std::string_view view() const noexcept {
        auto end = std::find(bytes.begin(), bytes.end(), uint8_t{0});
        return std::string_view(reinterpret_cast<const char*>(bytes.data()),
                                static_cast<size_t>(end - bytes.begin()));
    }

    std::string str() const { return std::string(view()); }

    bool operator==(const FixedText&) const = default;
};

} // namespace f1telem
