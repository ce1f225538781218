#pragma once

#include <cstddef>
#include <string_view>

namespace fragmenter::common {

// Number of UTF-8 code points: every byte that is not a continuation byte starts one.
inline size_t countCodepoints(std::string_view input) {
    size_t count = 0;
    for (unsigned char c : input) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

} // namespace fragmenter::common
