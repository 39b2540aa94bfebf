#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace edgegate {

using BinaryData = std::vector<std::uint8_t>;

inline BinaryData ToBinary(std::string_view text) {
    return BinaryData(text.begin(), text.end());
}

inline std::string_view AsStringView(const BinaryData& data) {
    return {reinterpret_cast<const char*>(data.data()), data.size()};
}

} // namespace edgegate
