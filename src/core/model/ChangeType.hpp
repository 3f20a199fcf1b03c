#pragma once
#include <array>
#include <cstddef>
#include <string_view>

namespace cft {

enum class ChangeType {
  Update,
  Delete,
};

inline constexpr std::array<std::string_view, 2> kChangeTypeValues = {"update", "delete"};

inline std::string_view toString(ChangeType type) {
  return kChangeTypeValues[static_cast<std::size_t>(type)];
}

} // namespace cft
