#pragma once
#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "core/ids/Guid.hpp"

namespace cft {

class PropertyParser;
class TraceContext;

enum class Importance {
  High,
  Medium,
  Low,
};

inline constexpr std::array<std::string_view, 3> kImportanceValues = {"high", "medium", "low"};

inline std::string_view toString(Importance importance) {
  return kImportanceValues[static_cast<std::size_t>(importance)];
}

// Non-negative, finite amount of money.
double parseAmount(const PropertyParser& parser, const std::string& field);

// Reusable reason a fine can refer to.
struct ReasonTemplate {
  static constexpr const char* kTypeName = "ReasonTemplate";
  static constexpr const char* kName = "reason template";

  Guid id;
  std::string reason_message;
  double amount = 0;
  Importance importance = Importance::Medium;

  // { reasonMessage, amount, importance }
  nlohmann::json databaseObject() const;

  static ReasonTemplate fromObject(const Guid& id, const nlohmann::json& value, const TraceContext& trace);
};

} // namespace cft
