#pragma once
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include <nlohmann/json.hpp>

#include "core/errors/FunctionError.hpp"
#include "core/ids/Guid.hpp"
#include "core/params/ParameterContainer.hpp"
#include "core/params/PropertyParser.hpp"
#include "core/trace/TraceContext.hpp"
#include "core/updatable/UpdateProperties.hpp"

namespace cft {

// Tombstone of a deleted entity.
struct Deleted {
  Guid id;
};

inline bool operator==(const Deleted& a, const Deleted& b) { return a.id == b.id; }

// How an operation treats an incoming change that doesn't supersede the stored one.
enum class UpdatePolicy {
  LastWriterWins,  // discarded, the call still succeeds
  Strict,          // reported to the caller as already-exists
};

// An entity together with the properties of its last change, or the
// tombstone left by deleting it. Written and replaced as a whole.
//
// T provides:
//   static constexpr const char* kTypeName;   // "Fine", used in messages
//   static constexpr const char* kName;       // "fine"
//   static T fromObject(const Guid& id, const nlohmann::json& value, const TraceContext& trace);
//   nlohmann::json databaseObject() const;    // fields without id
//   Guid id;
template <typename T>
class Updatable {
public:
  Updatable(T property, UpdateProperties updateProperties)
    : property_(std::move(property)), updateProperties_(updateProperties) {}
  Updatable(Deleted deleted, UpdateProperties updateProperties)
    : property_(std::move(deleted)), updateProperties_(updateProperties) {}

  bool isDeleted() const { return std::holds_alternative<Deleted>(property_); }

  // nullptr for a tombstone.
  const T* active() const { return std::get_if<T>(&property_); }

  const Guid& id() const {
    if (const T* value = active()) return value->id;
    return std::get<Deleted>(property_).id;
  }

  const UpdateProperties& updateProperties() const { return updateProperties_; }

  // Form stored at the entity's key path: its fields, or the tombstone marker,
  // plus updateProperties.
  nlohmann::json databaseObject() const {
    nlohmann::json object = active() ? active()->databaseObject() : nlohmann::json{{"deleted", true}};
    object["updateProperties"] = updateProperties_.databaseObject();
    return object;
  }

  nlohmann::json databaseObjectWithId() const {
    nlohmann::json object = databaseObject();
    object["id"] = id().guidString();
    return object;
  }

  // { id, deleted?, updateProperties, ...fields }
  static Updatable fromObject(const nlohmann::json& value, const TraceContext& trace) {
    trace.append(std::string("Updatable<") + T::kTypeName + ">.fromObject", value);
    if (!value.is_object())
      throw FunctionError(ErrorCode::InvalidArgument,
                          std::string("Couldn't parse ") + T::kName + ", expected type 'object', but got '" +
                          describeValue(&value) + "' from type '" + typeOfValue(&value) + "'.");
    PropertyParser parser(value, T::kTypeName);
    const Guid id = parser.requireGuid("id");
    return parse(id, parser, trace);
  }

  // Stored value whose id is the last component of its key path.
  static Updatable fromStored(const Guid& id, const nlohmann::json& value, const TraceContext& trace) {
    trace.append(std::string("Updatable<") + T::kTypeName + ">.fromStored", {{"id", id.guidString()}});
    if (!value.is_object())
      throw FunctionError(ErrorCode::InvalidArgument,
                          std::string("Couldn't parse stored ") + T::kName + ", expected an object.");
    PropertyParser parser(value, T::kTypeName);
    return parse(id, parser, trace);
  }

  static Updatable fromParameterContainer(const ParameterContainer& container, const std::string& name,
                                          const TraceContext& trace) {
    return fromObject(container.getParameter(name, ParameterType::Object), trace.nested());
  }

private:
  static Updatable parse(const Guid& id, const PropertyParser& parser, const TraceContext& trace) {
    const auto& updateValue = parser.requireObject("updateProperties");
    const auto updateProperties = UpdateProperties::fromObject(updateValue, trace.nested());

    if (const auto* deleted = parser.find("deleted")) {
      if (!deleted->is_boolean() || !deleted->get<bool>())
        parser.fail(std::string("Couldn't parse ") + T::kName +
                    ", deleted argument wasn't from type boolean or was false.");
      return Updatable(Deleted{id}, updateProperties);
    }
    return Updatable(T::fromObject(id, parser.value(), trace.nested()), updateProperties);
  }

  std::variant<T, Deleted> property_;
  UpdateProperties updateProperties_;
};

// Whether `incoming` replaces what is stored. The first write always applies.
template <typename T>
bool shouldApply(const std::optional<Updatable<T>>& current, const Updatable<T>& incoming) {
  return !current || incoming.updateProperties().supersedes(current->updateProperties());
}

} // namespace cft
