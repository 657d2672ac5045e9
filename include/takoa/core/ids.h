#pragma once

#include "takoa/core/id_generator.h"

#include <string>

namespace takoa::core {

// Strong ID types following C++ Core Guidelines C.11 (Make concrete types regular).

struct PersonId {
  std::string value;
  auto operator<=>(const PersonId&) const = default;
};

struct TraceId {
  std::string value;
  auto operator<=>(const TraceId&) const = default;
};

inline PersonId new_person_id(IIdGenerator& gen) { return PersonId{gen.next("person")}; }
inline TraceId new_trace_id(IIdGenerator& gen) { return TraceId{gen.next("trace")}; }

}  // namespace takoa::core
