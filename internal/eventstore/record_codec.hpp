#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "healthd/v1.hpp"
#include "internal/model/event.hpp"
#include "internal/util/errors.hpp"

namespace healthd::eventstore::codec {

/*
  JSON text codec for the optional event payload columns.

  Write side: an absent value encodes to "", which the INSERT turns into
  SQL NULL through NULLIF(?, '').

  Read side (UnmarshalIfValid):
    NULL, "" or "null"      -> absent, no error
    text not starting '{'   -> CodecError("invalid JSON: ...")
    anything else           -> parsed; failures throw CodecError
*/

std::string Marshal(const model::ExtraInfo& info);
std::string Marshal(const healthd::v1::SuggestedActions& actions);

template <typename T>
std::string MarshalOptional(const std::optional<T>& value) {
  return value ? Marshal(*value) : std::string();
}

void Unmarshal(const std::string& json, model::ExtraInfo* out);
void Unmarshal(const std::string& json, healthd::v1::SuggestedActions* out);

std::string QuoteForError(std::string_view text);

template <typename T>
std::optional<T> UnmarshalIfValid(const std::optional<std::string>& data) {
  if (!data || data->empty() || *data == "null") {
    return std::nullopt;
  }
  if (data->front() != '{') {
    throw util::CodecError("invalid JSON: " + QuoteForError(*data));
  }

  T value{};
  Unmarshal(*data, &value);
  return value;
}

} // namespace healthd::eventstore::codec
