#include "record_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

namespace healthd::eventstore::codec {

namespace {

google::protobuf::util::JsonPrintOptions PrintOptions() {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;
  return options;
}

google::protobuf::util::JsonParseOptions ParseOptions() {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return options;
}

} // namespace

std::string Marshal(const model::ExtraInfo& info) {
  google::protobuf::Struct object;
  auto&                    fields = *object.mutable_fields();
  for (const auto& [key, value] : info) {
    fields[key].set_string_value(value);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(object, &json, PrintOptions());
  if (!status.ok()) {
    throw util::CodecError("failed to marshal extra info: " + std::string(status.message()));
  }
  return json;
}

std::string Marshal(const healthd::v1::SuggestedActions& actions) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(actions, &json, PrintOptions());
  if (!status.ok()) {
    throw util::CodecError("failed to marshal suggested actions: " + std::string(status.message()));
  }
  return json;
}

void Unmarshal(const std::string& json, model::ExtraInfo* out) {
  google::protobuf::Struct object;
  auto                     status = google::protobuf::util::JsonStringToMessage(json, &object, ParseOptions());
  if (!status.ok()) {
    throw util::CodecError(std::string(status.message()));
  }

  model::ExtraInfo info;
  for (const auto& [key, value] : object.fields()) {
    if (value.kind_case() != google::protobuf::Value::kStringValue) {
      throw util::CodecError("value of key " + QuoteForError(key) + " is not a string");
    }
    info.emplace(key, value.string_value());
  }
  *out = std::move(info);
}

void Unmarshal(const std::string& json, healthd::v1::SuggestedActions* out) {
  healthd::v1::SuggestedActions actions;
  auto                          status = google::protobuf::util::JsonStringToMessage(json, &actions, ParseOptions());
  if (!status.ok()) {
    throw util::CodecError(std::string(status.message()));
  }
  *out = std::move(actions);
}

std::string QuoteForError(std::string_view text) {
  constexpr std::size_t kMaxQuoted = 64;

  std::string quoted = "\"";
  quoted.append(text.substr(0, kMaxQuoted));
  if (text.size() > kMaxQuoted) quoted.append("...");
  quoted.push_back('"');
  return quoted;
}

} // namespace healthd::eventstore::codec
