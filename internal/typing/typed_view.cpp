#include "internal/typing/typed_view.hpp"

#include <memory>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/dynamic_message.h>
#include <google/protobuf/util/json_util.h>

namespace graphflow::typing {

namespace {

const google::protobuf::Descriptor* FindType(const std::string& type_name) {
  const auto* descriptor = google::protobuf::DescriptorPool::generated_pool()->FindMessageTypeByName(type_name);
  if (!descriptor) {
    throw util::InvalidArgument("unknown output type: " + type_name);
  }
  return descriptor;
}

std::unique_ptr<google::protobuf::Message> Materialize(const graphflow::v1::Record& record, const std::string& type_name) {
  const auto* prototype = google::protobuf::MessageFactory::generated_factory()->GetPrototype(FindType(type_name));
  std::unique_ptr<google::protobuf::Message> message(prototype->New());
  if (!message->ParseFromString(record.payload())) {
    throw util::CodecError("record " + record.id() + " does not parse as " + type_name);
  }
  return message;
}

} // namespace

void RequireKnownType(const std::string& type_name) {
  FindType(type_name);
}

google::protobuf::Any ToAny(const graphflow::v1::Record& record, const std::string& type_name) {
  google::protobuf::Any any;
  if (type_name.empty()) {
    any.PackFrom(record);
    return any;
  }
  any.PackFrom(*Materialize(record, type_name));
  return any;
}

std::string ToJson(const graphflow::v1::Record& record, const std::string& type_name) {
  std::string json;

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  const auto status = type_name.empty() ? google::protobuf::util::MessageToJsonString(record, &json, options)
                                        : google::protobuf::util::MessageToJsonString(*Materialize(record, type_name), &json, options);
  if (!status.ok()) {
    throw util::CodecError("failed to render record " + record.id() + " as JSON: " + std::string(status.message()));
  }
  return json;
}

} // namespace graphflow::typing
