#pragma once

#include <string>

#include <google/protobuf/any.pb.h>

#include "graphflow/v1.hpp"
#include "internal/util/errors.hpp"

namespace graphflow::typing {

/*
  Typed view of output records.

  Records travel through the engine and the cache in their wire form.
  These helpers materialize a node's declared result type only when a
  caller asks for it. An empty type name means the node declares no type;
  the record itself is then the result.
*/

template <typename T>
T DecodeAs(const graphflow::v1::Record& record) {
  T message;
  if (!message.ParseFromString(record.payload())) {
    throw util::CodecError("record " + record.id() + " does not parse as " + T::descriptor()->full_name());
  }
  return message;
}

google::protobuf::Any ToAny(const graphflow::v1::Record& record, const std::string& type_name);
std::string           ToJson(const graphflow::v1::Record& record, const std::string& type_name);

// InvalidArgument unless the type is known to the generated descriptor pool.
void RequireKnownType(const std::string& type_name);

} // namespace graphflow::typing
