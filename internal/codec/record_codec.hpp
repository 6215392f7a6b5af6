#pragma once

#include <string>
#include <vector>

#include "graphflow/v1.hpp"
#include "google/protobuf/struct.pb.h"

namespace graphflow::codec {

/*
  Wire representation of records.

  Every encoder uses deterministic protobuf serialization, so equal
  logical content always yields equal bytes. Decoders throw
  util::CodecError on malformed input.
*/

std::string          Encode(const graphflow::v1::Record& record);
graphflow::v1::Record Decode(const std::string& bytes);

// Canonical serialization of a record's logical content: the record with
// its id cleared. Two records that differ only in id share a key.
std::string CacheKey(const graphflow::v1::Record& record);

// Cache value blob used by the durable backends.
std::string              EncodeOutputs(const std::vector<std::string>& encoded_outputs);
std::vector<std::string> DecodeOutputs(const std::string& blob);

// Initial payload builders.
std::string EncodeFields(const google::protobuf::Struct& fields);
std::string EncodeFile(const graphflow::v1::File& file);

// Deterministic serialization of any message into a payload.
std::string EncodeMessage(const google::protobuf::Message& message);

} // namespace graphflow::codec
