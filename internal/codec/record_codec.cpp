#include "record_codec.hpp"

#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>

#include "internal/util/errors.hpp"

namespace graphflow::codec {

using namespace graphflow::v1;

std::string EncodeMessage(const google::protobuf::Message& message) {
  std::string out;
  {
    google::protobuf::io::StringOutputStream raw(&out);
    google::protobuf::io::CodedOutputStream  coded(&raw);
    coded.SetSerializationDeterministic(true);
    if (!message.SerializeToCodedStream(&coded)) {
      throw util::CodecError("failed to serialize " + message.GetTypeName());
    }
  }
  return out;
}

std::string Encode(const Record& record) {
  return EncodeMessage(record);
}

Record Decode(const std::string& bytes) {
  Record record;
  if (!record.ParseFromString(bytes)) {
    throw util::CodecError("malformed record (" + std::to_string(bytes.size()) + " bytes)");
  }
  return record;
}

std::string CacheKey(const Record& record) {
  Record content;
  content.set_payload(record.payload());
  return EncodeMessage(content);
}

std::string EncodeOutputs(const std::vector<std::string>& encoded_outputs) {
  CachedOutputs outputs;
  for (const auto& encoded : encoded_outputs) {
    outputs.add_outputs(encoded);
  }
  return EncodeMessage(outputs);
}

std::vector<std::string> DecodeOutputs(const std::string& blob) {
  CachedOutputs outputs;
  if (!outputs.ParseFromString(blob)) {
    throw util::CodecError("malformed cached outputs (" + std::to_string(blob.size()) + " bytes)");
  }
  return {outputs.outputs().begin(), outputs.outputs().end()};
}

std::string EncodeFields(const google::protobuf::Struct& fields) {
  return EncodeMessage(fields);
}

std::string EncodeFile(const File& file) {
  return EncodeMessage(file);
}

} // namespace graphflow::codec
