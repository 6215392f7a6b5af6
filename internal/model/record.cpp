#include "internal/model/record.hpp"

#include "internal/codec/record_codec.hpp"
#include "internal/util/uuid.hpp"

namespace graphflow::model {

graphflow::v1::Record MakeRecord(std::string payload) {
  graphflow::v1::Record record;
  record.set_id(util::NewId());
  record.set_payload(std::move(payload));
  return record;
}

graphflow::v1::Record MakeRecord(const google::protobuf::Message& message) {
  return MakeRecord(codec::EncodeMessage(message));
}

} // namespace graphflow::model
