#include "internal/graphs/text_pipeline.hpp"

#include <cctype>
#include <sstream>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/unknown_field_set.h>

#include "graphflow/examples/v1/text.pb.h"
#include "internal/model/record.hpp"
#include "internal/typing/typed_view.hpp"
#include "internal/util/errors.hpp"

namespace graphflow::graphs {

using namespace graphflow::v1;
using graphflow::examples::v1::Document;
using graphflow::examples::v1::Sentence;
using graphflow::examples::v1::Summary;
using graphflow::examples::v1::WordCount;

namespace {

std::string Trim(const std::string& text) {
  std::size_t begin = 0;
  std::size_t end   = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
  return text.substr(begin, end - begin);
}

unsigned CountWords(const std::string& text) {
  std::istringstream in(text);
  std::string        word;
  unsigned           count = 0;
  while (in >> word) ++count;
  return count;
}

std::vector<std::string> SplitSentences(const std::string& text) {
  std::vector<std::string> sentences;
  std::string              current;
  for (std::size_t i = 0; i < text.size(); ++i) {
    current.push_back(text[i]);
    const bool terminator = text[i] == '.' || text[i] == '!' || text[i] == '?';
    const bool boundary   = i + 1 == text.size() || std::isspace(static_cast<unsigned char>(text[i + 1]));
    if (terminator && boundary) {
      auto sentence = Trim(current);
      if (!sentence.empty()) sentences.push_back(std::move(sentence));
      current.clear();
    }
  }

  auto tail = Trim(current);
  if (!tail.empty()) sentences.push_back(std::move(tail));
  return sentences;
}

std::vector<Record> ExtractText(const Record& input) {
  Document document;

  // File payloads always carry a mime type, which a Struct would keep as
  // an unknown field.
  google::protobuf::Struct fields;
  if (fields.ParseFromString(input.payload()) && fields.GetReflection()->GetUnknownFields(fields).empty()) {
    auto it = fields.fields().find("text");
    if (it == fields.fields().end() || it->second.kind_case() != google::protobuf::Value::kStringValue) {
      throw util::FunctionExecutionError("extract_text: input fields carry no 'text' string");
    }
    document.set_text(it->second.string_value());
    document.set_source("fields");
    return {model::MakeRecord(document)};
  }

  File file;
  if (!file.ParseFromString(input.payload())) {
    throw util::FunctionExecutionError("extract_text: input is neither input fields nor a file");
  }
  document.set_text(file.data());
  document.set_source(file.path().empty() ? "file" : file.path());
  return {model::MakeRecord(document)};
}

std::vector<Record> SplitIntoSentences(const Record& input) {
  const auto document = typing::DecodeAs<Document>(input);

  std::vector<Record> outputs;
  unsigned            index = 0;
  for (const auto& text : SplitSentences(document.text())) {
    Sentence sentence;
    sentence.set_text(text);
    sentence.set_index(index++);
    outputs.push_back(model::MakeRecord(sentence));
  }
  return outputs;
}

std::vector<Record> CountSentenceWords(const Record& input) {
  const auto sentence = typing::DecodeAs<Sentence>(input);

  WordCount count;
  count.set_sentence_index(sentence.index());
  count.set_words(CountWords(sentence.text()));
  return {model::MakeRecord(count)};
}

RouterOutput RouteByLength(const Record& input) {
  const auto document = typing::DecodeAs<Document>(input);

  RouterOutput route;
  route.add_edges(CountWords(document.text()) <= kShortDocumentWords ? "summarize_short" : "summarize_long");
  return route;
}

std::vector<Record> SummarizeShort(const Record& input) {
  const auto document = typing::DecodeAs<Document>(input);

  Summary summary;
  summary.set_text(Trim(document.text()));
  summary.set_words(CountWords(document.text()));
  summary.set_length_class("short");
  return {model::MakeRecord(summary)};
}

std::vector<Record> SummarizeLong(const Record& input) {
  const auto document  = typing::DecodeAs<Document>(input);
  const auto sentences = SplitSentences(document.text());

  Summary summary;
  summary.set_text(sentences.empty() ? std::string{} : sentences.front() + " ...");
  summary.set_words(CountWords(document.text()));
  summary.set_length_class("long");
  return {model::MakeRecord(summary)};
}

} // namespace

std::shared_ptr<graph::Graph> BuildTextPipeline() {
  auto graph = std::make_shared<graph::Graph>(kTextPipeline, "Splits text into sentences, counts words and summarizes by length");

  graph->AddNode("extract_text", ExtractText, Document::descriptor()->full_name(), "Input fields or file to document")
      .AddNode("split_sentences", SplitIntoSentences, Sentence::descriptor()->full_name(), "One record per sentence")
      .AddNode("count_words", CountSentenceWords, WordCount::descriptor()->full_name(), "Word count per sentence")
      .AddNode("summarize_short", SummarizeShort, Summary::descriptor()->full_name(), "Whole text as summary")
      .AddNode("summarize_long", SummarizeLong, Summary::descriptor()->full_name(), "First sentence as summary")
      .AddRouter("route_by_length", RouteByLength, {"summarize_short", "summarize_long"}, "Picks a summarizer by word count")
      .AddEdge("extract_text", "split_sentences")
      .AddEdge("extract_text", "route_by_length")
      .AddEdge("split_sentences", "count_words")
      .SetStartNode("extract_text");

  return graph;
}

} // namespace graphflow::graphs
