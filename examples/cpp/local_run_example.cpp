#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

#include "graphflow/examples/v1/text.pb.h"
#include "internal/cache/memory_content_cache.hpp"
#include "internal/core/graph_runner.hpp"
#include "internal/graphs/text_pipeline.hpp"
#include "internal/typing/typed_view.hpp"

int main(int argc, char** argv) {
  const std::string text = argc > 1 ? argv[1]
                                    : "Graphs describe work as nodes and edges. A router picks the next node at run time. "
                                      "Outputs are memoized by input, so a second run with the same text never calls a node function.";

  graphflow::core::GraphRunner runner(std::make_shared<graphflow::cache::MemoryContentCache>());
  runner.Register(graphflow::graphs::BuildTextPipeline());

  google::protobuf::Struct input;
  (*input.mutable_fields())["text"].set_string_value(text);

  const auto invocation_id = runner.Submit(graphflow::graphs::kTextPipeline, input);
  std::cout << "invocation " << invocation_id << "\n";

  for (const auto& count : runner.QueryAs<graphflow::examples::v1::WordCount>(invocation_id, "count_words")) {
    std::cout << "sentence " << count.sentence_index() << ": " << count.words() << " words\n";
  }

  // Only the summarizer picked by the router has outputs.
  const auto summary = runner.GetInvocation(invocation_id);
  for (const auto& stats : summary.nodes()) {
    if (stats.node().rfind("summarize_", 0) != 0 || stats.outputs() == 0) {
      continue;
    }
    const auto type_name = runner.DeclaredOutputType(invocation_id, stats.node());
    for (const auto& record : runner.Query(invocation_id, stats.node())) {
      std::cout << stats.node() << ": " << graphflow::typing::ToJson(record, type_name) << "\n";
    }
  }

  // Same input again: every node is served from the cache.
  const auto rerun_id = runner.Submit(graphflow::graphs::kTextPipeline, input);
  std::uint64_t hits  = 0;
  const auto rerun = runner.GetInvocation(rerun_id);
  for (const auto& stats : rerun.nodes()) {
    hits += stats.cache_hits();
  }
  std::cout << "rerun " << rerun_id << " cache hits: " << hits << "\n";
  return 0;
}
