#pragma once

#include <memory>

#include "internal/graph/graph.hpp"

namespace graphflow::graphs {

inline constexpr const char* kTextPipeline = "text_pipeline";

// Threshold between summarize_short and summarize_long, in words.
inline constexpr unsigned kShortDocumentWords = 20;

/*
  text_pipeline

    extract_text -> split_sentences -> count_words
    extract_text -> route_by_length => summarize_short | summarize_long

  extract_text accepts either input fields carrying a "text" string or an
  uploaded file whose bytes are the text.
*/
std::shared_ptr<graph::Graph> BuildTextPipeline();

} // namespace graphflow::graphs
