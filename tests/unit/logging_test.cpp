#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace {

using namespace graphflow::observability;

void TestPlainValuesAreNotQuoted() {
  const auto line = FormatFields({StringField("graph", "text_pipeline"), IntField("work_items", 7)});
  assert(line == "graph=text_pipeline work_items=7");
}

void TestValuesWithSpacesAreQuoted() {
  const auto line = FormatFields({StringField("error", "node \"b\" failed"), StringField("empty", "")});
  assert(line == R"(error="node \"b\" failed" empty="")");
}

void TestDoubleFieldPrecision() {
  assert(FormatFields({DoubleField("elapsed_ms", 1.5)}) == "elapsed_ms=1.500");
}

void TestParseLevel() {
  assert(ParseLevel("debug") == spdlog::level::debug);
  assert(ParseLevel("warning") == spdlog::level::warn);
  assert(ParseLevel("off") == spdlog::level::off);

  bool threw = false;
  try {
    ParseLevel("loud");
  } catch (const graphflow::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestInitializeRejectsUnknownLevel() {
  graphflow::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("chatty");

  bool threw = false;
  try {
    InitializeLogging(config);
  } catch (const graphflow::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  config.mutable_logging()->set_level("debug");
  InitializeLogging(config);
  GRAPHFLOW_LOG_DEBUG("logging initialized", {StringField("test", "logging")});
  ShutdownLogging();
}

} // namespace

int main() {
  TestPlainValuesAreNotQuoted();
  TestValuesWithSpacesAreQuoted();
  TestDoubleFieldPrecision();
  TestParseLevel();
  TestInitializeRejectsUnknownLevel();

  std::cout << "graphflow_unit_logging: pass\n";
  return 0;
}
