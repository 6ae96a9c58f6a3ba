#include "reminorcpp/journal_engine.hpp"

#include "../test_logger.hpp"

#include <cstdlib>
#include <iostream>

int main() {
  reminorcpp::tests::Log("smoke_test: start");
  reminorcpp::EngineConfig config;
  if (!config.enable_lexical_search) {
    std::cerr << "enable_lexical_search default mismatch\n";
    return EXIT_FAILURE;
  }
  if (!config.enable_vector_search) {
    std::cerr << "enable_vector_search default mismatch\n";
    return EXIT_FAILURE;
  }
  if (config.context.max_snippets <= 0) {
    std::cerr << "context max_snippets must be positive\n";
    return EXIT_FAILURE;
  }

  try {
    reminorcpp::JournalEngine engine(":memory:", config);
    if (!engine.SaveEntry({2024, 6, 15}, "Lunch with Maria at the lake.")) {
      std::cerr << "save failed\n";
      return EXIT_FAILURE;
    }
    if (engine.AssembleContext("Maria").empty()) {
      std::cerr << "context for a saved entity should not be empty\n";
      return EXIT_FAILURE;
    }
    engine.Close();
  } catch (const std::exception& ex) {
    std::cerr << "engine failure: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }

  reminorcpp::tests::Log("smoke_test: finished");
  std::cout << "reminorcpp smoke test passed\n";
  return EXIT_SUCCESS;
}
