#include <exception>
#include <functional>
#include <iostream>
#include <map>
#include <string>

#include "poem/writer.hpp"
#include "utils.hpp"

namespace {

struct Command {
  std::string description;
  std::function<int()> action;
};

int write_interactive() {
  auto config = poem::PoemConfig::from_env();

  std::cout << "=== Poetry Generator ===\n" << std::endl;
  std::cout << "Enter starting word: ";
  std::string start_word;
  if (!std::getline(std::cin, start_word)) {
    std::cerr << "No starting word given" << std::endl;
    return 1;
  }
  start_word = trim(start_word);

  std::cout << "Enter poem length (number of words): ";
  int length = 0;
  if (!(std::cin >> length) || length <= 0) {
    std::cerr << "Poem length must be a positive integer" << std::endl;
    return 1;
  }

  auto table = poem::obtain_table(config);
  std::cout << "\nGenerating poem..." << std::endl;
  auto result = poem::write_poem(table, start_word, length, config);

  std::cout << "\n--- Generated Poem ---" << std::endl;
  std::cout << result.text << std::endl;
  std::cout << std::endl;
  return 0;
}

int build_cache() {
  auto config = poem::PoemConfig::from_env();
  config.use_cache = true;
  auto table = poem::rebuild_table(config);
  std::cout << "Vocabulary: " << table.size() << " words, capacity "
            << table.capacity() << std::endl;
  return 0;
}

int dump_summary() {
  auto config = poem::PoemConfig::from_env();
  auto table = poem::obtain_table(config);
  auto path = getenv_str("POEM_DUMP_PATH", "data/table_summary.json");
  int top = getenv_int("POEM_DUMP_TOP", 25);
  poem::dump_table_summary(table, path,
                           static_cast<size_t>(top > 0 ? top : 0));
  std::cout << "Wrote table summary to " << path << std::endl;
  return 0;
}

int run_command(const std::map<std::string, Command>& commands,
                const std::string& name) {
  const auto it = commands.find(name);
  if (it == commands.end()) {
    std::cerr << "Unknown command: " << name
              << "\nAvailable commands:" << std::endl;
    for (const auto& entry : commands) {
      std::cerr << "  " << entry.first << "\t" << entry.second.description
                << std::endl;
    }
    return 1;
  }

  try {
    return it->second.action();
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}

}  // namespace

int main(int argc, char** argv) {
  const std::map<std::string, Command> commands = {
      {"write", {"Prompt for a start word and length, print a poem",
                 write_interactive}},
      {"build", {"Rebuild the transition table from the corpus and cache it",
                 build_cache}},
      {"dump", {"Write a JSON summary of the transition table", dump_summary}},
  };

  if (argc > 1) {
    const std::string arg = argv[1];
    if (arg == "--list" || arg == "-l") {
      for (const auto& entry : commands) {
        std::cout << entry.first << '\t' << entry.second.description
                  << std::endl;
      }
      return 0;
    }
    if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: versewalk [command]\n\nDefaults to 'write'.\n"
                   "Use --list to see available commands.\n\n"
                   "Environment: POEM_CORPUS, POEM_CACHE, POEM_SEED, "
                   "POEM_USE_CACHE, POEM_PROGRESS, POEM_DUMP_PATH, "
                   "POEM_DUMP_TOP"
                << std::endl;
      return 0;
    }
    return run_command(commands, arg);
  }

  return run_command(commands, "write");
}
