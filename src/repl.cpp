#include "repl.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "driver.hpp"
#include "runner.hpp"

namespace fs = std::filesystem;

static fs::path history_file_in_home() {
  const char *home = std::getenv("HOME");
  if (home && home[0] != '\0') return fs::path(home) / ".lox_history";
  return fs::current_path() / ".lox_history";
}

void run_repl_mode(const EvaluatorOptions &options, bool color) {
  Runner runner(std::cout, options);

  fs::path history_path = history_file_in_home();
  linenoiseHistorySetMaxLen(1000);
  linenoiseHistoryLoad(history_path.string().c_str());

  std::string last_added_history;
  int line_no = 1;

  while (true) {
    char *raw = linenoise("> ");
    if (!raw) {  // EOF (Ctrl-D) or error
      std::cout << "\n";
      break;
    }
    std::string line(raw);
    linenoiseFree(raw);

    if (line == "exit" || line == "quit") break;
    if (line.empty()) continue;

    if (line != last_added_history) {
      linenoiseHistoryAdd(line.c_str());
      last_added_history = line;
    }

    runner.run(line, "<repl:" + std::to_string(line_no++) + ">");
    std::cout.flush();
    print_diagnostics(std::cerr, runner.diagnostics(), color);
  }

  linenoiseHistorySave(history_path.string().c_str());
}
