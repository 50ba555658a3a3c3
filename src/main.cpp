#include <cstdlib>
#include <iostream>
#include <string>

#include "colors.hpp"
#include "driver.hpp"
#include "repl.hpp"

#ifndef LOX_VERSION
#define LOX_VERSION "dev"
#endif

int main(int argc, char* argv[]) {
  auto print_usage = []() {
    std::cout << "Usage: lox [options] [script]\n"
    << "Options:\n"
    << "  -v, --version      Print version and exit\n"
    << "  -h, --help         Show this help message\n"
    << "  --no-color         Do not colour diagnostics\n"
    << "  --max-depth N      Maximum call depth (default "
    << EvaluatorOptions{}.max_call_depth << ", at most " << kMaxCallDepthLimit << ")\n"
    << "\n"
    << "Without a script, lox reads statements from a prompt.\n"
    << "Use `--` to end options when a script name starts with '-'.\n";
  };

  EvaluatorOptions options;
  bool no_color = false;
  std::string script;
  bool seen_double_dash = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (seen_double_dash || arg.empty() || arg[0] != '-') {
      if (!script.empty()) {
        std::cerr << "lox: unexpected argument '" << arg << "'\n";
        print_usage();
        return EXIT_USAGE;
      }
      script = arg;
      continue;
    }

    if (arg == "--") {
      seen_double_dash = true;
    } else if (arg == "-v" || arg == "--version") {
      std::cout << "lox v" << LOX_VERSION << std::endl;
      return 0;
    } else if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    } else if (arg == "--no-color") {
      no_color = true;
    } else if (arg == "--max-depth") {
      if (i + 1 >= argc) {
        std::cerr << "lox: --max-depth needs a value\n";
        return EXIT_USAGE;
      }
      char* end = nullptr;
      long depth = std::strtol(argv[++i], &end, 10);
      if (!end || *end != '\0' || depth <= 0 || depth > kMaxCallDepthLimit) {
        std::cerr << "lox: invalid value for --max-depth: '" << argv[i] << "'\n";
        return EXIT_USAGE;
      }
      options.max_call_depth = static_cast<int>(depth);
    } else {
      std::cerr << "lox: unknown option '" << arg << "'\n";
      std::cerr << "Try 'lox --help' for more information.\n";
      return EXIT_USAGE;
    }
  }

  bool use_color = !no_color && Color::supports_color(STDERR_FILENO);

  if (script.empty()) {
    run_repl_mode(options, use_color);
    return 0;
  }

  return run_file(script, options, std::cout, std::cerr, use_color);
}
