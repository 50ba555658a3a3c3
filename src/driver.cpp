#include "driver.hpp"

#include <fstream>
#include <sstream>

#include "colors.hpp"
#include "runner.hpp"

void print_diagnostics(std::ostream &err, const Diagnostics &diagnostics, bool color) {
  for (const auto &d: diagnostics.all()) {
    std::string head = "[line " + std::to_string(d.line) + "]";
    std::string kind = std::string(phase_name(d.phase)) + " error" + d.where;
    if (color) {
      // runtime errors in yellow, static errors in red
      const std::string &tint = d.phase == Phase::Runtime ? Color::yellow : Color::red;
      err << Color::bright_black << head << Color::reset << " "
      << Color::bold << tint << kind << Color::reset << ": " << d.message << "\n";
    } else {
      err << head << " " << kind << ": " << d.message << "\n";
    }
    if (d.loc.src_mgr && d.loc.col > 0) {
      if (color) {
        err << Color::cyan << d.loc.get_line_trace() << Color::reset << "\n";
      } else {
        err << d.loc.get_line_trace() << "\n";
      }
    }
  }
}

int run_file(const std::string &path, const EvaluatorOptions &options, std::ostream &out, std::ostream &err, bool color) {
  std::ifstream file(path);
  if (!file.is_open()) {
    err << "lox: could not open file '" << path << "'" << std::endl;
    return EXIT_NOINPUT;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  Runner runner(out, options);
  RunStatus status = runner.run(buffer.str(), path);
  out.flush();
  print_diagnostics(err, runner.diagnostics(), color);

  switch (status) {
    case RunStatus::StaticError:
      return EXIT_DATAERR;
    case RunStatus::RuntimeError:
      return EXIT_SOFTWARE;
    case RunStatus::Ok:
      break;
  }
  return 0;
}
