#pragma once

#include "craftplan/plan/Calculator.h"
#include "craftplan/shell/CommandRegistry.h"

#include <iosfwd>
#include <string>
#include <string_view>

namespace craftplan::shell {

// Line-oriented front end for a plan::Calculator.
//
// Reads commands from `in`, writes results to `out` and problems to `err`. Commands
// that need more input (recipe, resource without an argument) prompt on `out` and read
// the following lines of `in`.
class Shell {
 public:
  Shell(std::istream& in, std::ostream& out, std::ostream& err);

  Shell(const Shell&) = delete;
  Shell& operator=(const Shell&) = delete;

  plan::Calculator& calculator() { return calculator_; }
  const plan::Calculator& calculator() const { return calculator_; }

  CommandRegistry& commands() { return commands_; }
  const CommandRegistry& commands() const { return commands_; }

  std::istream& in() { return in_; }
  std::ostream& out() { return out_; }
  std::ostream& err() { return err_; }

  // err() for problems that make the session unsuccessful; see failed().
  std::ostream& fail() {
    failed_ = true;
    return err_;
  }
  void markFailed() { failed_ = true; }

  // True once any command failed. The command line turns this into the exit status.
  bool failed() const { return failed_; }

  // Prompt/dispatch loop. Returns at end of input.
  void run();

  // Dispatch one command line. Blank lines are ignored; unknown commands print help.
  void execute(std::string_view line);

  // Reads recipes from `path` into the calculator. A malformed tail is reported and the
  // recipes before it are still registered. Returns false if anything went wrong.
  bool loadFile(const std::string& path);

  // Prints "<label>: " and reads one trimmed line. False at end of input.
  bool prompt(std::string_view label, std::string& line);

  // Prints a failed result to err() and marks the session failed. Returns result.ok.
  bool report(const plan::CalcResult& result);

 private:
  void registerBuiltins();

  std::istream& in_;
  std::ostream& out_;
  std::ostream& err_;

  plan::Calculator calculator_;
  CommandRegistry commands_;
  bool failed_{false};
};

} // namespace craftplan::shell
