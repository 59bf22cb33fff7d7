#pragma once

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "Optimizer/AnnealParams.h"

// swipeficiency (run|run-ref|refine) <corpus> [OPTIONS]
struct CliOptions {
  std::string command;
  std::filesystem::path corpus;

  AnnealParams params;
  int chains = 1;
  int top = 1;             // layouts printed by run
  bool debug = false;      // progress lines and the debug() log on err
  bool symbols = false;    // letters + punctuation instead of letters only
  bool help = false;
  std::optional<std::string> layout;
};

void printUsage(const std::string& progname, std::ostream& os);

// args[0] is the program name. Throws UsageError for an unknown command or
// option, or a missing value. A malformed number keeps its default and warns on err.
CliOptions parseArgs(const std::vector<std::string>& args, std::ostream& err);

// Parse and execute. Returns the process exit code; every error is reported on err.
int runCli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);
