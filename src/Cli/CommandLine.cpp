#include "CommandLine.h"

#include <bits/stdc++.h>

#include "Corpus/CorpusStats.h"
#include "Cost/CostModel.h"
#include "Layout/Layout.h"
#include "Optimizer/Annealer.h"
#include "Optimizer/Config.h"
#include "Utils/Debug.h"
#include "Utils/Errors.h"

using namespace std;

// Progress lines per chain with --debug
static constexpr long long PROGRESS_REPORTS = 10;

static const set<string> COMMANDS = {"run", "run-ref", "refine"};

void printUsage(const string& progname, ostream& os) {
  os << "Usage: " << progname << " (run|run-ref|refine) <corpus> [OPTIONS]\n"
     << "\n"
     << "Options:\n"
     << "  -h, --help              print this help menu\n"
     << "  -d, --debug             show progress and debug logging\n"
     << "  -t, --top N             number of top layouts to print (default: 1)\n"
     << "  -i, --iterations N      annealing iteration budget (default: 200000)\n"
     << "  -s, --seed N            random seed (default: 24301)\n"
     << "  -c, --chains N          independent annealing chains (default: 1)\n"
     << "  -T, --temperature T     initial temperature (default: 0.05)\n"
     << "  -l, --layout TEXT       starting layout, 9 groups of 5 characters, '_' = empty\n"
     << "      --symbols           place letters and punctuation (default: letters only)\n";
}

template <typename T>
static T numopt(const string& name, const string& value, T fallback, ostream& err) {
  istringstream in(value);
  T parsed;
  // Extraction into an unsigned type wraps "-1" instead of failing
  bool negativeUnsigned = is_unsigned_v<T> && value.find('-') != string::npos;
  if (!negativeUnsigned && in >> parsed && in.eof()) {
    return parsed;
  }
  err << "Error: invalid value '" << value << "' for " << name
      << ". Using default value " << fallback << "." << endl;
  return fallback;
}

CliOptions parseArgs(const vector<string>& args, ostream& err) {
  CliOptions opts;
  vector<string> positional;

  for (size_t i = 1; i < args.size(); i++) {
    const string& arg = args[i];
    auto next = [&]() -> const string& {
      if (i + 1 >= args.size()) {
        throw UsageError(arg + " needs a value");
      }
      return args[++i];
    };

    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "-d" || arg == "--debug") {
      opts.debug = true;
    } else if (arg == "-t" || arg == "--top") {
      opts.top = numopt(arg, next(), opts.top, err);
    } else if (arg == "-i" || arg == "--iterations") {
      opts.params.maxIterations = numopt(arg, next(), opts.params.maxIterations, err);
    } else if (arg == "-s" || arg == "--seed") {
      opts.params.seed = numopt(arg, next(), opts.params.seed, err);
    } else if (arg == "-c" || arg == "--chains") {
      opts.chains = numopt(arg, next(), opts.chains, err);
    } else if (arg == "-T" || arg == "--temperature") {
      opts.params.initialTemperature = numopt(arg, next(), opts.params.initialTemperature, err);
    } else if (arg == "-l" || arg == "--layout") {
      opts.layout = next();
    } else if (arg == "--symbols") {
      opts.symbols = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      throw UsageError("unknown option " + arg);
    } else {
      positional.push_back(arg);
    }
  }
  opts.params.keepTop = opts.top;

  if (opts.help) return opts;
  if (positional.size() != 2) {
    throw UsageError("expected a command and a corpus file");
  }
  opts.command = positional[0];
  opts.corpus = positional[1];
  if (!COMMANDS.count(opts.command)) {
    throw UsageError("unknown command " + opts.command);
  }
  return opts;
}

static void printRanked(const AnnealResult& result, int count, ostream& out) {
  for (int k = 1; k < count && k < static_cast<int>(result.top.size()); k++) {
    const RankedLayout& e = result.top[k];
    out << "\n#" << (k + 1) << "  total: " << e.cost << "  " << e.layout.serialize() << "\n"
        << e.layout;
  }
}

static int execute(const CliOptions& opts, ostream& out, ostream& err) {
  Config config = opts.symbols ? Config::lettersAndSymbols() : Config::lettersOnly();
  CorpusStats corpus = CorpusStats::load(opts.corpus, config.alphabet);
  CostModel model(config, corpus);

  Layout start = opts.layout ? Layout::parse(config, *opts.layout) : Layout::reference(config);

  if (opts.command == "run-ref") {
    out << "Reference: " << start.serialize() << "\n" << start << model.evaluate(start);
  } else if (opts.command == "run") {
    IterationObserver progress = nullptr;
    mutex progressMutex;
    if (opts.debug) {
      long long interval = max(1LL, opts.params.maxIterations / PROGRESS_REPORTS);
      progress = [&, interval](const IterationInfo& info) {
        if (info.iteration % interval != 0) return;
        lock_guard<mutex> lock(progressMutex);
        err << "chain " << info.chain << " iteration " << info.iteration << " T "
            << info.temperature << " current " << info.currentCost << " best "
            << info.bestCost << "\n";
      };
    }
    AnnealResult result = runChains(model, start, opts.params, opts.chains, progress);
    out << "Best (chain " << result.chain << "): " << result.best.serialize() << "\n" << result;
    printRanked(result, opts.top, out);
  } else {
    mt19937_64 rng(opts.params.seed);
    Annealer annealer(model, rng);
    AnnealResult result = annealer.refine(start);
    out << "Refined: " << result.best.serialize() << "\n" << result;
  }
  return 0;
}

int runCli(const vector<string>& args, ostream& out, ostream& err) {
  string progname = args.empty() ? "swipeficiency" : args[0];

  CliOptions opts;
  try {
    opts = parseArgs(args, err);
  } catch (const UsageError& e) {
    err << "Error: " << e.what() << "\n";
    printUsage(progname, err);
    return 1;
  }
  if (opts.help) {
    printUsage(progname, out);
    return 0;
  }

  int code;
  try {
    code = execute(opts, out, err);
  } catch (const exception& e) {
    err << "Error: " << e.what() << endl;
    code = 1;
  }

  if (opts.debug || DEBUG_ENABLED) {
    err << get_debug_output();
  }
  return code;
}
