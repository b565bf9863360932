#include "AG/AST.hpp"
#include "AG/Parser.hpp"
#include "AG/Runtime/Errors.hpp"
#include "AG/advisor.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct Options {
  bool debug = false;
  std::optional<size_t> maxCycles;
};

ag::EngineConfig makeConfig(const Options &opts) {
  ag::EngineConfig config = ag::EngineConfig::fromEnvironment();
  if (opts.debug)
    config.debug = true;
  if (opts.maxCycles)
    config.maxCycles = *opts.maxCycles;
  return config;
}

bool hasKbExtension(const std::string &fileName) {
  return fileName.size() >= 3 && fileName.substr(fileName.size() - 3) == ".kb";
}

/// Prints conclusions grouped by output kind, in declaration order
void printConclusions(const ag::RuleLibrary &library,
                      const std::vector<ag::Conclusion> &conclusions) {
  for (const auto &kind : library.outputKinds()) {
    const auto ofKind = ag::ConclusionCollector::ofKind(conclusions, kind);
    std::cout << "\n--- " << kind << " (" << ofKind.size() << ") ---" << std::endl;
    for (const auto &c : ofKind) {
      std::cout << "  ";
      bool first = true;
      for (const auto &[name, value] : c.attributes) {
        if (!first)
          std::cout << "\n  ";
        std::cout << name << ": " << value.toString();
        first = false;
      }
      std::cout << std::endl;
    }
  }
}

void printCycleLimit(const ag::CycleLimitExceeded &e) {
  std::cerr << "Inference stopped: cycle limit of " << e.limit() << " reached" << std::endl;
  std::cerr << "Most recent firings:" << std::endl;
  for (const auto &r : e.recentFirings()) {
    std::cerr << "  " << ag::toString(r) << std::endl;
  }
}

/// Asserts every `fact` statement of a program into a session. Returns the
/// number of facts asserted.
size_t assertFacts(ag::Session &session, const ag::Program &prog) {
  size_t asserted = 0;
  for (const auto &st : prog.statements) {
    if (const auto *f = std::get_if<ag::FactDecl>(&st)) {
      try {
        session.assertObservation(f->kind.name, ag::toAttributes(*f));
        ++asserted;
      } catch (const ag::DuplicateFactError &e) {
        std::cerr << "Ignored: " << e.what() << std::endl;
      }
    } else {
      std::cerr << "Ignored (only facts are accepted here): " << ag::toString(st) << std::endl;
    }
  }
  return asserted;
}

bool runSession(ag::Session &session, const ag::RuleLibrary &library) {
  try {
    const auto conclusions = session.run();
    std::cout << "Inference finished after " << session.firings().size() << " firing(s)."
              << std::endl;
    for (const auto &s : session.skippedActions()) {
      std::cerr << "Skipped action in " << s.rule << " (firing " << s.firing << "): " << s.reason
                << std::endl;
    }
    printConclusions(library, conclusions);
    return true;
  } catch (const ag::CycleLimitExceeded &e) {
    printCycleLimit(e);
  } catch (const ag::SessionAborted &e) {
    std::cerr << "Inference aborted: " << e.what() << std::endl;
  } catch (const ag::SessionError &e) {
    std::cerr << "Session error: " << e.what() << std::endl;
  }
  return false;
}

std::shared_ptr<const ag::RuleLibrary> loadLibrary(const std::string &fileName) {
  try {
    auto library = ag::RuleLibrary::fromFile(fileName);
    std::cout << "Loaded " << fileName << ": " << library->rules().size() << " rule(s), "
              << library->initialFacts().size() << " initial fact(s)" << std::endl;
    return library;
  } catch (const ag::ParseError &e) {
    std::cerr << e.what() << std::endl;
  } catch (const ag::RuleLibraryError &e) {
    std::cerr << "Invalid knowledge base: " << e.what() << std::endl;
  }
  return nullptr;
}

/// Loads the knowledge base, asserts the observations and runs inference
bool runFile(const std::string &rulesFile, const std::optional<std::string> &observationsFile,
             const Options &opts) {
  auto library = loadLibrary(rulesFile);
  if (!library)
    return false;

  ag::Advisor advisor(library, makeConfig(opts));
  auto session = advisor.session(advisor.startSession());

  if (observationsFile) {
    try {
      const ag::Program obs = ag::parseFile(*observationsFile);
      const size_t n = assertFacts(*session, obs);
      std::cout << "Asserted " << n << " observation(s) from " << *observationsFile << std::endl;
    } catch (const ag::ParseError &e) {
      std::cerr << e.what() << std::endl;
      return false;
    }
  }

  return runSession(*session, *library);
}

std::string replHelp() {
  return "\nAgriSense REPL - Interactive Advisory Session\n"
         "Available commands:\n"
         "  \\h        Show this help message\n"
         "  \\q        Quit the REPL\n"
         "  \\run      Run inference and print conclusions\n"
         "  \\facts    List the facts in the current session\n"
         "  \\reset    Start a fresh session (initial facts only)\n"
         "  \\debug    Toggle debug mode on/off\n"
         "\nEnter observations as fact statements, e.g.\n"
         "  fact symptoms(leaf_spots = true, powdery_white = true)\n";
}

void printFacts(const ag::Session &session) {
  const auto facts = session.facts();
  std::cout << "\n=== Session " << session.handle() << " ===" << std::endl;
  if (facts.empty()) {
    std::cout << "No facts asserted." << std::endl;
  } else {
    for (const auto &f : facts) {
      std::cout << "  " << ag::toString(f) << std::endl;
    }
  }
  std::cout << "State: " << ag::toString(session.state()) << std::endl;
  std::cout << "======================\n" << std::endl;
}

bool handleCommand(const std::string &line, ag::Advisor &advisor, ag::SessionHandle &handle,
                   bool &shouldQuit) {
  if (line.empty()) {
    return true;
  }

  auto session = advisor.session(handle);

  if (line[0] == '\\') {
    if (line == "\\q" || line == "\\quit") {
      shouldQuit = true;
      std::cout << "Goodbye!" << std::endl;
      return true;
    } else if (line == "\\h" || line == "\\help") {
      std::cout << replHelp();
      return true;
    } else if (line == "\\run") {
      return runSession(*session, advisor.library());
    } else if (line == "\\facts") {
      printFacts(*session);
      return true;
    } else if (line == "\\reset" || line == "\\clear") {
      advisor.endSession(handle);
      handle = advisor.startSession();
      std::cout << "Session reset." << std::endl;
      return true;
    } else if (line == "\\debug") {
      advisor.setDebug(!advisor.debug());
      session->setDebug(advisor.debug());
      std::cout << "Debug mode: " << (advisor.debug() ? "ON" : "OFF") << std::endl;
      return true;
    } else {
      std::cerr << "Unknown command: " << line << std::endl;
      std::cout << "Type \\h for help." << std::endl;
      return false;
    }
  }

  try {
    const ag::Program prog = ag::parseProgram(line);
    assertFacts(*session, prog);
    return true;
  } catch (const ag::ParseError &e) {
    std::cerr << "Parse error: " << e.what() << std::endl;
    return false;
  } catch (const ag::SessionError &e) {
    std::cerr << "Session error: " << e.what() << std::endl;
    std::cout << "Use \\reset to start a new session." << std::endl;
    return false;
  }
}

/**
 * Starts the REPL (Read-Eval-Print Loop) over one knowledge base
 */
int runRepl(const std::string &rulesFile, const Options &opts) {
  auto library = loadLibrary(rulesFile);
  if (!library)
    return 1;

  ag::Advisor advisor(library, makeConfig(opts));
  ag::SessionHandle handle = advisor.startSession();
  bool shouldQuit = false;

  std::cout << "AgriSense REPL v0.1" << std::endl;
  std::cout << "Type \\h for help, \\q to quit." << std::endl;

  while (!shouldQuit) {
    std::cout << "\n> ";

    std::string line;
    if (!std::getline(std::cin, line)) {
      // EOF or read error
      break;
    }

    handleCommand(line, advisor, handle, shouldQuit);
  }
  return 0;
}

void printUsage() {
  std::cerr << "Usage: agrisense [--debug|-d] [--max-cycles N] <rules.kb> [observations.kb]\n";
}

} // namespace

int main(const int argc, char **argv) {

  // Parse optional flags
  Options opts;
  int argi = 1;
  while (argi < argc && argv[argi][0] == '-') {
    std::string opt = argv[argi];
    if (opt == "--debug" || opt == "-d") {
      opts.debug = true;
      ++argi;
      continue;
    }
    if (opt == "--max-cycles" && argi + 1 < argc) {
      const std::string n = argv[argi + 1];
      if (n.empty() || n.find_first_not_of("0123456789") != std::string::npos) {
        std::cerr << "Invalid value for --max-cycles: " << n << "\n";
        return 1;
      }
      try {
        opts.maxCycles = static_cast<size_t>(std::stoull(n));
      } catch (const std::out_of_range &) {
        std::cerr << "Value for --max-cycles is out of range: " << n << "\n";
        return 1;
      }
      argi += 2;
      continue;
    }
    std::cerr << "Unknown option: " << opt << "\n";
    printUsage();
    return 1;
  }

  if (argi >= argc) {
    printUsage();
    return 1;
  }

  const std::string rulesFile = argv[argi++];
  std::optional<std::string> observationsFile;
  if (argi < argc)
    observationsFile = argv[argi++];

  for (const std::string &f : {rulesFile, observationsFile.value_or(rulesFile)}) {
    if (!hasKbExtension(f)) {
      std::cout << "Invalid file extension: " << f << std::endl;
      return 1;
    }
  }

  if (observationsFile) {
    return runFile(rulesFile, observationsFile, opts) ? 0 : 1;
  }
  // Without observations, start an interactive session
  return runRepl(rulesFile, opts);
}
