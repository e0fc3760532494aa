#include "options.hpp"

#include <stdexcept>

#include "Logger.hpp"

Options::Options() : command(CMD_ESCAPE), logLevel(Logger::INFO) {}

int parseLogLevelFlag(const std::string& arg) {
  // Guard 1: Wrong length
  if (arg.length() != 4) {
    return -1;
  }

  // Guard 2: Wrong prefix
  if (arg.compare(0, 3, "-l:") != 0) {
    return -1;
  }

  // Guard 3: Invalid value
  char level = arg[3];
  if (level < '0' || level > '2') {
    return -1;
  }

  return level - '0';
}

bool parseCommand(const std::string& word, Command& out) {
  if (word == "escape") {
    out = CMD_ESCAPE;
  } else if (word == "unescape") {
    out = CMD_UNESCAPE;
  } else if (word == "striptags") {
    out = CMD_STRIPTAGS;
  } else if (word == "format") {
    out = CMD_FORMAT;
  } else {
    return false;
  }
  return true;
}

void processArgs(int argc, char** argv, Options& opts) {
  int logLevel = -1;
  bool haveCommand = false;
  bool haveInput = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    int level = parseLogLevelFlag(arg);

    if (level >= 0) {
      if (logLevel >= 0) {
        throw std::runtime_error("Error: multiple log level flags provided");
      }
      logLevel = level;
      continue;
    }

    if (!haveCommand) {
      if (!parseCommand(arg, opts.command)) {
        throw std::runtime_error("Error: unknown command '" + arg + "'");
      }
      haveCommand = true;
      continue;
    }

    if (!haveInput) {
      opts.inputPath = arg;
      haveInput = true;
      continue;
    }

    if (opts.command != CMD_FORMAT) {
      throw std::runtime_error("Error: unexpected argument '" + arg + "'");
    }
    std::string::size_type eq = arg.find('=');
    if (eq == std::string::npos) {
      opts.positional.push_back(arg);
    } else if (eq == 0) {
      throw std::runtime_error("Error: empty argument name in '" + arg + "'");
    } else {
      opts.named.push_back(
          std::make_pair(arg.substr(0, eq), arg.substr(eq + 1)));
    }
  }

  if (!haveCommand) {
    throw std::runtime_error("Error: missing command");
  }
  if (opts.command == CMD_FORMAT && !haveInput) {
    throw std::runtime_error("Error: format needs a template file");
  }
  opts.logLevel = logLevel < 0 ? Logger::INFO : logLevel;
}

std::string usage(const std::string& program) {
  return "usage: " + program +
         " [-l:N] <escape|unescape|striptags> [file]\n"
         "       " +
         program + " [-l:N] format <template> [value | name=value]...";
}
