#pragma once

#include <string>
#include <utility>
#include <vector>

enum Command { CMD_ESCAPE, CMD_UNESCAPE, CMD_STRIPTAGS, CMD_FORMAT };

struct Options {
  Options();

  Command command;
  int logLevel;
  // Input file for escape/unescape/striptags (empty = stdin), template file
  // for format.
  std::string inputPath;
  // format arguments: "value" and "name=value"
  std::vector<std::string> positional;
  std::vector<std::pair<std::string, std::string> > named;
};

// Parse log level flag (e.g., "-l:0" for DEBUG, "-l:1" for INFO, "-l:2" for
// ERROR). Returns -1 if `arg` is not a log level flag.
int parseLogLevelFlag(const std::string& arg);

// Map a command word to its Command. Returns false for unknown words.
bool parseCommand(const std::string& word, Command& out);

// Parse program arguments into `opts`.
// Throws std::runtime_error on a missing or unknown command, a duplicated
// log level flag, or unexpected extra arguments.
void processArgs(int argc, char** argv, Options& opts);

// One-line usage summary.
std::string usage(const std::string& program);
