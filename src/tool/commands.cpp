#include "commands.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>

#include "Logger.hpp"
#include "markup.hpp"

std::string readInput(const std::string& path) {
  if (path.empty()) {
    LOG(DEBUG) << "reading input from stdin";
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }
  std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
  if (!in) {
    LOG_PERROR(ERROR, "cannot open '" << path << "'");
    throw std::runtime_error("Error: cannot read '" + path + "'");
  }
  std::string content((std::istreambuf_iterator<char>(in)),
                      std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw std::runtime_error("Error: read failed for '" + path + "'");
  }
  LOG(DEBUG) << "read " << content.size() << " bytes from '" << path << "'";
  return content;
}

std::string runCommand(const Options& opts, const std::string& input) {
  switch (opts.command) {
    case CMD_ESCAPE:
      return markup::escape(input).str();
    case CMD_UNESCAPE:
      return markup::Markup(input).unescape();
    case CMD_STRIPTAGS:
      return markup::Markup(input).stripTags();
    case CMD_FORMAT: {
      markup::FormatArgs args;
      for (size_t i = 0; i < opts.positional.size(); ++i) {
        args.arg(opts.positional[i]);
      }
      for (size_t i = 0; i < opts.named.size(); ++i) {
        args.named(opts.named[i].first, opts.named[i].second);
      }
      LOG(DEBUG) << "formatting template with " << opts.positional.size()
                 << " positional and " << opts.named.size()
                 << " named arguments";
      return markup::Markup(input).format(args).str();
    }
  }
  throw std::logic_error("unhandled command");
}
