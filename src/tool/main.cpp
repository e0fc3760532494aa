#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include "Logger.hpp"
#include "commands.hpp"
#include "markup.hpp"
#include "options.hpp"

int main(int argc, char** argv) {
  // run `markupctl -l:N ...` to choose the log level
  // 0 = DEBUG, 1 = INFO, 2 = ERROR

  Options opts;
  try {
    processArgs(argc, argv, opts);
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    std::cerr << usage(argc > 0 ? argv[0] : "markupctl") << '\n';
    return EXIT_FAILURE;
  }

  Logger::setLevel(static_cast<Logger::LogLevel>(opts.logLevel));

  try {
    std::string input = readInput(opts.inputPath);
    std::string output = runCommand(opts, input);
    std::cout << output;
    std::cout.flush();
    if (!std::cout) {
      LOG(ERROR) << "failed to write output";
      return EXIT_FAILURE;
    }
    LOG(DEBUG) << "wrote " << output.size() << " bytes";
  } catch (const markup::Error& e) {
    LOG(ERROR) << "markup error: " << e.what();
    return EXIT_FAILURE;
  } catch (const std::exception& e) {
    LOG(ERROR) << e.what();
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
