// src/main.cpp
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/config/Config.hpp"
#include "core/storage/InitDb.hpp"
#include "core/storage/SqliteDatabase.hpp"
#include "services/api/CommandLine.hpp"
#include "services/api/FunctionDispatcher.hpp"

int main(int argc, char** argv) {
  try {
    const cft::Config config = cft::Config::fromEnvironment();
    spdlog::set_level(config.log_level);

    const cft::CommandLine command = cft::parseCommandLine(std::vector<std::string>(argv + 1, argv + argc));
    switch (command.mode) {
      case cft::CommandLine::Mode::Init: {
        const bool applied = cft::initDatabase(config.db_path, config.schema_path);
        std::cout << (applied ? "DB initialized at: " : "DB already up to date at: ") << config.db_path << "\n";
        return 0;
      }
      case cft::CommandLine::Mode::Call: {
        // Self-heal DB on startup (idempotent)
        cft::initDatabase(config.db_path, config.schema_path);
        cft::SqliteDatabase db(config.db_path);
        spdlog::debug("using {} database at {}", cft::toString(config.database_type), config.db_path);

        cft::FunctionDispatcher dispatcher(config, db);
        cft::addDefaultFunctions(dispatcher);
        return cft::runCall(dispatcher, command, std::cin, std::cout, std::cerr);
      }
      case cft::CommandLine::Mode::Usage:
        break;
    }

    cft::printUsage(std::cout, argc > 0 ? argv[0] : "club-fines");
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
