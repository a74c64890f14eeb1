#include "yule/logging.hpp"

#include <spdlog/cfg/argv.h>
#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

namespace yule {

  void setup_logging(int argc, char ** argv) {
    spdlog::set_level(static_cast<spdlog::level::level_enum>(SPDLOG_ACTIVE_LEVEL));

    // Environment first, command line last, so the command line wins.
    spdlog::cfg::load_env_levels();
    spdlog::cfg::load_argv_levels(argc, argv);
  }

  scoped_log_level::scoped_log_level(int level)
      : previous_(static_cast<int>(spdlog::get_level())) {
    spdlog::set_level(static_cast<spdlog::level::level_enum>(level));
  }

  scoped_log_level::~scoped_log_level() {
    spdlog::set_level(static_cast<spdlog::level::level_enum>(previous_));
  }

}  // namespace yule
