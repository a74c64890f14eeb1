#pragma once

namespace yule {

  /** @brief Sets the global log level.
   *
   * Starts from the compile-time SPDLOG_ACTIVE_LEVEL, then applies the SPDLOG_LEVEL environment
   * variable and finally any `SPDLOG_LEVEL=...` command line argument.
   */
  void setup_logging(int argc, char ** argv);

  /// RAII guard that changes the global log level and restores the previous one on destruction.
  class scoped_log_level {
   public:
    explicit scoped_log_level(int level);
    ~scoped_log_level();

    scoped_log_level(scoped_log_level const &) = delete;
    scoped_log_level & operator=(scoped_log_level const &) = delete;

   private:
    int previous_;
  };

}  // namespace yule
