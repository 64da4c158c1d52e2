/**
 * @file daemon.hpp
 * @brief Startup and shutdown sequence of the wlanpipe broker process.
 *
 * main() is a thin shell over these three steps so each can be driven from
 * tests with a scripted provider and captured streams:
 *
 * ```
 *   parse_command_line()   argv -> CommandLine        (help: exit 0, usage: exit 1)
 *   build_config()         defaults < file < flags    (bad file/value: exit 1)
 *   run_daemon()           init -> bind -> READY -> Broker::run -> close -> cleanup
 * ```
 */
#ifndef WLANPIPE_DAEMON_HPP
#define WLANPIPE_DAEMON_HPP

#include <atomic>
#include <ostream>
#include <string>

#include "wlanpipe/config.hpp"
#include "wlanpipe/wifi/wifi_base.hpp"

namespace wlanpipe {

/// Command-line values, kept apart from BrokerConfig until the file is read.
struct CommandLine {
  bool        local = false;
  bool        udp   = false;
  std::string interface;

  bool        has_config = false;
  std::string config_path;

  bool        has_socket = false;
  std::string socket_path;

  bool        has_port = false;
  int         port = 0;

  bool        has_prefix = false;
  std::string prefix;

  bool        has_recv_timeout = false;
  int         recv_timeout_ms = 0;
};

/**
 * @brief Parse @p argv into @p cl.
 *
 * "-local" and "-udp" are accepted as spellings of "--local" and "--udp".
 *
 * @return false when the process should stop now with @p exit_code: 0 after
 *         --help (usage on @p out), 1 on bad usage (reason and usage on @p err).
 */
bool parse_command_line(int argc, const char* const* argv, CommandLine& cl,
                        int& exit_code, std::ostream& out, std::ostream& err);

/// Defaults, then the config file (optional unless --config was given), then
/// the flags in @p cl, then validate_config().
bool build_config(const CommandLine& cl, BrokerConfig& cfg, std::string& err);

/**
 * @brief Run the broker until QUIT or @p stop.
 *
 * Nothing is bound before @p provider initializes, and "READY" goes to @p log
 * only once both succeed. A bind failure releases the provider.
 *
 * @return process exit code: 0 after a clean shutdown, 1 on a startup failure.
 */
int run_daemon(const BrokerConfig& cfg, wifi::IWifiProvider& provider,
               const std::atomic<bool>& stop, std::ostream& log);

} // namespace wlanpipe

#endif // WLANPIPE_DAEMON_HPP
