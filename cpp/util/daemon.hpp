#ifndef UTIL_DAEMON_HPP
#define UTIL_DAEMON_HPP

#include <string>

namespace util {

// Detaches the process from its terminal (double fork, new session, standard
// streams on /dev/null) and writes the PID of the daemon to pidfile. An empty
// pidfile means $XDG_RUNTIME_DIR/codebox-<scope>.pid, or /tmp if the variable
// is not set. Must be called before any thread is started.
void daemonize(const std::string& scope, std::string pidfile = "");

}  // namespace util
#endif
