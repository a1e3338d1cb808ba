#ifndef APP_CONSOLE_COMMANDS_HPP_
#define APP_CONSOLE_COMMANDS_HPP_

#include "esp_err.h"

namespace app {

class Application;

/**
 * @brief Registers the VoiceLink commands and starts the UART REPL.
 *
 * Commands: host, scan, peers, connect <index>, stop, disconnect, talk,
 * status, name <display name>.
 */
esp_err_t StartConsole(Application& app);

}  // namespace app

#endif  // APP_CONSOLE_COMMANDS_HPP_
