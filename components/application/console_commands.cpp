#include "console_commands.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "application.hpp"
#include "esp_console.h"
#include "esp_log.h"

namespace {
static const char* kTag = "Console";

constexpr size_t kMaxNameLength = 29;

app::Application* g_app = nullptr;

// Prints the outcome of a manager command; non-zero marks the command failed.
int Report(const char* command, esp_err_t err) {
    if (err == ESP_OK) {
        return 0;
    }
    if (err == ESP_ERR_INVALID_STATE) {
        printf("%s: not possible right now\n", command);
    } else if (err == ESP_ERR_NOT_ALLOWED) {
        printf("%s: permission denied\n", command);
    } else {
        printf("%s: %s\n", command, esp_err_to_name(err));
    }
    return 1;
}

void PrintCandidates(const voicelink::StatusView& view) {
    if (view.candidates.empty()) {
        printf("No peers found.\n");
        return;
    }
    for (size_t i = 0; i < view.candidates.size(); ++i) {
        const voicelink::PeerId& peer = view.candidates[i].peer;
        printf("  [%u] %s (%s)\n", static_cast<unsigned>(i),
               peer.DisplayName().c_str(), peer.address.c_str());
    }
}

int HostCommand(int argc, char** argv) {
    return Report("host", g_app->manager().RequestHost());
}

int ScanCommand(int argc, char** argv) {
    return Report("scan", g_app->manager().RequestScan());
}

int PeersCommand(int argc, char** argv) {
    PrintCandidates(g_app->manager().GetStatus());
    return 0;
}

int ConnectCommand(int argc, char** argv) {
    if (argc != 2) {
        printf("usage: connect <index>\n");
        return 1;
    }
    char* end = nullptr;
    errno = 0;
    const unsigned long index = strtoul(argv[1], &end, 10);
    if (errno != 0 || end == argv[1] || *end != '\0') {
        printf("connect: '%s' is not a peer index\n", argv[1]);
        return 1;
    }

    const voicelink::StatusView view = g_app->manager().GetStatus();
    if (index >= view.candidates.size()) {
        printf("connect: no peer [%lu]; run 'peers'\n", index);
        return 1;
    }
    return Report("connect",
                  g_app->manager().RequestConnect(view.candidates[index].peer));
}

int StopCommand(int argc, char** argv) {
    return Report("stop", g_app->manager().StopDiscovery());
}

int DisconnectCommand(int argc, char** argv) {
    return Report("disconnect", g_app->manager().Disconnect());
}

int TalkCommand(int argc, char** argv) {
    esp_err_t err = g_app->manager().ToggleTransmit();
    if (err == ESP_OK) {
        printf(g_app->manager().GetStatus().transmitting ? "Microphone on\n"
                                                         : "Microphone off\n");
    }
    return Report("talk", err);
}

int StatusCommand(int argc, char** argv) {
    const voicelink::StatusView view = g_app->manager().GetStatus();
    printf("%s\n", view.status_text.c_str());
    printf("  phase=%s announcing=%s discovering=%s transmitting=%s\n",
           voicelink::PhaseName(view.phase), view.announcing ? "yes" : "no",
           view.discovering ? "yes" : "no", view.transmitting ? "yes" : "no");
    if (view.last_failure) {
        printf("  last failure: %s\n",
               voicelink::DescribeFailure(*view.last_failure).c_str());
    }
    return 0;
}

int NameCommand(int argc, char** argv) {
    if (argc < 2) {
        printf("usage: name <display name>\n");
        return 1;
    }
    std::string name = argv[1];
    for (int i = 2; i < argc; ++i) {
        name += ' ';
        name += argv[i];
    }
    if (name.size() > kMaxNameLength) {
        printf("name: at most %u characters\n",
               static_cast<unsigned>(kMaxNameLength));
        return 1;
    }
    return Report("name", g_app->Rename(name));
}

esp_err_t Register(const char* command, const char* help, const char* hint,
                   esp_console_cmd_func_t func) {
    const esp_console_cmd_t cmd = {
        .command = command,
        .help = help,
        .hint = hint,
        .func = func,
        .argtable = nullptr,
    };
    esp_err_t err = esp_console_cmd_register(&cmd);
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to register '%s': %s", command,
                 esp_err_to_name(err));
    }
    return err;
}
}  // namespace

namespace app {

esp_err_t StartConsole(Application& app) {
    g_app = &app;

    esp_console_repl_t* repl = nullptr;
    esp_console_repl_config_t repl_config = ESP_CONSOLE_REPL_CONFIG_DEFAULT();
    repl_config.prompt = "voicelink>";
    esp_console_dev_uart_config_t uart_config =
        ESP_CONSOLE_DEV_UART_CONFIG_DEFAULT();

    esp_err_t err = esp_console_new_repl_uart(&uart_config, &repl_config,
                                              &repl);
    if (err != ESP_OK) {
        ESP_LOGE(kTag, "Failed to create REPL: %s", esp_err_to_name(err));
        return err;
    }

    err = esp_console_register_help_command();
    if (err != ESP_OK) {
        return err;
    }

    struct CommandEntry {
        const char* command;
        const char* help;
        const char* hint;
        esp_console_cmd_func_t func;
    };
    const CommandEntry commands[] = {
        {"host", "Wait for a peer to connect to this device", nullptr,
         HostCommand},
        {"scan", "Look for nearby VoiceLink devices", nullptr, ScanCommand},
        {"peers", "List the devices found by the last scan", nullptr,
         PeersCommand},
        {"connect", "Connect to a device from the peer list", "<index>",
         ConnectCommand},
        {"stop", "Stop hosting or scanning", nullptr, StopCommand},
        {"disconnect", "Drop the current connection", nullptr,
         DisconnectCommand},
        {"talk", "Turn the microphone on or off", nullptr, TalkCommand},
        {"status", "Show the connection status", nullptr, StatusCommand},
        {"name", "Set the name other devices see", "<display name>",
         NameCommand},
    };
    for (const CommandEntry& entry : commands) {
        err = Register(entry.command, entry.help, entry.hint, entry.func);
        if (err != ESP_OK) {
            return err;
        }
    }

    return esp_console_start_repl(repl);
}

}  // namespace app
