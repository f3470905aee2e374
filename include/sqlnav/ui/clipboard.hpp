/**
 * sqlnav/ui/clipboard.hpp - Copy sink
 *
 * Part of sqlnav - a terminal browser for relational databases.
 */

#pragma once

#include "../errors.hpp"

#include <cstdio>
#include <string>

namespace sqlnav::ui {

class Clipboard {
public:
    virtual ~Clipboard() = default;

    /**
     * @throws Error when the payload could not be handed over
     */
    virtual void copy(const std::string& payload) = 0;
};

/**
 * Pipes the payload into a shell command such as
 * "xclip -selection clipboard" or "wl-copy".
 */
class CommandClipboard : public Clipboard {
public:
    explicit CommandClipboard(std::string command) : command_(std::move(command)) {}

    void copy(const std::string& payload) override {
        if (command_.empty()) {
            throw Error("no clipboard command configured");
        }
        FILE* pipe = popen(command_.c_str(), "w");
        if (!pipe) {
            throw Error("cannot run clipboard command: " + command_);
        }
        size_t written = std::fwrite(payload.data(), 1, payload.size(), pipe);
        int status = pclose(pipe);
        if (written != payload.size() || status != 0) {
            throw Error("clipboard command failed: " + command_);
        }
    }

    const std::string& command() const { return command_; }

private:
    std::string command_;
};

} // namespace sqlnav::ui
