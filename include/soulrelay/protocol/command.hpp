#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <vector>

namespace soulrelay::protocol {

    /// One wire line: verb plus space-separated parameters.
    /// A parameter starting with ':' takes the rest of the line.
    struct Command {
        std::string verb; // Upper-cased
        std::vector<std::string> params;
        std::string tail; // Raw text after the verb and one separating space

        /// Empty for a blank line
        inline static std::optional<Command> parse(const std::string &line) {
            std::string text = line;
            while (!text.empty() && (text.back() == '\r' || text.back() == '\n')) {
                text.pop_back();
            }

            size_t pos = 0;
            auto skipSpaces = [&]() {
                while (pos < text.size() && text[pos] == ' ') {
                    pos++;
                }
            };
            auto nextToken = [&]() {
                size_t end = text.find(' ', pos);
                if (end == std::string::npos) {
                    end = text.size();
                }
                std::string token = text.substr(pos, end - pos);
                pos = end;
                return token;
            };

            skipSpaces();
            // Transport source prefix
            if (pos < text.size() && text[pos] == ':') {
                nextToken();
                skipSpaces();
            }
            if (pos >= text.size()) {
                return std::nullopt;
            }

            Command command;
            command.verb = upper(nextToken());
            if (pos < text.size()) {
                command.tail = text.substr(pos + 1);
            }

            while (true) {
                skipSpaces();
                if (pos >= text.size()) {
                    break;
                }
                if (text[pos] == ':') {
                    command.params.push_back(text.substr(pos + 1));
                    break;
                }
                command.params.push_back(nextToken());
            }

            return command;
        }

        inline bool has(size_t index) const { return index < params.size(); }

        inline const std::string &param(size_t index) const { return params.at(index); }

        /// Everything after the verb exactly as sent, minus a leading ':'
        inline std::string remainder() const {
            if (!tail.empty() && tail.front() == ':') {
                return tail.substr(1);
            }
            return tail;
        }

        inline static std::string upper(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return text;
        }
    };

} // namespace soulrelay::protocol
