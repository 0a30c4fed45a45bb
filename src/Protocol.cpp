#include "Protocol.hpp"

#include <cctype>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace protocol {

namespace {

std::optional<int> parse_int(const std::string& raw)
{
    std::string s = trim(raw);
    if (s.empty()) return std::nullopt;

    std::size_t digits_from = (s[0] == '+' || s[0] == '-') ? 1 : 0;
    if (digits_from == s.size()) return std::nullopt;
    for (std::size_t i = digits_from; i < s.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
    }

    try {
        return std::stoi(s);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

std::string trim(const std::string& s)
{
    const char* ws = " \t\n\r\f\v";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::string to_upper(std::string s)
{
    for (auto& ch : s) {
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    return s;
}

std::optional<Handshake> parse_handshake(const std::string& line)
{
    std::string text = trim(line);
    auto space = text.find(' ');
    std::string verb = to_upper(trim(text.substr(0, space)));
    std::string code = space == std::string::npos ? "" : to_upper(trim(text.substr(space + 1)));

    if (code.empty()) return std::nullopt;
    if (verb == kVerbRoom) return Handshake{JoinMode::Player, code};
    if (verb == kVerbSpectate) return Handshake{JoinMode::Spectator, code};
    return std::nullopt;
}

std::optional<MoveRequest> parse_move(const std::string& text)
{
    auto comma = text.find(',');
    if (comma == std::string::npos || text.find(',', comma + 1) != std::string::npos) {
        return std::nullopt;
    }
    auto row = parse_int(text.substr(0, comma));
    auto col = parse_int(text.substr(comma + 1));
    if (!row || !col) return std::nullopt;
    return MoveRequest{*row, *col};
}

std::optional<std::string> parse_chat(const std::string& text)
{
    if (text.compare(0, kChatPrefix.size(), kChatPrefix) != 0) {
        return std::nullopt;
    }
    return trim(text.substr(kChatPrefix.size()));
}

std::string format_chat(const std::string& label, const std::string& text)
{
    return kChatPrefix + label + ":" + text;
}

std::vector<std::string> split_messages(const std::string& chunk)
{
    std::vector<std::string> messages;
    std::size_t start = 0;
    while (start <= chunk.size()) {
        auto nl = chunk.find('\n', start);
        std::string piece = chunk.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        piece = trim(piece);
        if (!piece.empty()) {
            messages.push_back(std::move(piece));
        }
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return messages;
}

const std::string& turn_announcement(std::size_t player_index)
{
    return player_index == 0 ? kPlayerOneTurn : kPlayerTwoTurn;
}

const std::string& player_assignment(std::size_t player_index)
{
    return player_index == 0 ? kPlayerOneAssigned : kPlayerTwoAssigned;
}

} // namespace protocol
