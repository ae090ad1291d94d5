#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace chat {

enum class ChatType {
    Private,
    Group,
    SuperGroup,
    Channel,
    Unknown
};

enum class MemberStatus {
    Creator,
    Administrator,
    Member,
    Restricted,
    Left,
    Kicked,
    Unknown
};

// Who sent a message and where. Filled by the transport layer;
// the command core only reads it.
struct CallerContext {
    int64_t user_id = 0;
    std::string username;       // without leading '@'
    int64_t chat_id = 0;
    ChatType chat_type = ChatType::Private;
    int64_t message_id = 0;
    std::string command;        // canonical command name, set by the dispatcher

    // Remote membership lookup (may block). Unset means "unknown".
    std::function<MemberStatus(int64_t chat_id, int64_t user_id)> member_status;
};

// Sends text back to the chat a context came from.
using ReplySink = std::function<void(const CallerContext& context, const std::string& text)>;

inline MemberStatus lookupMemberStatus(const CallerContext& context) {
    if (!context.member_status) return MemberStatus::Unknown;
    return context.member_status(context.chat_id, context.user_id);
}

} // namespace chat
