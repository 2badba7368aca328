#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace arena {

enum class Role { user, agent, tool };

inline const char* role_name(Role r) {
    switch (r) {
        case Role::user:  return "user";
        case Role::agent: return "agent";
        case Role::tool:  return "tool";
    }
    return "user";
}

inline Role parse_role(const std::string& s) {
    if (s == "agent") return Role::agent;
    if (s == "tool")  return Role::tool;
    return Role::user;
}

struct Message {
    Role role = Role::user;
    std::string content;
    nlohmann::json metadata = nlohmann::json::object();

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["role"] = role_name(role);
        j["content"] = content;
        if (!metadata.empty()) j["metadata"] = metadata;
        return j;
    }

    static Message from_json(const nlohmann::json& j) {
        Message m;
        m.role = parse_role(j.value("role", "user"));
        m.content = j.value("content", "");
        if (j.contains("metadata") && j["metadata"].is_object()) m.metadata = j["metadata"];
        return m;
    }
};

inline bool operator==(const Message& a, const Message& b) {
    return a.role == b.role && a.content == b.content && a.metadata == b.metadata;
}

inline nlohmann::json messages_to_json(const std::vector<Message>& msgs) {
    nlohmann::json arr = nlohmann::json::array();
    for (auto& m : msgs) arr.push_back(m.to_json());
    return arr;
}

inline std::vector<Message> messages_from_json(const nlohmann::json& arr) {
    std::vector<Message> msgs;
    if (!arr.is_array()) return msgs;
    for (auto& j : arr) msgs.push_back(Message::from_json(j));
    return msgs;
}

} // namespace arena
