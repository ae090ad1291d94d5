#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "permission.hpp"

namespace permission {

// Parameterless permissions return one shared instance each,
// so they deduplicate inside And/Or nodes.
const Permission& anybody();
const Permission& nobody();

const Permission& privateChat();
const Permission& groupChat();
const Permission& superGroupChat();

// Administrator or creator of the chat. Always granted in a private chat.
const Permission& groupAdmin();
const Permission& groupCreator();

Permission userId(const std::vector<int64_t>& ids);
// A leading '@' is ignored, blank names are dropped.
Permission userName(const std::vector<std::string>& usernames);

} // namespace permission
