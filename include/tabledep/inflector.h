#pragma once

#include <string>

namespace tabledep {

// Heuristic English inflection for snake_case table names. Only the last
// underscore-delimited segment of a compound word is transformed.
std::string Singularize(const std::string &word);
std::string Pluralize(const std::string &word);

// "PostCheckin" -> "post_checkins", "Admin::User" -> "admin_users".
std::string ClassNameToTableName(const std::string &class_name);

// "reward_credits" -> "RewardCredit".
std::string TableNameToClassName(const std::string &table_name);

} // namespace tabledep
