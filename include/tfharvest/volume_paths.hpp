#pragma once

#include <string>

namespace tfharvest
{

// Pairtree layout: "mdp.39015012345678" ->
// "mdp/pairtree_root/39/01/50/12/34/56/78/39015012345678/mdp.39015012345678.json.gz"
std::string id_to_relative_path(const std::string &id, const std::string &suffix);

// Inverse of id_to_relative_path. Only the file name is consulted.
bool relative_path_to_id(const std::string &path, std::string &id);

std::string pairtree_clean(const std::string &s);
std::string pairtree_unclean(const std::string &s);

} // namespace tfharvest
