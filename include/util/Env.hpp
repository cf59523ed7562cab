#pragma once

#include <string>

namespace skynode::util {

// Environment variable helpers. Both SKYNODE_ and skynode_ prefixes are accepted.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);
bool env_flag(const char* name, bool defv);

// $XDG_CONFIG_HOME/skynode/config.toml, else ~/.config/skynode/config.toml
std::string config_file_path();

// $XDG_DATA_HOME/skynode, else ~/.local/share/skynode
std::string default_data_dir();

} // namespace skynode::util
