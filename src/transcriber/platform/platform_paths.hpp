#pragma once

#include <string>

namespace platform {

// $XDG_CONFIG_HOME/whisper-export or ~/.config/whisper-export, empty when
// neither variable is set.
std::string config_dir();

// $XDG_DATA_HOME/whisper-export or ~/.local/share/whisper-export, empty when
// neither variable is set.
std::string data_dir();

// Run history database; falls back to /tmp when there is no data dir.
std::string history_db_path();

} // namespace platform
