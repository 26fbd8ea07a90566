#pragma once
#include <string>

// Where batchlog keeps its files on this machine.
class Locations {
public:
  // LOG_FILE from ConfigManager, else <DataDirectory>/batchlog/batchlog.log.
  // Creates the parent directory; throws IoFailure if that fails.
  static std::string LogFile();
  // $XDG_DATA_HOME, else $HOME/.local/share, else the working directory.
  static std::string DataDirectory();
};
