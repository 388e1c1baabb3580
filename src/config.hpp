#pragma once
#include "logger.hpp"
#include <string>

class Config {
 public:
  std::string server_address = "127.0.0.1:55556";
  // ordered node type list, one name per line. order defines the tags!
  std::string registry_file = "graph_desc/node_types";
  int max_rpc_threads = 16;
  int log_level = RLOG_INFO;

  static Config* get() {
    static Config cfg;
    return &cfg;
  }
};
