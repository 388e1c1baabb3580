#include "client/relay_client.hpp"
#include "logger.hpp"
#include "config.hpp"

#include <cstring>

void print_reply(const NodeReply & reply) {
  if (reply.rc == kNotFound) {
    std::cout << "null\n";
    return;
  }
  if (reply.rc == kFatal) std::cout << "Fatal : ";
  if (reply.rc == kAbort) std::cout << "Abort : ";
  for (auto & msg : reply.msgs) {
    std::cout << msg << "\n";
  }
  if (reply.rc != kOk || reply.id.empty()) return;
  std::cout << reply.type_name << " " << reply.id << "\n";
  for (auto & kv : reply.props) {
    std::cout << "  " << kv.first << ": " << kv.second << "\n";
  }
}

int main(int argc, char** argv) {
  std::string addr = Config::get()->server_address;
  if (argc > 1) addr = argv[1];
  RelayClient client(addr);

  char buf[2000];
  while (true) {
    std::cerr << "> ";
    if (!std::cin.getline(buf, 2000)) {
      LOG_ERROR("error when reading line");
      return 0;
    }
    if (buf[0] == '\0') continue;
    if (strcmp(buf, "exit") == 0 || strcmp(buf, "quit") == 0) {return 0;}
    if (strcmp(buf, "shutdown") == 0) {
      client.ShutDown();
      return 0;
    }
    if (strncmp(buf, "node ", strlen("node ")) == 0) {
      print_reply(client.GetNode(buf + 5));
      continue;
    }
    if (strncmp(buf, "create ", strlen("create ")) == 0) {
      char* next_bar = std::strchr(buf+7, '|');
      if (next_bar) *next_bar = '\0';
      std::string type_name = buf+7;
      std::vector<std::string> props;

      while(next_bar) {
        char* head_of_this_prop = next_bar+1;
        next_bar = std::strchr(head_of_this_prop, '|');
        if (next_bar) *next_bar = '\0';
        props.push_back(head_of_this_prop);
      }
      print_reply(client.Create(type_name, props));
      continue;
    }
    print_reply(client.RunCmd(buf));
  }
}
