#pragma once
#include "relay.grpc.pb.h"
#include "consts.hpp"
#include "exceptions.hpp"
#include "logger.hpp"
#include "schema/schema.hpp"

#include <atomic>
#include <cstring>
#include <optional>
#include <string>
#include <grpcpp/grpcpp.h>
#include <folly/futures/Future.h>

using grpc::ServerContext;
using grpc::Status;

using RelayRPC::CommandParam;
using RelayRPC::CreateParam;
using RelayRPC::NodeParam;
using RelayRPC::NodeResult;
using RelayRPC::StartParam;

inline void set_rpc_code(NodeResult* response, RetCode rc) {
  if (rc == kOk) response->set_code(RelayRPC::kOk);
  else if (rc == kNotFound) response->set_code(RelayRPC::kNotFound);
  else if (rc == kAbort) response->set_code(RelayRPC::kAbort);
  else response->set_code(RelayRPC::kFatal);
}

inline void write_node(const SchemaDispatcher & dispatcher, const SchemaNode & node, NodeResult* response) {
  response->set_code(RelayRPC::kOk);
  response->set_type_name(dispatcher.TypeNameOf(node));
  response->set_id(EncodeGlobalId(NodeIdOf(node)));
  for (auto & kv : PropsOf(node)) {
    auto prop = response->add_prop();
    prop->set_name(kv.first);
    prop->set_value(kv.second);
  }
}

class RelayServerImpl final : public RelayRPC::RelayServer::Service {
 private:
  folly::Promise<folly::Unit> _exit_p;
  std::atomic_flag _exit_set = ATOMIC_FLAG_INIT;
  const SchemaDispatcher* _dispatcher;
  SchemaStores* _stores;

  void request_exit() {
    if (!_exit_set.test_and_set()) _exit_p.setValue();
  }
  Status reply_abort(NodeResult* response, const std::string & msg) {
    set_rpc_code(response, kAbort);
    response->add_msg(msg);
    LOG_ERROR("%s", msg.c_str());
    return Status::OK;
  }
 public:
  RelayServerImpl(const SchemaDispatcher* dispatcher, SchemaStores* stores)
    : _dispatcher(dispatcher), _stores(stores) {}
  folly::Future<folly::Unit> exit_future() { return _exit_p.getFuture(); }

  Status GetNode(ServerContext *context, const NodeParam *request, NodeResult *response) override {
    try {
      // todo: implement an async server
      std::optional<SchemaNode> node = _dispatcher->Get(RelayContext::of(_stores), request->id()).get();
      if (!node) {
        set_rpc_code(response, kNotFound);
        return Status::OK;
      }
      write_node(*_dispatcher, *node, response);
      return Status::OK;
    } catch (std::exception & e) {
      LOG_ERROR("refetch %s failed: %s", request->id().c_str(), e.what());
      set_rpc_code(response, kFatal);
      response->add_msg(e.what());
      return Status::OK;
    }
  }

  Status Create(ServerContext *context, const CreateParam *request, NodeResult *response) override {
    const std::string & type_name = request->type_name();
    try {
      if (type_name == Tenant::kTypeName) {
        if (request->prop_list_size() != 1) return reply_abort(response, "usage: create Tenant|<name>");
        write_node(*_dispatcher, SchemaNode(_stores->CreateTenant(request->prop_list(0))), response);
        return Status::OK;
      }
      if (type_name == User::kTypeName) {
        if (request->prop_list_size() != 2) return reply_abort(response, "usage: create User|<name>|<tenant id>");
        write_node(*_dispatcher, SchemaNode(_stores->CreateUser(request->prop_list(0), request->prop_list(1))), response);
        return Status::OK;
      }
      return reply_abort(response, (Formatter() << "unknown node type: " << type_name).str());
    } catch (IndexException & e) {
      return reply_abort(response, e.msg());
    } catch (std::exception & e) {
      LOG_ERROR("create %s failed: %s", type_name.c_str(), e.what());
      set_rpc_code(response, kFatal);
      response->add_msg(e.what());
      return Status::OK;
    }
  }

  Status Shutdown(ServerContext *context, const StartParam *request, StartParam *response) override {
    request_exit();
    return Status::OK;
  }

  Status Command(ServerContext *context, const CommandParam *request, NodeResult *response) override {
    std::string cmd = request->command();
    response->set_code(RelayRPC::kOk);
    if (cmd.empty()) return Status::OK;
    if (cmd == "exit" || cmd == "quit") {
      request_exit();
      return Status::OK;
    }
    if (cmd == "types") {
      for (auto & desc : _dispatcher->registry().types()) {
        response->add_msg((Formatter() << desc._tag_str << " " << desc._type_name).str());
      }
      return Status::OK;
    }
    const size_t cmd_len = strlen("set_log_level");
    if (strncmp(cmd.c_str(), "set_log_level", cmd_len) == 0
        && (cmd[cmd_len] == '\0' || cmd[cmd_len] == ' ')) {
      if (cmd[cmd_len] == '\0') return reply_abort(response, "missing parameter");
      const char* param = cmd.c_str() + cmd_len + 1;
      int level = relaylog::ParseLevel(param);
      if (level < 0) return reply_abort(response, (Formatter() << "wrong param: " << param).str());
      relaylog::setLogDebugLevel(level);
      return Status::OK;
    }
    return reply_abort(response, (Formatter() << "unknown command: " << cmd).str());
  }
};

