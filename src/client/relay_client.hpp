#pragma once
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "relay.grpc.pb.h"
#include "consts.hpp"
#include "formatter.hpp"

using grpc::Channel;
using grpc::ClientContext;
using grpc::Status;

struct NodeReply {
  RetCode rc = kFatal;
  std::string type_name;
  std::string id;
  std::vector<std::pair<std::string, std::string>> props;
  std::vector<std::string> msgs;
};

class RelayClient {
 private:
  std::unique_ptr<RelayRPC::RelayServer::Stub> stub_;

  static RetCode to_ret_code(RelayRPC::Code c) {
    switch (c) {
      case RelayRPC::kOk: return kOk;
      case RelayRPC::kNotFound: return kNotFound;
      case RelayRPC::kAbort: return kAbort;
      default: return kFatal;
    }
  }
  static void fill_reply(const Status & status, const RelayRPC::NodeResult & rply, NodeReply & reply) {
    if (!status.ok()) {
      reply.rc = kFatal;
      reply.msgs.push_back((Formatter() << "GRPC Error: " << status.error_code() << ": " << status.error_message()).str());
      return;
    }
    reply.rc = to_ret_code(rply.code());
    reply.type_name = rply.type_name();
    reply.id = rply.id();
    for (int i = 0; i < rply.prop_size(); i++) {
      reply.props.emplace_back(rply.prop(i).name(), rply.prop(i).value());
    }
    for (int i = 0; i < rply.msg_size(); i++) {
      reply.msgs.push_back(rply.msg(i));
    }
  }
 public:
  RelayClient(const std::string &addr)
      : stub_(RelayRPC::RelayServer::NewStub(
            grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()))) {}

  NodeReply GetNode(const std::string & global_id) {
    RelayRPC::NodeParam rqst;
    rqst.set_id(global_id);
    ClientContext ctx;
    RelayRPC::NodeResult rply;
    NodeReply reply;
    fill_reply(stub_->GetNode(&ctx, rqst, &rply), rply, reply);
    return reply;
  }
  NodeReply Create(const std::string & type_name, const std::vector<std::string> & props) {
    RelayRPC::CreateParam rqst;
    rqst.set_type_name(type_name);
    for (auto & p : props) {
      rqst.add_prop_list(p);
    }
    ClientContext ctx;
    RelayRPC::NodeResult rply;
    NodeReply reply;
    fill_reply(stub_->Create(&ctx, rqst, &rply), rply, reply);
    return reply;
  }
  NodeReply RunCmd(const std::string & cmd) {
    RelayRPC::CommandParam rqst;
    rqst.set_command(cmd);
    ClientContext ctx;
    RelayRPC::NodeResult rply;
    NodeReply reply;
    fill_reply(stub_->Command(&ctx, rqst, &rply), rply, reply);
    return reply;
  }
  void ShutDown() {
    RelayRPC::StartParam rqst;
    ClientContext ctx;
    RelayRPC::StartParam rply;
    Status status = stub_->Shutdown(&ctx, rqst, &rply);
    if (!status.ok()) {
      std::cout << status.error_code() << ": " << status.error_message()
                << std::endl;
    }
  }
};
