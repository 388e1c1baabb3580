#include "server/relay_server.hpp"
#include "config.hpp"

#include <iostream>
#include <memory>
#include <grpcpp/grpcpp.h>
#include <grpcpp/resource_quota.h>
#include <grpcpp/health_check_service_interface.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <folly/init/Init.h>

using grpc::Server;
using grpc::ServerBuilder;
using grpc::ResourceQuota;

int main (int argc, char** argv) {
  folly::init(&argc, &argv);

  Config & config = *Config::get();
  if (argc > 1) config.registry_file = argv[1];
  if (argc > 2) config.server_address = argv[2];
  relaylog::setLogDebugLevel(config.log_level);

  try {
    NodeRegistry::get()->init(config.registry_file);
  } catch (RelayException & e) {
    LOG_FATAL("%s", e.msg().c_str());
    return 1;
  }
  std::unique_ptr<SchemaDispatcher> dispatcher;
  try {
    dispatcher.reset(new SchemaDispatcher(*NodeRegistry::get()));
  } catch (FatalException & e) {
    LOG_FATAL("%s", e.msg().c_str());
    return 1;
  }
  LOG_INFO("node registry ready, %zu types", NodeRegistry::get()->size());

  SchemaStores stores;
  RelayServerImpl service(dispatcher.get(), &stores);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  ServerBuilder builder;
  builder.AddListeningPort(config.server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  ResourceQuota rq;
  rq.SetMaxThreads(config.max_rpc_threads);
  builder.SetResourceQuota(rq);
  std::unique_ptr<Server> server(builder.BuildAndStart());
  if (!server) {
    LOG_FATAL("can not listen on %s", config.server_address.c_str());
    return 1;
  }
  LOG_INFO("Server listening on %s", config.server_address.c_str());
  auto f = service.exit_future();
  f.wait();
  server->Shutdown();
  server->Wait();
}
