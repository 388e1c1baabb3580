#pragma once
#include "type.hpp"
#include "exceptions.hpp"
#include "global_id.hpp"
#include "relay_context.hpp"
#include "node_dispatcher.hpp"
#include "object_store.hpp"

#include <folly/futures/Future.h>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * The node types served by relay_server. The order of SchemaDispatcher's
 * template arguments must match graph_desc/node_types, append only.
 */

using PropList = std::vector<std::pair<std::string, std::string>>;

struct SchemaStores;

struct Tenant {
  static constexpr const char* kTypeName = "Tenant";
  relay_id_t _id;
  std::string _name;

  PropList props() const {
    return {{"name", _name}};
  }
  static folly::Future<std::optional<Tenant>> get(RelayContext ctx, local_id_t id);
};

struct User {
  static constexpr const char* kTypeName = "User";
  relay_id_t _id;
  std::string _name;
  relay_id_t _tenant;

  PropList props() const {
    return {{"name", _name}, {"tenant", EncodeGlobalId(_tenant)}};
  }
  static folly::Future<std::optional<User>> get(RelayContext ctx, local_id_t id);
};

using SchemaDispatcher = NodeDispatcher<Tenant, User>;
using SchemaNode = SchemaDispatcher::Node;

struct SchemaStores {
  ObjectStore<Tenant> _tenants;
  ObjectStore<User> _users;

  Tenant CreateTenant(const std::string & name) {
    return _tenants.Create([&name](const local_id_t & id) {
      Tenant t;
      t._id = SchemaDispatcher::IdOf<Tenant>(id);
      t._name = name;
      return t;
    });
  }
  // tenant_global_id must refer to an existing tenant
  User CreateUser(const std::string & name, const std::string & tenant_global_id) {
    std::optional<decoded_id_t> tenant = DecodeGlobalId(tenant_global_id);
    if (!tenant || tenant->tag_str != std::to_string(SchemaDispatcher::TagOf<Tenant>())
        || !_tenants.Read(tenant->id)) {
      throw IndexException(Formatter() << "No such tenant: " << tenant_global_id);
    }
    relay_id_t tenant_id = SchemaDispatcher::IdOf<Tenant>(tenant->id);
    return _users.Create([&name, &tenant_id](const local_id_t & id) {
      User u;
      u._id = SchemaDispatcher::IdOf<User>(id);
      u._name = name;
      u._tenant = tenant_id;
      return u;
    });
  }
};

inline const SchemaStores & StoresOf(const RelayContext & ctx) {
  SchemaStores* stores = ctx.get<SchemaStores*>();
  if (stores == nullptr) throw ContextException("relay context holds a null store");
  return *stores;
}

inline folly::Future<std::optional<Tenant>> Tenant::get(RelayContext ctx, local_id_t id) {
  return folly::makeFuture(StoresOf(ctx)._tenants.Read(id));
}

inline folly::Future<std::optional<User>> User::get(RelayContext ctx, local_id_t id) {
  return folly::makeFuture(StoresOf(ctx)._users.Read(id));
}

/**
 * @brief properties of whichever case the node holds, for serialization
 */
inline PropList PropsOf(const SchemaNode & node) {
  return std::visit([](const auto & obj) { return obj.props(); }, node);
}

inline relay_id_t NodeIdOf(const SchemaNode & node) {
  return std::visit([](const auto & obj) { return obj._id; }, node);
}
