#pragma once
#include "type.hpp"
#include "exceptions.hpp"
#include "logger.hpp"
#include "global_id.hpp"
#include "node_registry.hpp"
#include "relay_context.hpp"

#include <folly/futures/Future.h>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

template<typename T>
using NodeLoader = std::function<folly::Future<std::optional<T>>(RelayContext, local_id_t)>;

template<typename T, typename... Ts>
struct node_index_of;
template<typename T, typename... Rest>
struct node_index_of<T, T, Rest...> : std::integral_constant<size_t, 0> {};
template<typename T, typename First, typename... Rest>
struct node_index_of<T, First, Rest...>
    : std::integral_constant<size_t, 1 + node_index_of<T, Rest...>::value> {};

/**
 * @brief refetch any registered object from its global id.
 *
 * Ts... is the closed set of node types, in the same order as the registry:
 * Ts[i] owns tag i+1. Every type names itself with a static kTypeName and by
 * default is loaded through its static
 *
 *   folly::Future<std::optional<T>> T::get(RelayContext ctx, local_id_t id);
 *
 * Get() only routes: decode, match the tag, call the loader, wrap the result.
 * The loader call is the only place it may suspend. Cancelling the returned
 * future raises an interrupt on the loader's future.
 */
template<typename... Ts>
class NodeDispatcher {
  static_assert(sizeof...(Ts) > 0, "dispatcher needs at least one node type");
 public:
  using Node = std::variant<Ts...>;
  template<typename T>
  using Future = folly::Future<T>;
  using NodeFuture = Future<std::optional<Node>>;
 private:
  const NodeRegistry & _registry;
  std::tuple<NodeLoader<Ts>...> _loaders;

  template<size_t I>
  NodeFuture LoadAs(RelayContext ctx, local_id_t id) const {
    using T = std::variant_alternative_t<I, Node>;
    const NodeLoader<T> & loader = std::get<I>(_loaders);
    return folly::makeFutureWith([&loader, &ctx, &id]() {
      return loader(std::move(ctx), std::move(id));
    }).thenValue([](std::optional<T> obj) -> std::optional<Node> {
      if (!obj) return std::nullopt;
      return Node(std::in_place_index<I>, std::move(*obj));
    });
  }

  template<size_t... Is>
  NodeFuture LoadByIndex(const size_t idx, RelayContext ctx, local_id_t id, std::index_sequence<Is...>) const {
    using LoadFn = NodeFuture (NodeDispatcher::*)(RelayContext, local_id_t) const;
    static const LoadFn loaders[] = { &NodeDispatcher::template LoadAs<Is>... };
    return (this->*loaders[idx])(std::move(ctx), std::move(id));
  }

  template<size_t... Is>
  void CheckBinding(std::index_sequence<Is...>) const {
    const char* names[] = { Ts::kTypeName... };
    bool has_loader[] = { static_cast<bool>(std::get<Is>(_loaders))... };
    for (size_t i = 0; i < sizeof...(Ts); i++) {
      const std::string & registered = _registry.get_type_name(static_cast<node_tag_t>(i + 1));
      if (registered != names[i]) {
        throw FatalException(Formatter() << "node tag " << i + 1 << " is registered as " << registered
                                         << " but bound to " << names[i]);
      }
      if (!has_loader[i]) throw FatalException(Formatter() << "no loader for node type " << names[i]);
    }
  }

  static NodeFuture absent() {
    return folly::makeFuture<std::optional<Node>>(std::optional<Node>());
  }
 public:
  NodeDispatcher() = delete;
  explicit NodeDispatcher(const NodeRegistry & registry)
    : NodeDispatcher(registry, NodeLoader<Ts>(&Ts::get)...) {}
  NodeDispatcher(const NodeRegistry & registry, NodeLoader<Ts>... loaders)
    : _registry(registry), _loaders(std::move(loaders)...) {
    if (!_registry.initialized()) throw FatalException("Please initialize the node registry first");
    if (_registry.size() != sizeof...(Ts)) {
      throw FatalException(Formatter() << "node registry has " << _registry.size()
                                       << " types, dispatcher is bound to " << sizeof...(Ts));
    }
    CheckBinding(std::index_sequence_for<Ts...>{});
  }

  NodeFuture Get(RelayContext ctx, const std::string & global_id) const {
    std::optional<decoded_id_t> decoded = DecodeGlobalId(global_id);
    if (!decoded) {
      LOG_DEBUG("reject global id \"%s\": too short", global_id.c_str());
      return absent();
    }
    node_tag_t tag = _registry.find_tag(decoded->tag_str);
    if (tag == kUnknownTag) {
      LOG_DEBUG("reject global id \"%s\": unknown tag \"%s\"", global_id.c_str(), decoded->tag_str.c_str());
      return absent();
    }
    LOG_VERBOSE("dispatch %s to %s", decoded->id.c_str(), _registry.get_type_name(tag).c_str());
    return LoadByIndex(tag - 1, std::move(ctx), std::move(decoded->id), std::index_sequence_for<Ts...>{});
  }

  const NodeRegistry & registry() const { return _registry; }

  template<typename T>
  static constexpr node_tag_t TagOf() {
    return static_cast<node_tag_t>(node_index_of<T, Ts...>::value + 1);
  }
  template<typename T>
  static relay_id_t IdOf(local_id_t id) {
    return relay_id_t(std::move(id), TagOf<T>());
  }
  const std::string & TypeNameOf(const Node & node) const {
    return _registry.get_type_name(static_cast<node_tag_t>(node.index() + 1));
  }
};
