#include "schema/schema.hpp"

#include <gtest/gtest.h>

#include "logger.hpp"

class schema : public testing::Test {
    void SetUp() override {
        relaylog::setLogDebugLevel(RLOG_ERROR);
    }

protected:
    NodeRegistry m_registry{std::vector<std::string>{"Tenant", "User"}};
    SchemaDispatcher m_dispatcher{m_registry};
    SchemaStores m_stores;

    std::optional<SchemaNode> refetch(const std::string &global_id) {
        return m_dispatcher.Get(RelayContext::of(&m_stores), global_id).get();
    }
};

TEST_F(schema, refetch_user) {
    Tenant acme = m_stores.CreateTenant("acme");
    User oscar = m_stores.CreateUser("Oscar", EncodeGlobalId(acme._id));

    std::string gid = EncodeGlobalId(oscar._id);
    EXPECT_EQ(33u, gid.size());
    EXPECT_EQ('2', gid.back());

    auto node = refetch(gid);
    ASSERT_TRUE(node.has_value());
    ASSERT_TRUE(std::holds_alternative<User>(*node));
    EXPECT_EQ("Oscar", std::get<User>(*node)._name);
    EXPECT_EQ(acme._id, std::get<User>(*node)._tenant);
    EXPECT_EQ("User", m_dispatcher.TypeNameOf(*node));
    EXPECT_EQ(oscar._id, NodeIdOf(*node));

    PropList props = PropsOf(*node);
    ASSERT_EQ(2u, props.size());
    EXPECT_EQ("name", props[0].first);
    EXPECT_EQ("Oscar", props[0].second);
    EXPECT_EQ("tenant", props[1].first);
    EXPECT_EQ(EncodeGlobalId(acme._id), props[1].second);
}

TEST_F(schema, refetch_tenant) {
    Tenant acme = m_stores.CreateTenant("acme");
    EXPECT_EQ(1u, acme._id.tag);
    auto node = refetch(EncodeGlobalId(acme._id));
    ASSERT_TRUE(node.has_value());
    EXPECT_EQ("Tenant", m_dispatcher.TypeNameOf(*node));
    EXPECT_EQ("acme", std::get<Tenant>(*node)._name);
}

TEST_F(schema, ids_are_scoped_to_one_type) {
    Tenant acme = m_stores.CreateTenant("acme");
    // same local id under the User tag: no such user
    EXPECT_FALSE(refetch(EncodeGlobalId(acme._id.id, SchemaDispatcher::TagOf<User>())).has_value());
}

TEST_F(schema, deleted_object) {
    Tenant acme = m_stores.CreateTenant("acme");
    ASSERT_TRUE(m_stores._tenants.Delete(acme._id.id));
    EXPECT_FALSE(refetch(EncodeGlobalId(acme._id)).has_value());
}

TEST_F(schema, user_needs_existing_tenant) {
    EXPECT_THROW(m_stores.CreateUser("Oscar", "nope"), IndexException);
    EXPECT_THROW(m_stores.CreateUser("Oscar", EncodeGlobalId("00000000-0000-0000-0000-000000000000", 1)), IndexException);

    Tenant acme = m_stores.CreateTenant("acme");
    // tenant local id under the wrong tag
    EXPECT_THROW(m_stores.CreateUser("Oscar", EncodeGlobalId(acme._id.id, 2)), IndexException);
}

TEST_F(schema, loader_without_store_fails) {
    Tenant acme = m_stores.CreateTenant("acme");
    auto f = m_dispatcher.Get(RelayContext::nil(), EncodeGlobalId(acme._id));
    EXPECT_THROW(std::move(f).get(), ContextException);
}
