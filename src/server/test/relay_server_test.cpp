#include "server/relay_server.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "logger.hpp"

class relay_server : public testing::Test {
    void SetUp() override {
        relaylog::setLogDebugLevel(RLOG_FATAL);
    }

    void TearDown() override {
        relaylog::setLogDebugLevel(RLOG_ERROR);
    }

protected:
    NodeRegistry m_registry{std::vector<std::string>{"Tenant", "User"}};
    SchemaDispatcher m_dispatcher{m_registry};
    SchemaStores m_stores;
    RelayServerImpl m_server{&m_dispatcher, &m_stores};

    NodeResult create(const std::string &type_name, const std::vector<std::string> &props) {
        CreateParam rqst;
        rqst.set_type_name(type_name);
        for (auto &p : props) {
            rqst.add_prop_list(p);
        }
        NodeResult rply;
        EXPECT_TRUE(m_server.Create(nullptr, &rqst, &rply).ok());
        return rply;
    }
    NodeResult getNode(RelayServerImpl &server, const std::string &global_id) {
        NodeParam rqst;
        rqst.set_id(global_id);
        NodeResult rply;
        EXPECT_TRUE(server.GetNode(nullptr, &rqst, &rply).ok());
        return rply;
    }
    NodeResult command(const std::string &cmd) {
        CommandParam rqst;
        rqst.set_command(cmd);
        NodeResult rply;
        EXPECT_TRUE(m_server.Command(nullptr, &rqst, &rply).ok());
        return rply;
    }
};

TEST_F(relay_server, create_then_refetch) {
    NodeResult tenant = create("Tenant", {"acme"});
    ASSERT_EQ(RelayRPC::kOk, tenant.code());
    EXPECT_EQ("Tenant", tenant.type_name());
    EXPECT_EQ(33u, tenant.id().size());
    EXPECT_EQ('1', tenant.id().back());

    NodeResult user = create("User", {"Oscar", tenant.id()});
    ASSERT_EQ(RelayRPC::kOk, user.code());
    EXPECT_EQ('2', user.id().back());

    NodeResult rply = getNode(m_server, user.id());
    ASSERT_EQ(RelayRPC::kOk, rply.code());
    EXPECT_EQ("User", rply.type_name());
    EXPECT_EQ(user.id(), rply.id());
    ASSERT_EQ(2, rply.prop_size());
    EXPECT_EQ("name", rply.prop(0).name());
    EXPECT_EQ("Oscar", rply.prop(0).value());
    EXPECT_EQ("tenant", rply.prop(1).name());
    EXPECT_EQ(tenant.id(), rply.prop(1).value());

    rply = getNode(m_server, tenant.id());
    ASSERT_EQ(RelayRPC::kOk, rply.code());
    EXPECT_EQ("Tenant", rply.type_name());
    EXPECT_EQ("acme", rply.prop(0).value());
}

TEST_F(relay_server, not_found) {
    NodeResult tenant = create("Tenant", {"acme"});
    ASSERT_EQ(RelayRPC::kOk, tenant.code());
    std::string compact = tenant.id().substr(0, 32);

    EXPECT_EQ(RelayRPC::kNotFound, getNode(m_server, compact.substr(0, 31)).code());
    EXPECT_EQ(RelayRPC::kNotFound, getNode(m_server, compact + "3").code());
    EXPECT_EQ(RelayRPC::kNotFound, getNode(m_server, compact + "01").code());
    // tenant's local id under the User tag
    EXPECT_EQ(RelayRPC::kNotFound, getNode(m_server, compact + "2").code());
}

TEST_F(relay_server, failing_loader_is_fatal) {
    SchemaDispatcher failing(
        m_registry, NodeLoader<Tenant>(&Tenant::get),
        [](RelayContext, local_id_t) -> folly::Future<std::optional<User>> { throw std::runtime_error("store down"); });
    RelayServerImpl server(&failing, &m_stores);

    NodeResult rply = getNode(server, EncodeGlobalId("123e4567-e89b-12d3-a456-426614174000", 2));
    EXPECT_EQ(RelayRPC::kFatal, rply.code());
    ASSERT_EQ(1, rply.msg_size());
    EXPECT_NE(std::string::npos, rply.msg(0).find("store down"));
}

TEST_F(relay_server, create_wrong_props) {
    EXPECT_EQ(RelayRPC::kAbort, create("Tenant", {}).code());
    EXPECT_EQ(RelayRPC::kAbort, create("Tenant", {"a", "b"}).code());
    EXPECT_EQ(RelayRPC::kAbort, create("User", {"Oscar"}).code());
    EXPECT_EQ(RelayRPC::kAbort, create("Post", {"x"}).code());
    EXPECT_EQ(0u, m_stores._tenants.Size());
}

TEST_F(relay_server, create_user_unknown_tenant) {
    NodeResult rply = create("User", {"Oscar", "nope"});
    EXPECT_EQ(RelayRPC::kAbort, rply.code());
    EXPECT_EQ(0u, m_stores._users.Size());
}

TEST_F(relay_server, command_types) {
    NodeResult rply = command("types");
    EXPECT_EQ(RelayRPC::kOk, rply.code());
    ASSERT_EQ(2, rply.msg_size());
    EXPECT_EQ("1 Tenant", rply.msg(0));
    EXPECT_EQ("2 User", rply.msg(1));
}

TEST_F(relay_server, command_set_log_level) {
    EXPECT_EQ(RelayRPC::kAbort, command("set_log_level bogus").code());
    EXPECT_EQ(RelayRPC::kAbort, command("set_log_level").code());
    EXPECT_EQ(RelayRPC::kAbort, command("set_log_levelfoo debug").code());
    EXPECT_EQ(RLOG_FATAL, relaylog::level().load());

    EXPECT_EQ(RelayRPC::kOk, command("set_log_level warn").code());
    EXPECT_EQ(RLOG_WARN, relaylog::level().load());
}

TEST_F(relay_server, command_unknown) {
    EXPECT_EQ(RelayRPC::kAbort, command("drop everything").code());
    EXPECT_EQ(RelayRPC::kOk, command("").code());
}
