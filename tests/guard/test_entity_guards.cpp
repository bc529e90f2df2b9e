#include <gtest/gtest.h>

#include "vigil/guard/entity_guards.hpp"

using namespace vigil::guard;
using vigil::type::Array;
using vigil::type::Object;

class EntityGuardsTest : public ::testing::Test {
protected:
    Value user{Object{{"id", "u-1"},
                      {"name", "Ana Silva"},
                      {"email", "ana@example.com"},
                      {"role", "admin"},
                      {"active", true},
                      {"createdAt", "2024-01-15T10:00:00Z"}}};
};

TEST_F(EntityGuardsTest, User) {
    EXPECT_TRUE(isUser(user));
    EXPECT_TRUE(isUser(Value(Object{
        {"id", 7}, {"name", "Bo"}, {"email", "bo@example.com"}})));

    EXPECT_FALSE(isUser(Value(Object{{"id", "u-1"}, {"name", "Ana"}})));
    EXPECT_FALSE(isUser(Value(Object{
        {"id", "u-1"}, {"name", "Ana"}, {"email", "not-an-email"}})));
    EXPECT_FALSE(isUser(Value(Object{
        {"id", ""}, {"name", "Ana"}, {"email", "ana@example.com"}})));
    EXPECT_FALSE(isUser(Value(Object{{"id", "u-1"},
                                     {"name", "Ana"},
                                     {"email", "ana@example.com"},
                                     {"active", "yes"}})));
    EXPECT_FALSE(isUser(Value(Array{})));
}

TEST_F(EntityGuardsTest, Address) {
    Value address(Object{{"street", "Av. Paulista"},
                         {"number", 1578},
                         {"city", "São Paulo"},
                         {"state", "SP"},
                         {"zipCode", "01310-200"}});
    EXPECT_TRUE(isAddress(address));

    Value badZip(Object{{"street", "Av. Paulista"},
                        {"city", "São Paulo"},
                        {"state", "SP"},
                        {"zipCode", "1310"}});
    EXPECT_FALSE(isAddress(badZip));
}

TEST_F(EntityGuardsTest, ApiResponse) {
    Value ok(Object{{"success", true}, {"data", user}});
    EXPECT_TRUE(isApiResponse(ok));
    EXPECT_TRUE(isApiResponse(ok, isUser));
    EXPECT_FALSE(isApiResponse(ok, isString));

    EXPECT_TRUE(isApiResponse(
        Value(Object{{"success", false}, {"error", "not found"}})));
    EXPECT_FALSE(isApiResponse(Value(Object{{"success", false}})));
    EXPECT_FALSE(isApiResponse(Value(Object{{"success", "true"}})));
    EXPECT_FALSE(
        isApiResponse(Value(Object{{"success", true}, {"message", 3}})));
}

TEST_F(EntityGuardsTest, PaginatedResponse) {
    Value page(Object{{"items", Array{user, user}},
                      {"total", 2},
                      {"page", 1},
                      {"pageSize", 20}});
    EXPECT_TRUE(isPaginatedResponse(page));
    EXPECT_TRUE(isPaginatedResponse(page, isUser));
    EXPECT_FALSE(isPaginatedResponse(page, isNumber));

    EXPECT_FALSE(isPaginatedResponse(Value(Object{
        {"items", Array{}}, {"total", 0}, {"page", 0}, {"pageSize", 20}})));
    EXPECT_FALSE(isPaginatedResponse(Value(Object{
        {"items", Array{}}, {"total", 1.5}, {"page", 1}, {"pageSize", 20}})));
}

TEST_F(EntityGuardsTest, Execution) {
    Value running(Object{{"id", "exec-1"},
                         {"status", "running"},
                         {"startedAt", "2024-03-01T08:00:00Z"},
                         {"progress", 40}});
    EXPECT_TRUE(isExecution(running));

    Value finished(Object{{"id", 3},
                          {"status", "completed"},
                          {"startedAt", vigil::type::Value::date(0)},
                          {"finishedAt", vigil::type::Value::date(1000)}});
    EXPECT_TRUE(isExecution(finished));

    EXPECT_FALSE(isExecution(Value(Object{{"id", "exec-1"},
                                          {"status", "paused"},
                                          {"startedAt", "2024-03-01"}})));
    EXPECT_FALSE(isExecution(Value(Object{{"id", "exec-1"},
                                          {"status", "running"},
                                          {"startedAt", "2024-03-01"},
                                          {"progress", 140}})));
}

TEST_F(EntityGuardsTest, Notification) {
    Value notification(Object{{"id", "n-1"},
                              {"type", "warning"},
                              {"title", "Disk almost full"},
                              {"message", ""},
                              {"read", false}});
    EXPECT_TRUE(isNotification(notification));
    EXPECT_FALSE(isNotification(Value(Object{{"id", "n-1"},
                                             {"type", "debug"},
                                             {"title", "x"},
                                             {"message", ""},
                                             {"read", false}})));
}

TEST_F(EntityGuardsTest, Credential) {
    EXPECT_TRUE(isCredential(Value(Object{{"id", "c-1"},
                                          {"name", "Production API"},
                                          {"type", "api_key"},
                                          {"expiresAt", "2025-12-31"}})));
    EXPECT_FALSE(isCredential(Value(Object{
        {"id", "c-1"}, {"name", "Production API"}, {"type", ""}})));
    EXPECT_FALSE(isCredential(Value(Object{{"id", "c-1"},
                                           {"name", "Production API"},
                                           {"type", "api_key"},
                                           {"expiresAt", "someday"}})));
}
