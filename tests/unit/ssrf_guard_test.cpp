#include <sleek/proxy/ssrf_guard.h>

#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace sleek::proxy;

namespace {

class TableResolver : public HostResolver {
public:
    explicit TableResolver(std::map<std::string, std::vector<std::string>> table)
        : table_(std::move(table)) {}

    std::optional<std::vector<std::string>> resolve(const std::string& host) const override {
        ++calls;
        auto it = table_.find(host);
        if (it == table_.end()) return std::nullopt;
        return it->second;
    }

    mutable int calls = 0;

private:
    std::map<std::string, std::vector<std::string>> table_;
};

std::shared_ptr<TableResolver> default_table() {
    return std::make_shared<TableResolver>(std::map<std::string, std::vector<std::string>>{
        {"example.com", {"93.184.216.34", "2606:2800:220:1:248:1893:25c8:1946"}},
        {"intranet.local", {"10.0.0.5"}},
        {"mixed.example", {"8.8.8.8", "192.168.1.10"}},
        {"empty.example", {}},
        {"::1", {"::1"}},
    });
}

} // namespace

// ============================================================================
// is_private_address
// ============================================================================

TEST(PrivateAddress, PrivateIPv4Ranges) {
    EXPECT_TRUE(is_private_address("10.0.0.1"));
    EXPECT_TRUE(is_private_address("10.255.255.255"));
    EXPECT_TRUE(is_private_address("172.16.0.1"));
    EXPECT_TRUE(is_private_address("172.31.255.254"));
    EXPECT_TRUE(is_private_address("192.168.0.1"));
    EXPECT_TRUE(is_private_address("127.0.0.1"));
    EXPECT_TRUE(is_private_address("127.8.9.10"));
    EXPECT_TRUE(is_private_address("169.254.169.254"));
}

TEST(PrivateAddress, PublicIPv4) {
    EXPECT_FALSE(is_private_address("8.8.8.8"));
    EXPECT_FALSE(is_private_address("93.184.216.34"));
    EXPECT_FALSE(is_private_address("172.15.0.1"));
    EXPECT_FALSE(is_private_address("172.32.0.1"));
    EXPECT_FALSE(is_private_address("192.169.0.1"));
    EXPECT_FALSE(is_private_address("11.0.0.1"));
}

TEST(PrivateAddress, IPv6) {
    EXPECT_TRUE(is_private_address("::1"));
    EXPECT_TRUE(is_private_address("[::1]"));
    EXPECT_TRUE(is_private_address("fe80::1"));
    EXPECT_TRUE(is_private_address("FE80::abcd"));
    EXPECT_TRUE(is_private_address("fc00::1"));
    EXPECT_TRUE(is_private_address("fd12:3456::1"));
    EXPECT_FALSE(is_private_address("2606:4700:4700::1111"));
    EXPECT_FALSE(is_private_address("2001:db8::1"));
}

TEST(PrivateAddress, MappedIPv4) {
    EXPECT_TRUE(is_private_address("::ffff:127.0.0.1"));
    EXPECT_TRUE(is_private_address("::ffff:192.168.1.1"));
    EXPECT_FALSE(is_private_address("::ffff:8.8.8.8"));
}

TEST(PrivateAddress, UnspecifiedAddressesAreNotClassified) {
    EXPECT_FALSE(is_private_address("0.0.0.0"));
    EXPECT_FALSE(is_private_address("::"));
}

TEST(PrivateAddress, UnparsableCountsAsPrivate) {
    EXPECT_TRUE(is_private_address("not-an-ip"));
    EXPECT_TRUE(is_private_address(""));
    EXPECT_TRUE(is_private_address("999.1.1.1"));
}

// ============================================================================
// SsrfGuard
// ============================================================================

TEST(SsrfGuard, PublicHostAllowedAndPinned) {
    SsrfGuard guard({}, true, default_table());
    auto decision = guard.authorize("example.com");
    EXPECT_TRUE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::None);
    ASSERT_EQ(decision.addresses.size(), 2u);
    EXPECT_EQ(decision.addresses[0], "93.184.216.34");
}

TEST(SsrfGuard, PrivateResolutionDenied) {
    SsrfGuard guard({}, true, default_table());
    auto decision = guard.authorize("intranet.local");
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::PrivateAddress);
    EXPECT_EQ(decision.message,
              "Access to private network addresses is blocked (intranet.local resolves to 10.0.0.5)");
    EXPECT_TRUE(decision.addresses.empty());
}

TEST(SsrfGuard, AnyPrivateAddressDeniesTheHost) {
    SsrfGuard guard({}, true, default_table());
    auto decision = guard.authorize("mixed.example");
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::PrivateAddress);
    EXPECT_NE(decision.message.find("192.168.1.10"), std::string::npos);
}

TEST(SsrfGuard, UnresolvableDenied) {
    SsrfGuard guard({}, true, default_table());
    auto missing = guard.authorize("nowhere.invalid");
    EXPECT_FALSE(missing.allowed);
    EXPECT_EQ(missing.reason, DenyReason::Unresolvable);
    EXPECT_EQ(missing.message, "Could not resolve host: nowhere.invalid");

    auto empty = guard.authorize("empty.example");
    EXPECT_FALSE(empty.allowed);
    EXPECT_EQ(empty.reason, DenyReason::Unresolvable);
}

TEST(SsrfGuard, BracketedLiteralResolvedWithoutBrackets) {
    SsrfGuard guard({}, true, default_table());
    auto decision = guard.authorize("[::1]");
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::PrivateAddress);
}

TEST(SsrfGuard, AllowlistCheckedBeforeResolution) {
    auto resolver = default_table();
    SsrfGuard guard({"example.com"}, true, resolver);
    auto decision = guard.authorize("intranet.local");
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::NotAllowlisted);
    EXPECT_EQ(decision.message, "Host not allowed: intranet.local");
    EXPECT_EQ(resolver->calls, 0);

    EXPECT_TRUE(guard.authorize("example.com").allowed);
    EXPECT_EQ(resolver->calls, 1);
}

TEST(SsrfGuard, AllowlistIsCaseInsensitiveAndExact) {
    SsrfGuard guard({"Example.COM"}, true, default_table());
    EXPECT_TRUE(guard.is_allowlisted("example.com"));
    EXPECT_TRUE(guard.is_allowlisted("EXAMPLE.com"));
    EXPECT_FALSE(guard.is_allowlisted("www.example.com"));
    EXPECT_FALSE(guard.is_allowlisted("example.com.evil.net"));
}

TEST(SsrfGuard, EmptyAllowlistAllowsAnyName) {
    SsrfGuard guard({}, true, default_table());
    EXPECT_TRUE(guard.is_allowlisted("anything.example"));
}

TEST(SsrfGuard, PrivateCheckDisabledSkipsResolution) {
    auto resolver = default_table();
    SsrfGuard guard({}, false, resolver);
    auto decision = guard.authorize("intranet.local");
    EXPECT_TRUE(decision.allowed);
    EXPECT_TRUE(decision.addresses.empty());
    EXPECT_EQ(resolver->calls, 0);
}

TEST(SsrfGuard, ResolvesAfreshEveryTime) {
    auto resolver = default_table();
    SsrfGuard guard({}, true, resolver);
    guard.authorize("example.com");
    guard.authorize("example.com");
    EXPECT_EQ(resolver->calls, 2);
}

TEST(SsrfGuard, SystemResolverHandlesLiterals) {
    SystemResolver resolver;
    auto v4 = resolver.resolve("127.0.0.1");
    ASSERT_TRUE(v4.has_value());
    ASSERT_FALSE(v4->empty());
    EXPECT_EQ(v4->front(), "127.0.0.1");

    auto v6 = resolver.resolve("[::1]");
    ASSERT_TRUE(v6.has_value());
    ASSERT_FALSE(v6->empty());
    EXPECT_EQ(v6->front(), "::1");

    EXPECT_FALSE(resolver.resolve("").has_value());
}

TEST(SsrfGuard, DefaultResolverDeniesLoopbackLiteral) {
    SsrfGuard guard({}, true, nullptr);
    auto decision = guard.authorize("127.0.0.1");
    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.reason, DenyReason::PrivateAddress);
}
