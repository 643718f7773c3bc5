// tests/unit/rule_compiler_test.cpp
#include <cassert>
#include <string.h>
#include <netinet/in.h>

#include "rule_compiler.h"
#include "policy.h"
#include "test_helpers.h"

static struct protocol_rule port_rule(uint32_t order, policy_proto proto,
                                      policy_action action, const char *ports)
{
    return { .order = order, .protocol = proto, .action = action,
             .match = port_match{ ports } };
}

static struct protocol_rule icmp_rule(uint32_t order, policy_proto proto,
                                      policy_action action, uint8_t type,
                                      uint8_t code)
{
    return { .order = order, .protocol = proto, .action = action,
             .match = icmp_match{ type, code } };
}

bool test_port_parsing()
{
    uint16_t start, end;

    assert(rc_parse_ports("0", &start, &end) == 0);
    assert(start == 0 && end == 0);
    assert(rc_parse_ports("65535", &start, &end) == 0);
    assert(start == 65535 && end == 0);
    assert(rc_parse_ports("22", &start, &end) == 0);
    assert(start == 22 && end == 0);
    assert(rc_parse_ports("80-443", &start, &end) == 0);
    assert(start == 80 && end == 443);
    assert(rc_parse_ports("0-65535", &start, &end) == 0);
    assert(start == 0 && end == 65535);

    // ordering of the range is not enforced
    assert(rc_parse_ports("443-80", &start, &end) == 0);
    assert(start == 443 && end == 80);

    const char *bad[] = {
        "", "abc", "65536", "99999999999", "-1", "+80", " 80", "80 ",
        "80-", "-80", "1-2-3", "80-65536", "80--90", "0x50", "8o",
    };
    for (auto ports : bad)
        assert(rc_parse_ports(ports, &start, &end) == -EINVAL);

    return true;
}

bool test_cidr_parsing()
{
    struct lpm_key key;

    assert(rc_parse_cidr("10.0.0.0/8", &key) == 0);
    assert(key.prefix_len == 8);
    assert(key.ip_data[0] == 10 && key.ip_data[1] == 0);
    for (size_t i = 4; i < sizeof(key.ip_data); ++i)
        assert(key.ip_data[i] == 0);

    // host bits are kept as written
    assert(rc_parse_cidr("192.168.1.77/24", &key) == 0);
    assert(key.prefix_len == 24);
    assert(key.ip_data[3] == 77);

    assert(rc_parse_cidr("2001:db8::1/32", &key) == 0);
    assert(key.prefix_len == 32);
    assert(key.ip_data[0] == 0x20 && key.ip_data[1] == 0x01);
    assert(key.ip_data[2] == 0x0d && key.ip_data[3] == 0xb8);
    assert(key.ip_data[15] == 0x01);

    assert(rc_parse_cidr("0.0.0.0/0", &key) == 0);
    assert(key.prefix_len == 0);
    assert(rc_parse_cidr("::/128", &key) == 0);
    assert(key.prefix_len == 128);

    const char *bad[] = {
        "10.0.0.0", "10.0.0.0/33", "::/129", "bogus/8", "10.0.0.0/",
        "10.0.0.0/a", "10.0.0/8", "/8", "10.0.0.0/-1", "10.0.0.0/0008",
    };
    for (auto cidr : bad)
        assert(rc_parse_cidr(cidr, &key) == -EINVAL);

    return true;
}

bool test_compile_scenario()
{
    mem_lpm_store          store;
    struct policy_rule_set policy;
    struct lpm_key         key;
    struct rules_val       val;

    policy.source_cidrs = { "10.0.0.0/8" };
    policy.rules        = { port_rule(1, POL_TCP, POL_ALLOW, "80-443") };

    assert(rc_apply(store, policy, false) == 0);

    key = {};
    key.prefix_len = 8;
    key.ip_data[0] = 10;
    assert(store.lookup(key, &val) == 0);

    assert(val.num_rules == 1);
    assert(val.rules[0].rule_id == 1);
    assert(val.rules[0].protocol == IPPROTO_TCP);
    assert(val.rules[0].dst_port_start == 80);
    assert(val.rules[0].dst_port_end == 443);
    assert(val.rules[0].action == XDP_ACT_ALLOW);

    return true;
}

bool test_protocol_mapping()
{
    struct rules_val val;

    std::vector<struct protocol_rule> rules = {
        port_rule(1, POL_TCP, POL_ALLOW, "22"),
        port_rule(2, POL_UDP, POL_DENY, "53"),
        port_rule(3, POL_SCTP, POL_ALLOW, "36412-36413"),
        icmp_rule(4, POL_ICMP, POL_DENY, 8, 0),
        icmp_rule(5, POL_ICMPV6, POL_ALLOW, 128, 1),
    };

    assert(rc_compile(rules, &val) == 0);
    assert(val.num_rules == 5);

    assert(val.rules[0].protocol == 6);
    assert(val.rules[0].dst_port_start == 22 && val.rules[0].dst_port_end == 0);
    assert(val.rules[1].protocol == 17);
    assert(val.rules[1].action == XDP_ACT_DENY);
    assert(val.rules[2].protocol == 132);
    assert(val.rules[2].dst_port_end == 36413);
    assert(val.rules[3].protocol == 1);
    assert(val.rules[3].icmp_type == 8 && val.rules[3].icmp_code == 0);
    assert(val.rules[3].dst_port_start == 0);
    assert(val.rules[4].protocol == 58);
    assert(val.rules[4].icmp_type == 128 && val.rules[4].icmp_code == 1);
    assert(val.rules[4].rule_id == 5);

    return true;
}

bool test_reject_leaves_store_unchanged()
{
    mem_lpm_store          store;
    struct policy_rule_set policy;

    policy.source_cidrs = { "10.0.0.0/8", "fd00::/8" };

    // unknown protocol tag
    policy.rules = { port_rule(1, POL_TCP, POL_ALLOW, "80"),
                     port_rule(2, (policy_proto) 42, POL_ALLOW, "80") };
    assert(rc_apply(store, policy, false) == -EINVAL);

    // unknown action
    policy.rules = { port_rule(1, POL_TCP, (policy_action) 9, "80") };
    assert(rc_apply(store, policy, false) == -EINVAL);

    // payload does not match protocol tag
    policy.rules = { icmp_rule(1, POL_UDP, POL_ALLOW, 8, 0) };
    assert(rc_apply(store, policy, false) == -EINVAL);
    policy.rules = { port_rule(1, POL_ICMP, POL_ALLOW, "80") };
    assert(rc_apply(store, policy, false) == -EINVAL);

    // malformed ports in a later rule
    policy.rules = { port_rule(1, POL_TCP, POL_ALLOW, "80"),
                     port_rule(2, POL_UDP, POL_DENY, "53-x") };
    assert(rc_apply(store, policy, false) == -EINVAL);

    // malformed range after a valid one
    policy.rules        = { port_rule(1, POL_TCP, POL_ALLOW, "80") };
    policy.source_cidrs = { "10.0.0.0/8", "10.0.0.0/99" };
    assert(rc_apply(store, policy, false) == -EINVAL);

    // rules are validated in delete mode too
    policy.source_cidrs = { "10.0.0.0/8" };
    policy.rules        = { port_rule(1, (policy_proto) 42, POL_ALLOW, "80") };
    assert(rc_apply(store, policy, true) == -EINVAL);

    assert(store.mutations == 0);
    assert(store.entries.empty());

    return true;
}

bool test_capacity()
{
    mem_lpm_store                     store;
    struct policy_rule_set            policy;
    struct rules_val                  val;
    std::vector<struct protocol_rule> rules;

    for (uint32_t i = 0; i < MAX_RULES_PER_TARGET; ++i)
        rules.push_back(port_rule(i + 1, POL_TCP, POL_ALLOW, "80"));

    assert(rc_compile(rules, &val) == 0);
    assert(val.num_rules == MAX_RULES_PER_TARGET);
    assert(val.rules[MAX_RULES_PER_TARGET - 1].rule_id == MAX_RULES_PER_TARGET);

    rules.push_back(port_rule(MAX_RULES_PER_TARGET + 1, POL_TCP, POL_ALLOW,
                              "80"));
    policy.source_cidrs = { "10.0.0.0/8" };
    policy.rules        = rules;
    assert(rc_apply(store, policy, false) == -EINVAL);
    assert(store.mutations == 0);

    return true;
}

bool test_key_independence()
{
    mem_lpm_store          alone, together;
    struct policy_rule_set policy;
    struct lpm_key         key;
    struct rules_val       a, b;

    policy.rules = { port_rule(7, POL_UDP, POL_DENY, "53") };

    policy.source_cidrs = { "172.16.0.0/12" };
    assert(rc_apply(alone, policy, false) == 0);

    policy.source_cidrs = { "2001:db8::/48", "172.16.0.0/12", "10.0.0.0/8" };
    assert(rc_apply(together, policy, false) == 0);

    assert(alone.entries.size() == 1);
    assert(together.entries.size() == 3);
    assert(together.entries.count(alone.entries.begin()->first) == 1);

    // every range shares the same rule list
    assert(rc_parse_cidr("172.16.0.0/12", &key) == 0);
    assert(alone.lookup(key, &a) == 0);
    assert(together.lookup(key, &b) == 0);
    assert(same_val(a, b));
    assert(rc_parse_cidr("2001:db8::/48", &key) == 0);
    assert(together.lookup(key, &b) == 0);
    assert(same_val(a, b));

    return true;
}

bool test_replace_and_delete()
{
    mem_lpm_store          store;
    struct policy_rule_set policy;
    struct lpm_key         key;
    struct rules_val       val;

    policy.source_cidrs = { "10.0.0.0/8" };
    policy.rules        = { port_rule(1, POL_TCP, POL_ALLOW, "80"),
                            port_rule(2, POL_TCP, POL_DENY, "22") };
    assert(rc_apply(store, policy, false) == 0);

    // upsert replaces the prior entry
    policy.rules = { icmp_rule(3, POL_ICMP, POL_DENY, 8, 0) };
    assert(rc_apply(store, policy, false) == 0);

    assert(rc_parse_cidr("10.0.0.0/8", &key) == 0);
    assert(store.lookup(key, &val) == 0);
    assert(val.num_rules == 1);
    assert(val.rules[0].rule_id == 3);

    assert(rc_apply(store, policy, true) == 0);
    assert(store.lookup(key, &val) == -ENOENT);

    // deleting a missing key is a no-op
    assert(rc_apply(store, policy, true) == 0);

    return true;
}

bool test_store_failure_propagates()
{
    mem_lpm_store          store;
    struct policy_rule_set policy;

    policy.source_cidrs = { "10.0.0.0/8" };
    policy.rules        = { port_rule(1, POL_TCP, POL_ALLOW, "80") };

    store.fail_with = -ENOMEM;
    assert(rc_apply(store, policy, false) == -ENOMEM);
    assert(rc_apply(store, policy, true) == -ENOMEM);

    return true;
}

bool test_rule_text()
{
    struct protocol_rule rule;

    assert(pol_parse_rule("1:tcp:allow:80-443", &rule) == 0);
    assert(rule.order == 1);
    assert(rule.protocol == POL_TCP);
    assert(rule.action == POL_ALLOW);
    assert(std::get<port_match>(rule.match).ports == "80-443");

    assert(pol_parse_rule("20:ICMP:Deny:8/3", &rule) == 0);
    assert(rule.order == 20);
    assert(rule.protocol == POL_ICMP);
    assert(rule.action == POL_DENY);
    assert(std::get<icmp_match>(rule.match).type == 8);
    assert(std::get<icmp_match>(rule.match).code == 3);

    assert(pol_parse_rule("3:icmpv6:deny", &rule) == 0);
    assert(rule.protocol == POL_ICMPV6);
    assert(std::get<icmp_match>(rule.match).type == 0);

    // port text is only validated at compile time
    assert(pol_parse_rule("4:sctp:allow:bogus", &rule) == 0);
    assert(std::get<port_match>(rule.match).ports == "bogus");

    const char *bad[] = {
        "x:tcp:allow:80", "1:gre:allow:80", "1:tcp:maybe:80", "1:tcp:allow",
        "1:icmp:allow:300", "1:icmp:allow:8/x", "1:tcp", "",
        "1:tcp:allow:80:90", "99999999999:tcp:allow:80",
    };
    for (auto text : bad)
        assert(pol_parse_rule(text, &rule) == -EINVAL);

    return true;
}

int main()
{
    bool ok = true;

    std::cout << "=== Rule Compiler Tests ===" << std::endl;

    ok &= print_test_result("Port parsing", test_port_parsing());
    ok &= print_test_result("CIDR parsing", test_cidr_parsing());
    ok &= print_test_result("Compile scenario", test_compile_scenario());
    ok &= print_test_result("Protocol mapping", test_protocol_mapping());
    ok &= print_test_result("Reject leaves store unchanged",
                            test_reject_leaves_store_unchanged());
    ok &= print_test_result("Capacity", test_capacity());
    ok &= print_test_result("Key independence", test_key_independence());
    ok &= print_test_result("Replace and delete", test_replace_and_delete());
    ok &= print_test_result("Store failure propagates",
                            test_store_failure_propagates());
    ok &= print_test_result("Rule text", test_rule_text());

    return ok ? 0 : 1;
}
