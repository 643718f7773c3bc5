#pragma once

#include <stdint.h>     /* [u]int*_t */
#include <string>       /* string    */
#include <vector>       /* vector    */
#include <variant>      /* variant   */

/* protocol tag; selects which alternative of protocol_rule::match is used */
enum policy_proto : uint8_t {
    POL_TCP,
    POL_UDP,
    POL_SCTP,
    POL_ICMP,
    POL_ICMPV6,
};

enum policy_action : uint8_t {
    POL_ALLOW,
    POL_DENY,
};

/* destination port text: "N" or "N-M" (validated by the rule compiler) */
struct port_match {
    std::string ports;
};

struct icmp_match {
    uint8_t type;
    uint8_t code;
};

/* single protocol rule; TCP/UDP/SCTP carry port_match, ICMP/ICMPv6 carry  *
 * icmp_match -- any other pairing is rejected at compile time             */
struct protocol_rule {
    uint32_t                             order;     /* rule id / priority */
    policy_proto                         protocol;
    policy_action                        action;
    std::variant<port_match, icmp_match> match;
};

/* rules shared by every listed source range */
struct policy_rule_set {
    std::vector<std::string>   source_cidrs;
    std::vector<protocol_rule> rules;
};

const char *pol_proto_name(policy_proto proto);
int32_t     pol_parse_rule(const char *text, struct protocol_rule *rule);
