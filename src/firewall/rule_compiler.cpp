/*
 * Copyright © 2021, Radu-Alexandru Mantu <andru.mantu@gmail.com>
 *
 * This file is part of nodefw.
 *
 * nodefw is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * nodefw is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with nodefw. If not, see <https://www.gnu.org/licenses/>.
 */

#include <string.h>         /* memset, strchr, strlen */
#include <arpa/inet.h>      /* inet_pton, AF_INET*    */
#include <netinet/in.h>     /* IPPROTO_*              */

#include <string>           /* string */
#include <vector>           /* vector */

#include "rule_compiler.h"
#include "util.h"

using namespace std;

/******************************************************************************
 ************************** INTERNAL HELPER FUNCTIONS *************************
 ******************************************************************************/

/* _parse_u16 - parses an unsigned decimal that must fit in 16 bits
 *  @str : string (not necessarily NUL terminated at len)
 *  @len : number of characters to consider
 *  @val : ptr to destination
 *
 *  @return : 0 if everything went well; -EINVAL otherwise
 *
 * Digits only: no sign, no whitespace, no empty string. Leading zeros are
 * accepted.
 */
static int32_t
_parse_u16(const char *str, size_t len, uint16_t *val)
{
    uint32_t number = 0;    /* accumulator */

    if (!len)
        return -EINVAL;

    for (size_t i = 0; i < len; ++i) {
        if (str[i] < '0' || str[i] > '9')
            return -EINVAL;

        number = number * 10 + (str[i] - '0');
        if (number > 0xffff)
            return -EINVAL;
    }

    *val = (uint16_t) number;
    return 0;
}

/* _fill_ports - sets destination port range of a rule entry
 *  @entry : rule entry being compiled
 *  @rule  : source rule
 *
 *  @return : 0 if everything went well; -EINVAL otherwise
 */
static int32_t
_fill_ports(struct rule_entry *entry, const protocol_rule &rule)
{
    const port_match *pm = get_if<port_match>(&rule.match);
    int32_t          ans;

    RET(!pm, -EINVAL, "rule %u: %s requires a port range", rule.order,
        pol_proto_name(rule.protocol));

    ans = rc_parse_ports(pm->ports.c_str(), &entry->dst_port_start,
                         &entry->dst_port_end);
    RET(ans, -EINVAL, "invalid ports \"%s\" for protocol %s",
        pm->ports.c_str(), pol_proto_name(rule.protocol));

    return 0;
}

/* _fill_icmp - sets icmp type & code of a rule entry
 *  @entry : rule entry being compiled
 *  @rule  : source rule
 *
 *  @return : 0 if everything went well; -EINVAL otherwise
 */
static int32_t
_fill_icmp(struct rule_entry *entry, const protocol_rule &rule)
{
    const icmp_match *im = get_if<icmp_match>(&rule.match);

    RET(!im, -EINVAL, "rule %u: %s requires icmp type and code", rule.order,
        pol_proto_name(rule.protocol));

    entry->icmp_type = im->type;
    entry->icmp_code = im->code;

    return 0;
}

/******************************************************************************
 ************************** PUBLIC API IMPLEMENTATION *************************
 ******************************************************************************/

/* rc_parse_ports - parses destination port text
 *  @ports : "N" or "N-M"
 *  @start : ptr to range start (N)
 *  @end   : ptr to range end (M, or 0 for a single port)
 *
 *  @return : 0 if everything went well; -EINVAL otherwise
 *
 * Only the first '-' separates; "1-2-3" is rejected since "2-3" is not a
 * number. The range is not required to be ordered.
 */
int32_t
rc_parse_ports(const char *ports, uint16_t *start, uint16_t *end)
{
    const char *sep;        /* hyphen position    */
    uint16_t   p_start;     /* parsed range start */
    uint16_t   p_end;       /* parsed range end   */
    int32_t    ans;         /* answer             */

    sep = strchr(ports, '-');

    /* single port */
    if (!sep) {
        ans = _parse_u16(ports, strlen(ports), &p_start);
        RET(ans, ans, "invalid port number \"%s\"", ports);

        *start = p_start;
        *end   = 0;
        return 0;
    }

    /* port range */
    ans = _parse_u16(ports, sep - ports, &p_start);
    RET(ans, ans, "invalid start port in \"%s\"", ports);

    ans = _parse_u16(sep + 1, strlen(sep + 1), &p_end);
    RET(ans, ans, "invalid end port in \"%s\"", ports);

    *start = p_start;
    *end   = p_end;
    return 0;
}

/* rc_parse_cidr - builds LPM key from CIDR notation
 *  @cidr : "ADDR/PREFIX" (IPv4 or IPv6)
 *  @key  : ptr to destination key
 *
 *  @return : 0 if everything went well; -EINVAL otherwise
 *
 * The key is zeroed first, so it only depends on @cidr. Host bits of the
 * address are kept as written; the LPM trie ignores them.
 */
int32_t
rc_parse_cidr(const char *cidr, struct lpm_key *key)
{
    const char *slash;      /* prefix separator           */
    string     addr;        /* address part               */
    uint32_t   max_len;     /* 32 or 128, by family       */
    uint32_t   prefix = 0;  /* parsed prefix length       */
    size_t     digits;      /* number of prefix digits    */

    memset(key, 0, sizeof(*key));

    /* CIDR notation requires an explicit prefix */
    slash = strchr(cidr, '/');
    RET(!slash, -EINVAL, "missing prefix length in \"%s\"", cidr);
    addr = string(cidr, slash - cidr);

    /* address family is whichever textual form parses */
    if (inet_pton(AF_INET, addr.c_str(), key->ip_data) == 1)
        max_len = 32;
    elif (inet_pton(AF_INET6, addr.c_str(), key->ip_data) == 1)
        max_len = 128;
    else
        RET(1, -EINVAL, "invalid address in \"%s\"", cidr);

    /* prefix length */
    digits = strlen(slash + 1);
    RET(!digits || digits > 3, -EINVAL, "invalid prefix length in \"%s\"",
        cidr);
    for (size_t i = 0; i < digits; ++i) {
        char c = slash[1 + i];
        RET(c < '0' || c > '9', -EINVAL, "invalid prefix length in \"%s\"",
            cidr);
        prefix = prefix * 10 + (c - '0');
    }
    RET(prefix > max_len, -EINVAL, "prefix length %u out of range in \"%s\"",
        prefix, cidr);

    key->prefix_len = (uint32_t) prefix;
    return 0;
}

/* rc_compile - converts protocol rules into a table value
 *  @rules : ordered protocol rules
 *  @val   : ptr to destination value (fully overwritten)
 *
 *  @return : 0 if everything went well; -EINVAL on any malformed rule
 */
int32_t
rc_compile(const vector<protocol_rule> &rules, struct rules_val *val)
{
    int32_t ans = 0;    /* answer */

    RET(rules.size() > MAX_RULES_PER_TARGET, -EINVAL,
        "%zu rules exceed the capacity of %d per source range",
        rules.size(), MAX_RULES_PER_TARGET);

    memset(val, 0, sizeof(*val));
    val->num_rules = rules.size();

    for (size_t idx = 0; idx < rules.size(); ++idx) {
        const protocol_rule &rule  = rules[idx];
        struct rule_entry   *entry = &val->rules[idx];

        entry->rule_id = rule.order;

        switch (rule.protocol) {
            case POL_TCP:
                ans = _fill_ports(entry, rule);
                entry->protocol = IPPROTO_TCP;
                break;
            case POL_UDP:
                ans = _fill_ports(entry, rule);
                entry->protocol = IPPROTO_UDP;
                break;
            case POL_SCTP:
                ans = _fill_ports(entry, rule);
                entry->protocol = IPPROTO_SCTP;
                break;
            case POL_ICMP:
                ans = _fill_icmp(entry, rule);
                entry->protocol = IPPROTO_ICMP;
                break;
            case POL_ICMPV6:
                ans = _fill_icmp(entry, rule);
                entry->protocol = IPPROTO_ICMPV6;
                break;
            default:
                RET(1, -EINVAL, "rule %u: invalid protocol %u", rule.order,
                    (uint32_t) rule.protocol);
        }
        RET(ans, ans, "rule %u: unable to compile", rule.order);

        switch (rule.action) {
            case POL_ALLOW:
                entry->action = XDP_ACT_ALLOW;
                break;
            case POL_DENY:
                entry->action = XDP_ACT_DENY;
                break;
            default:
                RET(1, -EINVAL, "rule %u: invalid action %u", rule.order,
                    (uint32_t) rule.action);
        }
    }

    return 0;
}

/* rc_apply - reconciles one policy against the rule table
 *  @store     : rule table
 *  @policy    : source ranges and their shared protocol rules
 *  @is_delete : remove the listed ranges instead of upserting them
 *
 *  @return : 0 if everything went well; -EINVAL on malformed policy (table
 *            untouched); -errno if the table rejected an operation
 *
 * Every rule and range is validated before the first table operation. A
 * table failure aborts the call; ranges processed before it stay applied.
 */
int32_t
rc_apply(lpm_store &store, const struct policy_rule_set &policy,
         bool is_delete)
{
    struct rules_val      val;      /* compiled rule list */
    vector<struct lpm_key> keys;    /* one per range      */
    int32_t               ans;      /* answer             */

    ans = rc_compile(policy.rules, &val);
    RET(ans, ans, "failed to compile firewall rules");

    keys.resize(policy.source_cidrs.size());
    for (size_t i = 0; i < policy.source_cidrs.size(); ++i) {
        ans = rc_parse_cidr(policy.source_cidrs[i].c_str(), &keys[i]);
        RET(ans, ans, "failed to parse source CIDR \"%s\"",
            policy.source_cidrs[i].c_str());
    }

    for (size_t i = 0; i < keys.size(); ++i) {
        const char *cidr = policy.source_cidrs[i].c_str();

        if (is_delete) {
            INFO("deleting ingress firewall rules for %s", cidr);
            ans = store.remove(keys[i]);
            RET(ans, ans, "failed deleting ingress firewall rules for %s",
                cidr);
        } else {
            INFO("creating ingress firewall rules for %s (%u rules)", cidr,
                 val.num_rules);
            ans = store.upsert(keys[i], val);
            RET(ans, ans, "failed adding/updating ingress firewall rules "
                "for %s", cidr);
        }
    }

    return 0;
}
