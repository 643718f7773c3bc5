#pragma once

#include <stdint.h>     /* [u]int*_t */
#include <vector>       /* vector    */

#include "bpf_abi.h"
#include "lpm_map.h"
#include "policy.h"

int32_t rc_parse_ports(const char *ports, uint16_t *start, uint16_t *end);
int32_t rc_parse_cidr(const char *cidr, struct lpm_key *key);
int32_t rc_compile(const std::vector<protocol_rule> &rules,
                   struct rules_val *val);
int32_t rc_apply(lpm_store &store, const struct policy_rule_set &policy,
                 bool is_delete);
