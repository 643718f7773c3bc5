#pragma once

#include <stdint.h>     /* [u]int*_t */
#include <stddef.h>     /* size_t    */

/* layout shared with the compiled XDP program; every value here is dictated *
 * by the kernel side and must not change independently of it               */

#define MAX_RULES_PER_TARGET 100    /* rule entries per LPM value */

/* actions as stored in a rule entry (XDP return codes) */
enum {
    XDP_ACT_DENY  = 1,              /* XDP_DROP */
    XDP_ACT_ALLOW = 2,              /* XDP_PASS */
};

/* LPM key: prefixLen (u32) | ip_data[16] */
#define KEY_OFF_PREFIX_LEN  0
#define KEY_OFF_IP_DATA     4
#define KEY_IP_DATA_SZ      16
#define KEY_SZ              20

/* rule entry: ruleId (u32) | protocol (u8) | pad | dstPortStart (u16) |  *
 *             dstPortEnd (u16) | icmpType (u8) | icmpCode (u8) |         *
 *             action (u8) | pad[3]                                       */
#define RULE_OFF_RULE_ID    0
#define RULE_OFF_PROTOCOL   4
#define RULE_OFF_PORT_START 6
#define RULE_OFF_PORT_END   8
#define RULE_OFF_ICMP_TYPE  10
#define RULE_OFF_ICMP_CODE  11
#define RULE_OFF_ACTION     12
#define RULE_SZ             16

/* LPM value: numRules (u32) | rules[MAX_RULES_PER_TARGET] */
#define VAL_OFF_NUM_RULES   0
#define VAL_OFF_RULES       4
#define VAL_SZ              (VAL_OFF_RULES + MAX_RULES_PER_TARGET * RULE_SZ)

/* event header: ifId (u16) | ruleId (u16) | action (u8) | fill (u8) | *
 *               pktLength (u16) -- followed by pktLength raw bytes     */
#define EVT_OFF_IF_ID       0
#define EVT_OFF_RULE_ID     2
#define EVT_OFF_ACTION      4
#define EVT_OFF_PKT_LENGTH  6
#define EVT_HDR_SZ          8

static_assert(KEY_OFF_IP_DATA + KEY_IP_DATA_SZ == KEY_SZ);
static_assert(RULE_OFF_ACTION < RULE_SZ && RULE_SZ % 4 == 0);
static_assert(VAL_SZ == 1604);
static_assert(EVT_OFF_PKT_LENGTH + 2 == EVT_HDR_SZ);

/* host-side views of the above; layout of these is NOT the ABI */
struct lpm_key {
    uint32_t prefix_len;                /* significant bits of ip_data */
    uint8_t  ip_data[KEY_IP_DATA_SZ];   /* v4 uses the first 4 bytes   */
};

struct rule_entry {
    uint32_t rule_id;
    uint8_t  protocol;          /* IPPROTO_* */
    uint16_t dst_port_start;
    uint16_t dst_port_end;      /* 0 if single port */
    uint8_t  icmp_type;
    uint8_t  icmp_code;
    uint8_t  action;            /* XDP_ACT_* */
};

struct rules_val {
    uint32_t          num_rules;
    struct rule_entry rules[MAX_RULES_PER_TARGET];
};

struct event_hdr {
    uint16_t if_id;
    uint16_t rule_id;
    uint8_t  action;
    uint16_t pkt_length;
};

void    abi_encode_key(const struct lpm_key *key, uint8_t *buf);
void    abi_decode_key(const uint8_t *buf, struct lpm_key *key);
void    abi_encode_val(const struct rules_val *val, uint8_t *buf);
int32_t abi_decode_val(const uint8_t *buf, struct rules_val *val);
int32_t abi_decode_event_hdr(const uint8_t *buf, size_t len,
                             struct event_hdr *hdr);
