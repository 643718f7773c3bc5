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

#include <string.h>             /* memset, memcpy */
#include <errno.h>              /* E*             */

#include "bpf_abi.h"
#include "util.h"

/******************************************************************************
 ************************** INTERNAL HELPER FUNCTIONS *************************
 ******************************************************************************/

/* explicit little-endian accessors; never rely on host struct layout */

static inline void
_put_u16(uint8_t *p, uint16_t v)
{
    p[0] = v & 0xff;
    p[1] = v >> 8;
}

static inline void
_put_u32(uint8_t *p, uint32_t v)
{
    p[0] = v & 0xff;
    p[1] = (v >>  8) & 0xff;
    p[2] = (v >> 16) & 0xff;
    p[3] = v >> 24;
}

static inline uint16_t
_get_u16(const uint8_t *p)
{
    return (uint16_t) (p[0] | (p[1] << 8));
}

static inline uint32_t
_get_u32(const uint8_t *p)
{
    return (uint32_t) p[0]
         | (uint32_t) p[1] <<  8
         | (uint32_t) p[2] << 16
         | (uint32_t) p[3] << 24;
}

/******************************************************************************
 ************************** PUBLIC API IMPLEMENTATION *************************
 ******************************************************************************/

/* abi_encode_key - serializes LPM key
 *  @key : host-side key
 *  @buf : destination buffer of KEY_SZ bytes
 */
void
abi_encode_key(const struct lpm_key *key, uint8_t *buf)
{
    _put_u32(&buf[KEY_OFF_PREFIX_LEN], key->prefix_len);
    memcpy(&buf[KEY_OFF_IP_DATA], key->ip_data, KEY_IP_DATA_SZ);
}

/* abi_decode_key - deserializes LPM key
 *  @buf : source buffer of KEY_SZ bytes
 *  @key : host-side key
 */
void
abi_decode_key(const uint8_t *buf, struct lpm_key *key)
{
    key->prefix_len = _get_u32(&buf[KEY_OFF_PREFIX_LEN]);
    memcpy(key->ip_data, &buf[KEY_OFF_IP_DATA], KEY_IP_DATA_SZ);
}

/* abi_encode_val - serializes rule list
 *  @val : host-side rule list
 *  @buf : destination buffer of VAL_SZ bytes
 *
 * Padding bytes and unused rule slots are zeroed.
 */
void
abi_encode_val(const struct rules_val *val, uint8_t *buf)
{
    memset(buf, 0, VAL_SZ);
    _put_u32(&buf[VAL_OFF_NUM_RULES], val->num_rules);

    for (size_t i = 0; i < MAX_RULES_PER_TARGET; ++i) {
        const struct rule_entry *r = &val->rules[i];
        uint8_t                 *p = &buf[VAL_OFF_RULES + i * RULE_SZ];

        _put_u32(&p[RULE_OFF_RULE_ID], r->rule_id);
        p[RULE_OFF_PROTOCOL] = r->protocol;
        _put_u16(&p[RULE_OFF_PORT_START], r->dst_port_start);
        _put_u16(&p[RULE_OFF_PORT_END], r->dst_port_end);
        p[RULE_OFF_ICMP_TYPE] = r->icmp_type;
        p[RULE_OFF_ICMP_CODE] = r->icmp_code;
        p[RULE_OFF_ACTION]    = r->action;
    }
}

/* abi_decode_val - deserializes rule list
 *  @buf : source buffer of VAL_SZ bytes
 *  @val : host-side rule list
 *
 *  @return : 0 if everything went well; -EINVAL if rule count exceeds capacity
 */
int32_t
abi_decode_val(const uint8_t *buf, struct rules_val *val)
{
    memset(val, 0, sizeof(*val));
    val->num_rules = _get_u32(&buf[VAL_OFF_NUM_RULES]);
    RET(val->num_rules > MAX_RULES_PER_TARGET, -EINVAL,
        "rule count %u exceeds capacity", val->num_rules);

    for (size_t i = 0; i < MAX_RULES_PER_TARGET; ++i) {
        struct rule_entry *r = &val->rules[i];
        const uint8_t     *p = &buf[VAL_OFF_RULES + i * RULE_SZ];

        r->rule_id        = _get_u32(&p[RULE_OFF_RULE_ID]);
        r->protocol       = p[RULE_OFF_PROTOCOL];
        r->dst_port_start = _get_u16(&p[RULE_OFF_PORT_START]);
        r->dst_port_end   = _get_u16(&p[RULE_OFF_PORT_END]);
        r->icmp_type      = p[RULE_OFF_ICMP_TYPE];
        r->icmp_code      = p[RULE_OFF_ICMP_CODE];
        r->action         = p[RULE_OFF_ACTION];
    }

    return 0;
}

/* abi_decode_event_hdr - extracts header from a raw event sample
 *  @buf : raw sample
 *  @len : sample length
 *  @hdr : decoded header
 *
 *  @return : 0 if everything went well; -EMSGSIZE on short sample
 *
 * Does not check that pkt_length bytes actually follow the header.
 */
int32_t
abi_decode_event_hdr(const uint8_t *buf, size_t len, struct event_hdr *hdr)
{
    if (len < EVT_HDR_SZ)
        return -EMSGSIZE;

    hdr->if_id      = _get_u16(&buf[EVT_OFF_IF_ID]);
    hdr->rule_id    = _get_u16(&buf[EVT_OFF_RULE_ID]);
    hdr->action     = buf[EVT_OFF_ACTION];
    hdr->pkt_length = _get_u16(&buf[EVT_OFF_PKT_LENGTH]);

    return 0;
}
