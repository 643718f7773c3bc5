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

#include <stdio.h>              /* snprintf                   */
#include <string.h>             /* memcpy                     */
#include <arpa/inet.h>          /* inet_ntop, ntohs           */
#include <net/ethernet.h>       /* ether_header, ETHERTYPE_*  */
#include <netinet/in.h>         /* IPPROTO_*                  */
#include <netinet/ip.h>         /* iphdr                      */
#include <netinet/ip6.h>        /* ip6_hdr, ip6_frag          */
#include <netinet/tcp.h>        /* tcphdr                     */
#include <netinet/udp.h>        /* udphdr                     */
#include <netinet/ip_icmp.h>    /* icmphdr                    */
#include <netinet/icmp6.h>      /* icmp6_hdr                  */

#include "pkt_decode.h"

using namespace std;

#define VLAN_HDR_SZ     4       /* TCI + encapsulated ethertype */
#define VLAN_MAX_TAGS   2       /* 802.1ad outer + 802.1Q inner */
#define SCTP_HDR_SZ     12      /* SCTP common header           */
#define ICMP4_HDR_SZ    8       /* type, code, csum, rest       */
#define ICMP6_HDR_SZ    4       /* type, code, csum             */
#define IP6_EXT_MAX     8       /* extension header chain limit */

#ifndef ETHERTYPE_8021AD
#define ETHERTYPE_8021AD 0x88a8
#endif

/******************************************************************************
 ************************** INTERNAL HELPER FUNCTIONS *************************
 ******************************************************************************/

/* _avail - bytes left in frame past an offset */
static inline size_t
_avail(const struct pkt_ctx *ctx, size_t off)
{
    return off < ctx->len ? ctx->len - off : 0;
}

/* _ports_line - formats a source / destination port pair
 *  @name : protocol name
 *  @hdr  : transport header (ports are its first 4 bytes in network order)
 *
 *  @return : summary line
 */
static string
_ports_line(const char *name, const uint8_t *hdr)
{
    char     buf[64];   /* output buffer */
    uint16_t ports[2];  /* sport, dport  */

    memcpy(ports, hdr, sizeof(ports));
    snprintf(buf, sizeof(buf), "\t%s srcPort %u dstPort %u", name,
             ntohs(ports[0]), ntohs(ports[1]));

    return buf;
}

/******************************************************************************
 ****************************** LAYER DECODERS ********************************
 ******************************************************************************/

/* _dec_ethernet - ethernet framing, with up to two VLAN tags */
static int32_t
_dec_ethernet(struct pkt_ctx *ctx, string *)
{
    struct ether_header eth;    /* ethernet header */
    uint16_t            proto;  /* ethertype       */
    size_t              off;    /* current offset  */

    if (_avail(ctx, 0) < sizeof(eth))
        return 0;

    memcpy(&eth, ctx->data, sizeof(eth));
    proto = ntohs(eth.ether_type);
    off   = sizeof(eth);

    for (size_t tags = 0; tags < VLAN_MAX_TAGS; ++tags) {
        if (proto != ETHERTYPE_VLAN && proto != ETHERTYPE_8021AD)
            break;
        if (_avail(ctx, off) < VLAN_HDR_SZ)
            return 0;

        memcpy(&proto, ctx->data + off + 2, sizeof(proto));
        proto = ntohs(proto);
        off  += VLAN_HDR_SZ;
    }

    ctx->l3_proto = proto;
    ctx->l3_off   = off;
    return 1;
}

/* _dec_ipv4 - IPv4 header; transport is skipped for non-first fragments */
static int32_t
_dec_ipv4(struct pkt_ctx *ctx, string *line)
{
    struct iphdr iph;                       /* ip header            */
    char         src[INET_ADDRSTRLEN];      /* source address       */
    char         dst[INET_ADDRSTRLEN];      /* destination address  */
    char         buf[128];                  /* output buffer        */

    if (ctx->l3_proto != ETHERTYPE_IP || _avail(ctx, ctx->l3_off) < sizeof(iph))
        return 0;

    memcpy(&iph, ctx->data + ctx->l3_off, sizeof(iph));
    if (iph.version != 4 || iph.ihl < 5
        || _avail(ctx, ctx->l3_off) < iph.ihl * 4u)
        return 0;

    inet_ntop(AF_INET, &iph.saddr, src, sizeof(src));
    inet_ntop(AF_INET, &iph.daddr, dst, sizeof(dst));
    snprintf(buf, sizeof(buf), "\tipv4 src addr %s dst addr %s", src, dst);
    *line = buf;

    ctx->l4_proto = iph.protocol;
    ctx->l4_off   = ctx->l3_off + iph.ihl * 4;
    ctx->l4_valid = !(ntohs(iph.frag_off) & IP_OFFMASK);

    return 1;
}

/* _dec_ipv6 - IPv6 header followed by its extension header chain */
static int32_t
_dec_ipv6(struct pkt_ctx *ctx, string *line)
{
    struct ip6_hdr ip6h;                    /* ipv6 header          */
    char           src[INET6_ADDRSTRLEN];   /* source address       */
    char           dst[INET6_ADDRSTRLEN];   /* destination address  */
    char           buf[160];                /* output buffer        */
    uint8_t        nxt;                     /* next header          */
    size_t         off;                     /* current offset       */
    bool           valid = true;            /* transport decodable  */

    if (ctx->l3_proto != ETHERTYPE_IPV6
        || _avail(ctx, ctx->l3_off) < sizeof(ip6h))
        return 0;

    memcpy(&ip6h, ctx->data + ctx->l3_off, sizeof(ip6h));
    if ((ip6h.ip6_vfc >> 4) != 6)
        return 0;

    inet_ntop(AF_INET6, &ip6h.ip6_src, src, sizeof(src));
    inet_ntop(AF_INET6, &ip6h.ip6_dst, dst, sizeof(dst));
    snprintf(buf, sizeof(buf), "\tipv6 src addr %s dst addr %s", src, dst);
    *line = buf;

    /* walk extension headers */
    nxt = ip6h.ip6_nxt;
    off = ctx->l3_off + sizeof(ip6h);
    for (size_t i = 0; valid && i < IP6_EXT_MAX; ++i) {
        struct ip6_frag frag;   /* fragment header */
        uint8_t         ext[2]; /* next header, hdr ext len */

        if (nxt == IPPROTO_FRAGMENT) {
            if (_avail(ctx, off) < sizeof(frag)) {
                valid = false;
                break;
            }
            memcpy(&frag, ctx->data + off, sizeof(frag));
            valid = !(ntohs(frag.ip6f_offlg) & IP6F_OFF_MASK);
            nxt   = frag.ip6f_nxt;
            off  += sizeof(frag);
            continue;
        }

        if (nxt != IPPROTO_HOPOPTS && nxt != IPPROTO_ROUTING
            && nxt != IPPROTO_DSTOPTS && nxt != IPPROTO_AH)
            break;

        if (_avail(ctx, off) < sizeof(ext)) {
            valid = false;
            break;
        }
        memcpy(ext, ctx->data + off, sizeof(ext));

        /* AH length is in 4 byte units (minus 2), the rest in 8 (minus 1) */
        off += nxt == IPPROTO_AH ? (ext[1] + 2) * 4 : (ext[1] + 1) * 8;
        nxt  = ext[0];
    }

    ctx->l4_proto = nxt;
    ctx->l4_off   = off;
    ctx->l4_valid = valid;

    return 1;
}

/* _dec_tcp - TCP ports; data offset must fit in the frame */
static int32_t
_dec_tcp(struct pkt_ctx *ctx, string *line)
{
    struct tcphdr tcph;     /* tcp header */

    if (!ctx->l4_valid || ctx->l4_proto != IPPROTO_TCP
        || _avail(ctx, ctx->l4_off) < sizeof(tcph))
        return 0;

    memcpy(&tcph, ctx->data + ctx->l4_off, sizeof(tcph));
    if (tcph.doff < 5 || _avail(ctx, ctx->l4_off) < tcph.doff * 4u)
        return 0;

    *line = _ports_line("tcp", ctx->data + ctx->l4_off);
    return 1;
}

/* _dec_udp - UDP ports */
static int32_t
_dec_udp(struct pkt_ctx *ctx, string *line)
{
    if (!ctx->l4_valid || ctx->l4_proto != IPPROTO_UDP
        || _avail(ctx, ctx->l4_off) < sizeof(struct udphdr))
        return 0;

    *line = _ports_line("udp", ctx->data + ctx->l4_off);
    return 1;
}

/* _dec_sctp - SCTP ports (common header only) */
static int32_t
_dec_sctp(struct pkt_ctx *ctx, string *line)
{
    if (!ctx->l4_valid || ctx->l4_proto != IPPROTO_SCTP
        || _avail(ctx, ctx->l4_off) < SCTP_HDR_SZ)
        return 0;

    *line = _ports_line("sctp", ctx->data + ctx->l4_off);
    return 1;
}

/* _dec_icmpv4 - ICMP type & code */
static int32_t
_dec_icmpv4(struct pkt_ctx *ctx, string *line)
{
    struct icmphdr icmph;   /* icmp header   */
    char           buf[64]; /* output buffer */

    if (!ctx->l4_valid || ctx->l4_proto != IPPROTO_ICMP
        || _avail(ctx, ctx->l4_off) < ICMP4_HDR_SZ)
        return 0;

    memcpy(&icmph, ctx->data + ctx->l4_off, ICMP4_HDR_SZ);
    snprintf(buf, sizeof(buf), "\ticmpv4 type %u code %u", icmph.type,
             icmph.code);
    *line = buf;

    return 1;
}

/* _dec_icmpv6 - ICMPv6 type & code */
static int32_t
_dec_icmpv6(struct pkt_ctx *ctx, string *line)
{
    struct icmp6_hdr icmp6h;    /* icmpv6 header */
    char             buf[64];   /* output buffer */

    if (!ctx->l4_valid || ctx->l4_proto != IPPROTO_ICMPV6
        || _avail(ctx, ctx->l4_off) < ICMP6_HDR_SZ)
        return 0;

    memcpy(&icmp6h, ctx->data + ctx->l4_off, ICMP6_HDR_SZ);
    snprintf(buf, sizeof(buf), "\ticmpv6 type %u code %u", icmp6h.icmp6_type,
             icmp6h.icmp6_code);
    *line = buf;

    return 1;
}

/* decoders, in rendering order; the first one gates all others */
static pkt_decoder decoders[] = {
    _dec_ethernet,
    _dec_ipv4,
    _dec_ipv6,
    _dec_tcp,
    _dec_udp,
    _dec_sctp,
    _dec_icmpv4,
    _dec_icmpv6,
};

/******************************************************************************
 ************************** PUBLIC API IMPLEMENTATION *************************
 ******************************************************************************/

/* pkt_summarize - best effort layer by layer description of a frame
 *  @pkt : raw frame, starting with the ethernet header
 *  @len : frame length
 *
 *  @return : one line per decoded layer (ethernet contributes none); empty if
 *            the frame is not ethernet
 */
vector<string>
pkt_summarize(const uint8_t *pkt, size_t len)
{
    struct pkt_ctx ctx = {
        .data     = pkt,
        .len      = len,
        .l3_off   = 0,
        .l3_proto = 0,
        .l4_off   = 0,
        .l4_proto = 0,
        .l4_valid = false,
    };
    vector<string> lines;   /* layer summaries */

    for (size_t i = 0; i < sizeof(decoders) / sizeof(*decoders); ++i) {
        string line;

        if (!decoders[i](&ctx, &line)) {
            if (i == 0)
                break;
            continue;
        }

        if (!line.empty())
            lines.push_back(line);
    }

    return lines;
}
