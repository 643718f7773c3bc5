#pragma once

#include <stdint.h>     /* [u]int*_t */
#include <stddef.h>     /* size_t    */
#include <string>       /* string    */
#include <vector>       /* vector    */

/* decoding state shared by the layer decoders */
struct pkt_ctx {
    const uint8_t *data;        /* raw frame                       */
    size_t        len;          /* frame length                    */
    size_t        l3_off;       /* network header offset           */
    uint16_t      l3_proto;     /* ethertype (host order)          */
    size_t        l4_off;       /* transport header offset         */
    uint8_t       l4_proto;     /* IPPROTO_* of transport header   */
    bool          l4_valid;     /* transport header is decodable   */
};

/* layer decoder
 *  @return : 1 if layer is present (and @line may hold its summary); 0 if not
 */
typedef int32_t (*pkt_decoder)(struct pkt_ctx *ctx, std::string *line);

std::vector<std::string> pkt_summarize(const uint8_t *pkt, size_t len);
