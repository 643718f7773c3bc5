#pragma once

#include <stdint.h>         /* [u]int*_t    */
#include <liburing.h>       /* io_uring     */
#include <linux/types.h>    /* __u32, __u64 */
#include <vector>           /* vector       */
#include <deque>            /* deque        */
#include <atomic>           /* atomic       */

struct perf_buffer;

/* record_source::read() outcomes (besides -errno) */
enum {
    RD_OK     = 0,      /* record delivered                  */
    RD_CLOSED = 1,      /* source was closed; no more records */
};

/* one unit delivered by the event channel; either a raw sample or a *
 * lost-sample notification (lost > 0, raw empty)                    */
struct evt_record {
    std::vector<uint8_t> raw;
    uint64_t             lost;
    int32_t              cpu;
};

/* blocking event channel reader
 *
 * read  : blocks until a record is available; RD_CLOSED once closed
 * close : wakes a blocked read(); safe from any thread, only first call acts
 */
class record_source {
public:
    virtual ~record_source() = default;

    virtual int32_t read(struct evt_record *rec) = 0;
    virtual int32_t close() = 0;
};

/* per-CPU perf buffers behind a perf event array map */
class perf_reader : public record_source {
public:
    perf_reader();
    ~perf_reader() override;

    perf_reader(const perf_reader &) = delete;
    perf_reader &operator=(const perf_reader &) = delete;

    int32_t open(int32_t map_fd, uint32_t pages);
    int32_t read(struct evt_record *rec) override;
    int32_t close() override;

private:
    static void _on_sample(void *ctx, int cpu, void *data, __u32 size);
    static void _on_lost(void *ctx, int cpu, __u64 cnt);

    struct perf_buffer            *pb;          /* libbpf perf buffer     */
    struct io_uring               ring;         /* poll request ring      */
    bool                          ring_ok;      /* ring initialized       */
    bool                          pb_polled;    /* poll request in flight */
    int32_t                       close_fd;     /* close notification     */
    std::atomic<bool>             closed;       /* close() was called     */
    std::deque<struct evt_record> pending;      /* consumed, not read     */
};
