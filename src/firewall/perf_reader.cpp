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

#include <unistd.h>             /* close, write    */
#include <string.h>             /* strerror        */
#include <sys/eventfd.h>        /* eventfd         */
#include <sys/epoll.h>          /* EPOLLIN         */
#include <bpf/libbpf.h>         /* perf_buffer__*  */

#include "perf_reader.h"
#include "uring_helpers.h"
#include "util.h"

using namespace std;

/******************************************************************************
 ************************** PUBLIC API IMPLEMENTATION *************************
 ******************************************************************************/

perf_reader::perf_reader()
    : pb(NULL), ring_ok(false), pb_polled(false), close_fd(-1), closed(false)
{}

/* must not run while another thread is blocked in read() */
perf_reader::~perf_reader()
{
    if (ring_ok)
        uring_deinit(&ring);
    if (pb)
        perf_buffer__free(pb);
    if (close_fd != -1)
        ::close(close_fd);
}

/* open - sets up perf buffers & wakeup sources
 *  @map_fd : perf event array map
 *  @pages  : per-CPU buffer size in pages (power of 2)
 *
 *  @return : 0 if everything went well; -errno otherwise
 */
int32_t
perf_reader::open(int32_t map_fd, uint32_t pages)
{
    int32_t ans;    /* answer */

    /* close notification */
    close_fd = eventfd(0, EFD_CLOEXEC);
    ans = close_fd == -1 ? -errno : 0;
    RET(ans, ans, "unable to create eventfd (%s)", strerror(-ans));

    /* perf buffer; callbacks append to pending */
    pb  = perf_buffer__new(map_fd, pages, _on_sample, _on_lost, this, NULL);
    ans = libbpf_get_error(pb);
    if (ans) {
        pb = NULL;
        RET(1, ans, "failed creating perf event reader (%s)", strerror(-ans));
    }

    /* no SQ polling kthread; reads block in io_uring_wait_cqe() anyway */
    ans = uring_init(&ring, 8, 0);
    RET(ans, ans, "unable to initialize io_uring");
    ring_ok = true;

    ans = uring_add_poll_request(&ring, READER_CLOSE_POLL, close_fd, EPOLLIN);
    RET(ans < 0, ans, "unable to poll close notification (%s)",
        strerror(-ans));

    return 0;
}

/* read - blocking retrieval of the next record
 *  @rec : ptr to destination record
 *
 *  @return : RD_OK, RD_CLOSED or -errno (source remains usable)
 *
 * Must only be called from one thread.
 */
int32_t
perf_reader::read(struct evt_record *rec)
{
    struct io_uring_cqe *cqe;   /* completion queue entry */
    uint64_t            marker; /* request source         */
    int32_t             res;    /* request result         */
    int32_t             ans;    /* answer                 */

    while (pending.empty()) {
        if (closed.load())
            return RD_CLOSED;

        /* (re)arm perf buffer data availability poll */
        if (!pb_polled) {
            ans = uring_add_poll_request(&ring, PERF_BUFFER_POLL,
                                         perf_buffer__epoll_fd(pb), EPOLLIN);
            if (ans < 0)
                return ans;
            pb_polled = true;
        }

        ans = io_uring_wait_cqe(&ring, &cqe);
        if (ans == -EINTR)
            continue;
        if (ans)
            return ans;

        marker = (uint64_t) cqe->user_data;
        res    = cqe->res;
        io_uring_cqe_seen(&ring, cqe);

        /* match CQE with origin */
        switch (marker) {
            case READER_CLOSE_POLL:
                return RD_CLOSED;
            case PERF_BUFFER_POLL:
                pb_polled = false;
                if (res < 0)
                    return res;

                ans = perf_buffer__consume(pb);
                if (ans < 0)
                    return ans;

                break;
            default:
                WAR("unknown CQE source: %#lx", marker);
        }
    }

    *rec = move(pending.front());
    pending.pop_front();

    return RD_OK;
}

/* close - stops the reader
 *
 *  @return : 0 if everything went well; -errno otherwise
 *
 * Only signals the reading thread; resources are released by the destructor.
 */
int32_t
perf_reader::close()
{
    uint64_t val = 1;   /* eventfd increment */
    int32_t  ans;       /* answer            */

    if (closed.exchange(true))
        return 0;

    if (close_fd == -1)
        return 0;

    ans = write(close_fd, &val, sizeof(val)) != sizeof(val) ? -errno : 0;
    RET(ans, ans, "unable to notify perf reader (%s)", strerror(-ans));

    return 0;
}

/******************************************************************************
 ************************** INTERNAL HELPER FUNCTIONS *************************
 ******************************************************************************/

/* _on_sample - perf buffer sample callback
 *  @ctx  : perf_reader instance
 *  @cpu  : originating CPU
 *  @data : raw sample
 *  @size : sample size
 */
void
perf_reader::_on_sample(void *ctx, int cpu, void *data, __u32 size)
{
    perf_reader *self = (perf_reader *) ctx;
    uint8_t     *raw  = (uint8_t *) data;

    self->pending.push_back({
        .raw  = vector<uint8_t>(raw, raw + size),
        .lost = 0,
        .cpu  = cpu,
    });
}

/* _on_lost - perf buffer lost samples callback
 *  @ctx : perf_reader instance
 *  @cpu : originating CPU
 *  @cnt : number of samples dropped by the kernel
 */
void
perf_reader::_on_lost(void *ctx, int cpu, __u64 cnt)
{
    perf_reader *self = (perf_reader *) ctx;

    self->pending.push_back({
        .raw  = {},
        .lost = cnt,
        .cpu  = cpu,
    });
}
