#pragma once

#include <stdint.h>         /* [u]int*_t    */
#include <liburing.h>       /* io_uring API */

/* request sources (for easy matching in completion queue) */
enum {
    PERF_BUFFER_POLL,   /* poll perf event buffer data availability */
    READER_CLOSE_POLL,  /* poll reader close notification (eventfd) */
};

int32_t uring_init(struct io_uring *, uint32_t, uint32_t);
void    uring_deinit(struct io_uring *);

int32_t uring_add_poll_request(struct io_uring *, uint64_t, int32_t, uint32_t);
