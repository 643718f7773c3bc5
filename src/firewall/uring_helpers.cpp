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

#include <string.h>         /* memset, strerror */

#include "uring_helpers.h"
#include "util.h"

/******************************************************************************
 ************************** PUBLIC API IMPLEMENTATION *************************
 ******************************************************************************/

/* uring_init - initialize an io_uring
 *  @ring        : ring object owned by caller
 *  @entries     : queue depth
 *  @thread_idle : timeout interval for SQ polling kthread [ms]; 0 disables it
 *
 *  @return : 0 if everything went well; -errno otherwise
 */
int32_t
uring_init(struct io_uring *ring, uint32_t entries, uint32_t thread_idle)
{
    struct io_uring_params params;      /* uring creation parameters */
    int32_t                ans;         /* answer                    */

    /* prepare io_uring arguments */
    memset(&params, 0, sizeof(params));
    if (thread_idle) {
        params.flags |= IORING_SETUP_SQPOLL;
        params.sq_thread_idle = thread_idle;
    }

    /* initialize io_uring parameters */
    ans = io_uring_queue_init_params(entries, ring, &params);
    RET(ans, ans, "unable to initialize io_uring (%s)", strerror(-ans));

    return 0;
}

/* uring_deinit - cleanup function
 *  @ring : ring previously initialized with uring_init()
 */
void
uring_deinit(struct io_uring *ring)
{
    io_uring_queue_exit(ring);
}

/* uring_add_poll_request - wrapper over poll() syscall
 *  @ring      : ring object
 *  @marker    : identifier matched in completion queue entry
 *  @fd        : file descriptor
 *  @poll_mask : poll event mask
 *
 *  @return : >0 if everything went well, -errno otherwise
 */
int32_t
uring_add_poll_request(struct io_uring *ring,
                       uint64_t        marker,
                       int32_t         fd,
                       uint32_t        poll_mask)
{
    struct io_uring_sqe *sqe;   /* submission queue entry */

    /* try to get an entry in the submission queue */
    sqe = io_uring_get_sqe(ring);
    RET(!sqe, -ENOBUFS, "unable to reserve SQE; increase ring size");

    /* prepare the poll() operation */
    io_uring_prep_poll_add(sqe, fd, poll_mask);
    io_uring_sqe_set_data(sqe, (void *) marker);
    return io_uring_submit(ring);
}
