// tests/unit/perf_reader_test.cpp
#include <cassert>
#include <unistd.h>
#include <string.h>
#include <sched.h>
#include <bpf/bpf.h>
#include <bpf/libbpf.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "perf_reader.h"
#include "test_helpers.h"

// perf event array with one slot per possible CPU; fd or -errno
static int create_channel()
{
    struct rlimit rlim = { RLIM_INFINITY, RLIM_INFINITY };
    int           cpus = libbpf_num_possible_cpus();
    int           fd;

    setrlimit(RLIMIT_MEMLOCK, &rlim);
    if (cpus <= 0)
        return cpus < 0 ? cpus : -EINVAL;

    fd = bpf_map_create(BPF_MAP_TYPE_PERF_EVENT_ARRAY, "nodefw_events",
                        sizeof(uint32_t), sizeof(uint32_t), cpus, NULL);
    return fd < 0 ? -errno : fd;
}

// XDP program emitting the 8 byte sample 42 on the current CPU
static int load_emitter(int map_fd)
{
    return load_xdp_prog({
        make_insn(BPF_ALU64 | BPF_MOV | BPF_X, BPF_REG_6, BPF_REG_1, 0, 0),
        make_insn(BPF_ST | BPF_MEM | BPF_DW, BPF_REG_10, 0, -8, 42),
        make_insn(BPF_ALU64 | BPF_MOV | BPF_X, BPF_REG_1, BPF_REG_6, 0, 0),
        make_insn(BPF_LD | BPF_DW | BPF_IMM, BPF_REG_2, BPF_PSEUDO_MAP_FD, 0,
                  map_fd),
        make_insn(0, 0, 0, 0, 0),
        make_insn(BPF_ALU | BPF_MOV | BPF_K, BPF_REG_3, 0, 0, -1),
        make_insn(BPF_ALU64 | BPF_MOV | BPF_X, BPF_REG_4, BPF_REG_10, 0, 0),
        make_insn(BPF_ALU64 | BPF_ADD | BPF_K, BPF_REG_4, 0, 0, -8),
        make_insn(BPF_ALU64 | BPF_MOV | BPF_K, BPF_REG_5, 0, 0, 8),
        make_insn(BPF_JMP | BPF_CALL, 0, 0, 0, BPF_FUNC_perf_event_output),
        make_insn(BPF_ALU64 | BPF_MOV | BPF_K, BPF_REG_0, 0, 0, XDP_PASS),
        make_insn(BPF_JMP | BPF_EXIT, 0, 0, 0, 0),
    });
}

// runs the emitter on a dummy frame; 0 or -errno
static int emit(int prog_fd, uint32_t times)
{
    struct bpf_test_run_opts opts;
    uint8_t                  pkt[64] = {};

    memset(&opts, 0, sizeof(opts));
    opts.sz           = sizeof(opts);
    opts.data_in      = pkt;
    opts.data_size_in = sizeof(pkt);
    opts.repeat       = times;

    return bpf_prog_test_run_opts(prog_fd, &opts) ? -errno : 0;
}

// keeps every emitted sample on one CPU buffer
static void stay_on_one_cpu()
{
    cpu_set_t mask;

    assert(sched_getaffinity(0, sizeof(mask), &mask) == 0);
    for (int cpu = 0; cpu < CPU_SETSIZE; ++cpu) {
        if (CPU_ISSET(cpu, &mask)) {
            CPU_ZERO(&mask);
            CPU_SET(cpu, &mask);
            assert(sched_setaffinity(0, sizeof(mask), &mask) == 0);
            return;
        }
    }
}

static bool is_sample(const struct evt_record &rec)
{
    uint64_t val;

    if (rec.lost || rec.raw.size() < sizeof(val))
        return false;

    memcpy(&val, rec.raw.data(), sizeof(val));
    return val == 42;
}

bool test_close_wakes_blocked_read(int map_fd)
{
    perf_reader       reader;
    struct evt_record rec;
    int32_t           ans = -1;

    assert(reader.open(map_fd, 1) == 0);

    std::thread blocked([&] { ans = reader.read(&rec); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(reader.close() == 0);
    blocked.join();

    assert(ans == RD_CLOSED);

    // only the first close acts; reads stay closed
    assert(reader.close() == 0);
    assert(reader.read(&rec) == RD_CLOSED);

    return true;
}

bool test_close_before_read(int map_fd)
{
    perf_reader       reader;
    struct evt_record rec;

    assert(reader.open(map_fd, 1) == 0);
    assert(reader.close() == 0);
    assert(reader.read(&rec) == RD_CLOSED);

    return true;
}

bool test_samples_drained_before_closed(int map_fd, int prog_fd)
{
    perf_reader       reader;
    struct evt_record rec;

    assert(reader.open(map_fd, 1) == 0);
    assert(emit(prog_fd, 2) == 0);

    // both samples are consumed by the first read
    assert(reader.read(&rec) == RD_OK);
    assert(is_sample(rec));
    assert(rec.cpu >= 0);

    assert(reader.close() == 0);
    assert(reader.read(&rec) == RD_OK);
    assert(is_sample(rec));
    assert(reader.read(&rec) == RD_CLOSED);

    return true;
}

bool test_lost_samples(int map_fd, int prog_fd)
{
    perf_reader             reader;
    struct evt_record       rec;
    std::mutex              lock;
    std::condition_variable cv;
    bool                    done  = false;
    uint64_t                lost  = 0;
    size_t                  seen  = 0;
    int32_t                 ans;

    assert(reader.open(map_fd, 1) == 0);

    // overflow the single page buffer, then write again once it drained
    assert(emit(prog_fd, 1000) == 0);
    assert(reader.read(&rec) == RD_OK);
    assert(emit(prog_fd, 1) == 0);

    // closes the reader if the lost notification never shows up
    std::thread watchdog([&] {
        std::unique_lock<std::mutex> guard(lock);

        if (!cv.wait_for(guard, std::chrono::seconds(10), [&] { return done; }))
            reader.close();
    });

    while ((ans = reader.read(&rec)) == RD_OK) {
        if (rec.lost) {
            lost = rec.lost;
            assert(rec.raw.empty());
            break;
        }
        assert(is_sample(rec));
        ++seen;
    }

    {
        std::lock_guard<std::mutex> guard(lock);
        done = true;
    }
    cv.notify_all();
    watchdog.join();

    assert(lost > 0);
    assert(seen + 1 + lost >= 1000);

    return true;
}

int main()
{
    bool ok = true;
    int  map_fd;
    int  prog_fd;

    std::cout << "=== Perf Reader Tests ===" << std::endl;

    map_fd = create_channel();
    if (map_fd < 0) {
        print_test_skip("Close wakes blocked read", strerror(-map_fd));
        print_test_skip("Close before read", strerror(-map_fd));
        print_test_skip("Samples drained before closed", strerror(-map_fd));
        print_test_skip("Lost samples", strerror(-map_fd));
        return ok ? 0 : 1;
    }

    // per-CPU perf events may be refused even when maps are not
    {
        perf_reader trial;
        int32_t     ans = trial.open(map_fd, 1);

        if (ans) {
            print_test_skip("Close wakes blocked read", strerror(-ans));
            print_test_skip("Close before read", strerror(-ans));
            print_test_skip("Samples drained before closed", strerror(-ans));
            print_test_skip("Lost samples", strerror(-ans));
            close(map_fd);
            return ok ? 0 : 1;
        }
    }

    ok &= print_test_result("Close wakes blocked read",
                            test_close_wakes_blocked_read(map_fd));
    ok &= print_test_result("Close before read",
                            test_close_before_read(map_fd));

    prog_fd = load_emitter(map_fd);
    if (prog_fd < 0) {
        print_test_skip("Samples drained before closed", strerror(-prog_fd));
        print_test_skip("Lost samples", strerror(-prog_fd));
        close(map_fd);
        return ok ? 0 : 1;
    }

    stay_on_one_cpu();

    ok &= print_test_result("Samples drained before closed",
                            test_samples_drained_before_closed(map_fd, prog_fd));
    ok &= print_test_result("Lost samples", test_lost_samples(map_fd, prog_fd));

    close(prog_fd);
    close(map_fd);
    return ok ? 0 : 1;
}
