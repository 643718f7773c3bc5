// tests/unit/event_pipeline_test.cpp
#include <cassert>
#include <signal.h>
#include <arpa/inet.h>

#include <chrono>
#include <functional>
#include <thread>

#include "event_pipeline.h"
#include "test_helpers.h"

static int32_t fake_resolve(uint32_t if_index, std::string *if_name)
{
    if (if_index != 5)
        return -ENODEV;

    *if_name = "eth5";
    return 0;
}

// header {ifIndex 5, ruleId 1, Deny, 54} + Ethernet / IPv4 / TCP
static struct evt_record scenario_record()
{
    std::vector<uint8_t> raw = {
        5, 0, 1, 0, XDP_ACT_DENY, 0, 54, 0,
        // ethernet
        0x02, 0, 0, 0, 0, 1, 0x02, 0, 0, 0, 0, 2, 0x08, 0x00,
        // ipv4
        0x45, 0, 0, 40, 0x12, 0x34, 0x40, 0, 64, IPPROTO_TCP, 0, 0,
        192, 168, 1, 10, 10, 0, 0, 1,
        // tcp 12345 -> 80
        0x30, 0x39, 0, 80, 0, 0, 0, 0, 0, 0, 0, 0, 0x50, 0x02, 0xff, 0xff,
        0, 0, 0, 0,
    };

    return { .raw = raw, .lost = 0, .cpu = 0 };
}

static struct evp_params test_params(int32_t sig)
{
    struct evp_params params;

    params.signals    = { sig };
    params.retry_ms   = 10;
    params.timeout_ms = 50;
    params.resolve    = fake_resolve;

    return params;
}

static bool wait_for(const std::function<bool()> &cond)
{
    for (int i = 0; i < 200; ++i) {
        if (cond())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    return cond();
}

bool test_action_names()
{
    assert(evp_action_name(XDP_ACT_ALLOW) == "Allow");
    assert(evp_action_name(XDP_ACT_DENY) == "Drop");
    assert(evp_action_name(0) == "Invalid action 0");
    assert(evp_action_name(7) == "Invalid action 7");

    return true;
}

bool test_audit_lines()
{
    fake_source    src;
    capture_sink   sink;
    event_pipeline evp(src, sink, test_params(SIGUSR1));

    evp.handle_record(scenario_record());

    auto lines = sink.snapshot();
    assert(lines.size() == 3);
    assert(lines[0] == "ruleId 1 action Drop len 54 if eth5");
    assert(lines[1] == "\tipv4 src addr 192.168.1.10 dst addr 10.0.0.1");
    assert(lines[2] == "\ttcp srcPort 12345 dstPort 80");

    return true;
}

bool test_lost_samples()
{
    fake_source       src;
    capture_sink      sink;
    event_pipeline    evp(src, sink, test_params(SIGUSR1));
    struct evt_record rec = { .raw = {}, .lost = 17, .cpu = 3 };
    stdout_capture    cap;

    evp.handle_record(rec);

    std::string out = cap.stop();
    assert(count_occurrences(out, "dropped 17 samples") == 1);
    assert(count_occurrences(out, "\n") == 1);
    assert(sink.snapshot().empty());

    return true;
}

bool test_bad_records_skipped()
{
    fake_source       src;
    capture_sink      sink;
    event_pipeline    evp(src, sink, test_params(SIGUSR1));
    struct evt_record rec;

    // short header
    rec = { .raw = { 5, 0, 1 }, .lost = 0, .cpu = 0 };
    evp.handle_record(rec);

    // packet shorter than announced
    rec = scenario_record();
    rec.raw[6] = 200;
    evp.handle_record(rec);

    // unknown interface
    rec = scenario_record();
    rec.raw[0] = 9;
    evp.handle_record(rec);

    assert(sink.snapshot().empty());

    // packet bytes past pktLength are ignored
    rec = scenario_record();
    rec.raw.insert(rec.raw.end(), 6, 0xee);
    evp.handle_record(rec);
    assert(sink.snapshot().size() == 3);

    return true;
}

bool test_run_and_stop()
{
    fake_source    src;
    capture_sink   sink;
    event_pipeline evp(src, sink, test_params(SIGUSR1));

    assert(evp.state() == EVP_IDLE);
    assert(evp.start() == 0);
    assert(evp.state() == EVP_RUNNING);
    assert(evp.start() == -EALREADY);

    src.push(RD_OK, scenario_record());
    assert(wait_for([&] { return sink.snapshot().size() == 3; }));

    // read errors are logged and the loop keeps going
    src.push(-EIO);
    src.push(RD_OK, scenario_record());
    assert(wait_for([&] { return sink.snapshot().size() == 6; }));
    assert(evp.state() == EVP_RUNNING);

    assert(evp.stop() == 0);
    evp.wait();

    assert(evp.state() == EVP_STOPPED);
    assert(src.closes == 1);
    assert(src.reads == 3);

    return true;
}

bool test_external_signal()
{
    fake_source    src;
    capture_sink   sink;
    event_pipeline evp(src, sink, test_params(SIGUSR2));

    assert(evp.start() == 0);

    // process directed; only the watcher has it unblocked via sigwait
    assert(kill(getpid(), SIGUSR2) == 0);
    evp.wait();

    assert(evp.state() == EVP_STOPPED);
    assert(src.closes == 1);

    return true;
}

bool test_sink_failure()
{
    fake_source    src;
    capture_sink   sink;
    event_pipeline evp(src, sink, test_params(SIGUSR1));

    sink.connect_result = -ECONNREFUSED;

    assert(evp.start() == -ECONNREFUSED);
    assert(evp.state() == EVP_IDLE);
    assert(sink.attempts >= 2);
    assert(src.closes == 1);

    // nothing to stop or join
    assert(evp.stop() == 0);
    evp.wait();

    return true;
}

int main()
{
    bool ok = true;

    std::cout << "=== Event Pipeline Tests ===" << std::endl;

    ok &= print_test_result("Action names", test_action_names());
    ok &= print_test_result("Audit lines", test_audit_lines());
    ok &= print_test_result("Lost samples", test_lost_samples());
    ok &= print_test_result("Bad records skipped", test_bad_records_skipped());
    ok &= print_test_result("Run and stop", test_run_and_stop());
    ok &= print_test_result("External signal", test_external_signal());
    ok &= print_test_result("Sink failure", test_sink_failure());

    return ok ? 0 : 1;
}
