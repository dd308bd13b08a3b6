#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "scheduler.hpp"              // -Isrc
#include "fake_serial_device.hpp"     // -Isim
#include "io/scenario_frame_source.hpp"
#include "demo_scenarios.hpp"

static std::atomic<bool> g_quit{false};

static void on_sigint(int) { g_quit.store(true); }

// usage: padlink_headless_demo [target=MOCK|SIM|/dev/ttyUSB0] [rate_hz=200] [seconds=5]
int main(int argc, char** argv) {
  const std::string target = (argc > 1) ? argv[1] : "MOCK";
  const double rate_hz = (argc > 2) ? std::atof(argv[2]) : 200.0;
  const double seconds = (argc > 3) ? std::atof(argv[3]) : 5.0;

  PipelineConfig cfg{
    .rate_hz = rate_hz,
    .fallback = FallbackPolicy::HOLD_LAST_GOOD,
    .transport = TransportConfig{ .target = target, .expect_ack = true },
    .observe_capacity = 32,
  };

  // SIM: 시뮬레이터 장치 (지연/지터/드롭 있는 ACK)
  SerialPortFactory factory;
  std::shared_ptr<FakeSerialDevice> sim;
  if (target == "SIM") {
    sim = std::make_shared<FakeSerialDevice>(FakeSerialDevice::Config{
      .delay_us  = 500,
      .jitter_us = 1500,
      .drop_rate = 0.01,
      .reply     = FakeSerialDevice::Reply::ACK
    });
    factory = fake_port_factory(sim);
  }

  Scheduler sched(cfg, factory);

  CircleDemo demo{.rate_hz = rate_hz};
  sched.add_source(std::make_shared<ScenarioFrameSource<CircleDemo>>(demo, true));

  std::signal(SIGINT, on_sigint);

  const ErrorCode err = sched.start();
  if (err != ErrorCode::NONE) {
    std::cerr << "start failed: " << error_to_string(err) << " (target=" << target << ")\n";
    return 1;
  }

  std::cout << "==== padlink headless demo ====\n"
            << "target=" << target << " rate=" << rate_hz << "Hz"
            << " fallback=" << fallback_to_string(cfg.fallback) << "\n\n";

  // 모니터: 별도 스레드에서 관찰 채널을 10Hz 로 읽음
  FrameObserver obs = sched.output().attach();

  const auto until = std::chrono::steady_clock::now() +
                     std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                       std::chrono::duration<double>(seconds));

  while (!g_quit.load() && std::chrono::steady_clock::now() < until) {
    Frame last;
    bool any = false;
    while (obs.poll(last)) any = true;

    const SchedulerStats st = sched.stats();
    std::cout << "tick=" << st.ticks
              << " sent=" << st.sends_ok
              << " write_err=" << st.write_errors
              << " ack=" << st.acks
              << " nak=" << st.naks
              << " bad=" << st.malformed_responses
              << " late=" << st.overruns
              << " max_late_us=" << st.overrun_max_us;
    if (any) {
      std::cout << " | lx=" << last.axis(LEFT_X)
                << " ly=" << last.axis(LEFT_Y)
                << " rt=" << last.axis(RIGHT_TRIGGER)
                << " A=" << last.button(BTN_A)
                << " dpad=(" << last.dpad().x << "," << last.dpad().y << ")";
    }
    std::cout << "\n";

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  sched.stop();

  const SchedulerStats st = sched.stats();
  std::cout << "\nstopped: ticks=" << st.ticks
            << " dropped_by_monitor=" << obs.dropped()
            << " persistent_overrun=" << st.persistent_overrun
            << " last_error=" << error_to_string(st.last_error) << "\n";
  if (sim) {
    std::cout << "sim device: packets=" << sim->packet_count()
              << " valid=" << sim->valid_packet_count() << "\n";
  }
  return 0;
}
